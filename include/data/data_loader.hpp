/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads the engine configuration, portfolio snapshots and rate tables from
 * JSON files, and FX histories from wide-format CSV files. Also generates
 * seeded synthetic FX histories for demos and tests.
 */

#ifndef FXHEDGE_DATA_LOADER_HPP
#define FXHEDGE_DATA_LOADER_HPP

#include "config/engine_config.hpp"
#include "data/market_data.hpp"
#include "data/market_data_provider.hpp"
#include "data/portfolio.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fxhedge {
namespace data {

/**
 * @struct SyntheticFxSpec
 * @brief Parameters of one simulated exchange-rate path
 *
 * Daily returns are drawn as vol * (beta * m + sqrt(1 - beta^2) * e) with a
 * shared market factor m and an idiosyncratic shock e, so currencies with
 * betas of opposite sign come out negatively correlated.
 */
struct SyntheticFxSpec {
    std::string currency;
    double initial_rate = 1.0;         ///< Units of base currency per unit
    double annual_volatility = 0.10;   ///< Annualized volatility
    double market_beta = 0.0;          ///< Loading on the shared factor, in [-1, 1]
};

/**
 * @class DataLoader
 * @brief Loads engine inputs from files
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading
    // ========================================================================

    /**
     * @brief Load an FX history from CSV (wide format)
     *
     * Expected format:
     * date,EUR,GBP,JPY,...
     * 2024-01-02,1.0950,1.2710,0.0070,...
     *
     * @param filepath Path to CSV file
     * @param base_currency Currency the rates are quoted in
     * @param currencies Optional subset of currencies to load (all if empty)
     * @return MarketData object
     * @throws std::runtime_error if the file cannot be read or holds no rows
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::string& base_currency = "USD",
                                    const std::vector<std::string>& currencies = {});

    // ========================================================================
    // JSON Loading
    // ========================================================================

    /**
     * @brief Load a JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load and validate the engine configuration
     * @throws std::invalid_argument if the configuration is inconsistent
     */
    static config::EngineConfig load_config(const std::string& config_path);

    /**
     * @brief Load a portfolio snapshot
     */
    static Portfolio load_portfolio(const std::string& filepath);

    /**
     * @brief Load a spot-rate table into a provider
     *
     * Expected format:
     * { "base_currency": "USD", "rates": { "EUR": 1.08, "GBP": 1.27 } }
     *
     * Each entry is stored as the rate from that currency to the base.
     *
     * @return Number of rates loaded
     */
    static size_t load_rates(const std::string& filepath, InMemoryMarketDataProvider& provider);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate a synthetic FX history
     * @param specs One entry per currency
     * @param num_days Number of daily observations
     * @param start_date First date (YYYY-MM-DD)
     * @param base_currency Quote currency
     * @param seed Fixed seed for reproducible output
     */
    static MarketData generate_synthetic_fx_history(
        const std::vector<SyntheticFxSpec>& specs,
        size_t num_days,
        const std::string& start_date = "2024-01-01",
        const std::string& base_currency = "USD",
        std::optional<std::uint64_t> seed = std::nullopt
    );

    /**
     * @brief Default major-currency set used by the CLI and generator tool
     */
    static std::vector<SyntheticFxSpec> default_synthetic_specs();

    // ========================================================================
    // Export Methods
    // ========================================================================

    static void save_csv_wide(const MarketData& data, const std::string& filepath);

    static void save_json(const nlohmann::json& j, const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double
     * @return Parsed value, or NaN for empty / unparseable input
     */
    static double safe_stod(const std::string& str);
};

} // namespace data
} // namespace fxhedge

#endif // FXHEDGE_DATA_LOADER_HPP
