/**
 * @file generate_fx_history.cpp
 * @brief Generate a synthetic FX history CSV for the hedge optimizer
 */

#include "common/statistics.hpp"
#include "common/time_utils.hpp"
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>

using namespace fxhedge;

int main(int argc, char* argv[]) {
    std::cout << "\n=== FX History Generator ===\n" << std::endl;

    std::string output_file = "data/market/fx_history.csv";
    std::string base_currency = "USD";
    std::string start_date = "2024-01-01";
    size_t num_days = 253;
    std::optional<std::uint64_t> seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--start" && i + 1 < argc) {
                start_date = argv[++i];
            } else if (arg == "--base" && i + 1 < argc) {
                base_currency = argv[++i];
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--random") {
                seed.reset();
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/fx_history.csv)\n"
                          << "  --days N           Number of daily observations (default: 253)\n"
                          << "  --start DATE       First date, YYYY-MM-DD (default: 2024-01-01)\n"
                          << "  --base CCY         Quote currency (default: USD)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --random           Draw a fresh seed\n"
                          << "  --help             Show this help\n";
                return 0;
            } else {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        if (!common::is_valid_date_format(start_date)) {
            throw std::invalid_argument("Start date must be YYYY-MM-DD, got: " + start_date);
        }

        auto specs = data::DataLoader::default_synthetic_specs();
        std::cout << "Generating " << num_days << " days for " << specs.size()
                  << " currencies quoted in " << base_currency << "..." << std::endl;

        auto history = data::DataLoader::generate_synthetic_fx_history(
            specs, num_days, start_date, base_currency, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        data::DataLoader::save_csv_wide(history, output_file);

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << history.num_dates() << " ("
                  << history.get_dates().front() << " to "
                  << history.get_dates().back() << ")\n";

        std::cout << "\nCurrency Statistics (Annualized):\n";
        std::cout << std::string(48, '-') << "\n";
        std::cout << std::setw(8) << "CCY"
                  << std::setw(14) << "Last Rate"
                  << std::setw(14) << "Target Vol"
                  << std::setw(12) << "Realized\n";
        std::cout << std::string(48, '-') << "\n";

        for (const auto& spec : specs) {
            auto returns = history.calculate_returns(spec.currency);
            double realized = common::sample_stddev(returns) * std::sqrt(252.0);
            std::cout << std::setw(8) << spec.currency
                      << std::setw(14) << std::fixed << std::setprecision(4)
                      << history.latest_rate(spec.currency)
                      << std::setw(13) << std::setprecision(2) << spec.annual_volatility * 100 << "%"
                      << std::setw(11) << realized * 100 << "%\n";
        }
        std::cout << std::string(48, '-') << "\n";

        std::cout << "\nData generation complete.\n" << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/fx_hedge_optimizer --portfolio data/portfolio/sample_portfolio.json"
                  << " --prices " << output_file << " --seed 42\n";
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
