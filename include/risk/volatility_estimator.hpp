/**
 * @file volatility_estimator.hpp
 * @brief Per-currency return series and periodic volatility
 */

#pragma once

#include "config/engine_config.hpp"
#include "data/market_data_provider.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace risk
    {

        /**
         * @struct VolatilityProfile
         * @brief Volatility of one currency at several horizons
         *
         * Weekly, monthly and annual figures scale the daily sample standard
         * deviation by sqrt(7), sqrt(30) and sqrt(252).
         */
        struct VolatilityProfile
        {
            std::string currency;
            double daily = 0.0;
            double weekly = 0.0;
            double monthly = 0.0;
            double annual = 0.0;
            std::vector<double> returns;        ///< Daily returns over the lookback window, oldest first
            std::vector<double> recent_returns; ///< Trailing window kept for correlation
            bool is_fallback = false;           ///< True when the configured default volatility was substituted

            bool has_returns() const { return !returns.empty(); }

            nlohmann::json to_json() const;
        };

        /**
         * @class VolatilityEstimator
         * @brief Fetches price histories and derives volatility profiles
         *
         * A currency whose history is missing or too short gets a fallback
         * profile built from the configured default annual volatility. The
         * assessment continues with that approximation instead of aborting.
         */
        class VolatilityEstimator
        {
        public:
            VolatilityEstimator(const data::MarketDataProvider &provider,
                                const config::RiskConfig &config);

            /**
             * @brief Estimate one currency
             * @param currency Foreign currency
             * @param base Base currency the history is quoted in
             */
            VolatilityProfile estimate(const std::string &currency, const std::string &base) const;

            /**
             * @brief Estimate several currencies concurrently
             *
             * Each currency is fetched and estimated on its own std::async task;
             * the call returns once every task has finished.
             */
            std::map<std::string, VolatilityProfile> estimate_all(const std::vector<std::string> &currencies,
                                                                  const std::string &base) const;

            /**
             * @brief Build a profile from a return series
             * @param currency Currency code
             * @param returns Daily simple returns, oldest first (at least two)
             * @param retained Length of the trailing window kept for correlation
             * @throws std::invalid_argument if fewer than two returns are supplied
             */
            static VolatilityProfile from_returns(const std::string &currency,
                                                  const std::vector<double> &returns,
                                                  size_t retained);

            /**
             * @brief Profile carrying the default annual volatility
             */
            VolatilityProfile fallback_profile(const std::string &currency) const;

            std::string get_name() const { return "VolatilityEstimator"; }

        private:
            const data::MarketDataProvider &provider_;
            config::RiskConfig config_;
        };

    } // namespace risk
} // namespace fxhedge
