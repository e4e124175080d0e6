/**
 * @file exposure_calculator.hpp
 * @brief Conversion of account balances into base-currency exposures
 */

#pragma once

#include "data/market_data_provider.hpp"
#include "data/portfolio.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fxhedge
{
    namespace exposure
    {

        /**
         * @struct CurrencyExposure
         * @brief Base-currency exposure to one foreign currency
         */
        struct CurrencyExposure
        {
            std::string currency;
            double absolute_exposure = 0.0; ///< |balance x rate| in base currency
            double original_amount = 0.0;   ///< Aggregated balance in the foreign currency
            double exchange_rate = 0.0;     ///< Rate used (base per unit of foreign)
            std::string account_type;       ///< Account type, or "mixed" when aggregated across types
            double relative_exposure = 0.0; ///< Share of total foreign exposure
            int rank = 0;                   ///< 1 = largest

            nlohmann::json to_json() const;
        };

        /**
         * @struct ExposureSummary
         * @brief All foreign exposures of a portfolio, largest first
         */
        struct ExposureSummary
        {
            std::string base_currency;
            std::vector<CurrencyExposure> exposures;
            double total_portfolio_value = 0.0;  ///< Foreign exposures plus base-currency balances
            double total_foreign_exposure = 0.0; ///< Denominator of relative exposure

            bool empty() const { return exposures.empty(); }

            /**
             * @brief Exposure for a currency, or nullptr
             */
            const CurrencyExposure *find(const std::string &currency) const;

            std::vector<std::string> currencies() const;

            nlohmann::json to_json() const;
        };

        /**
         * @class ExposureCalculator
         * @brief Converts a portfolio into ranked foreign-currency exposures
         *
         * Balances in the same currency are aggregated before conversion.
         * Relative exposure is absolute / total foreign exposure, so the
         * relative exposures of a non-empty summary sum to 1.
         */
        class ExposureCalculator
        {
        public:
            explicit ExposureCalculator(const data::MarketDataProvider &provider);

            /**
             * @brief Compute exposures
             * @param portfolio Portfolio snapshot
             * @return Summary with exposures ranked by absolute size
             * @throws common::DataUnavailableError if a rate cannot be resolved;
             *         no substitute rate is ever used
             */
            ExposureSummary calculate(const data::Portfolio &portfolio) const;

        private:
            const data::MarketDataProvider &provider_;
        };

    } // namespace exposure
} // namespace fxhedge
