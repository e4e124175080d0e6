/**
 * @file market_data_provider.hpp
 * @brief Market-data contract consumed by the risk engine
 *
 * The engine never sources market data itself. It asks a provider for spot
 * rates and ordered price histories; a provider reports a missing value by
 * throwing DataUnavailableError and every response is treated as final.
 */

#pragma once

#include "data/market_data.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fxhedge
{
    namespace data
    {

        /**
         * @class MarketDataProvider
         * @brief Abstract source of exchange rates and price histories
         *
         * Implementations must allow concurrent calls to the const methods,
         * since per-currency volatility estimation runs in parallel.
         */
        class MarketDataProvider
        {
        public:
            virtual ~MarketDataProvider() = default;

            /**
             * @brief Spot conversion rate
             * @param from Currency of the amount being converted
             * @param to Target currency
             * @return Units of `to` per unit of `from`
             * @throws common::DataUnavailableError if no rate is known
             */
            virtual double get_exchange_rate(const std::string &from, const std::string &to) const = 0;

            /**
             * @brief Ordered historical prices of a currency quoted in a base currency
             * @param currency Currency whose history is requested
             * @param base Quote currency
             * @param days Maximum number of most recent observations
             * @return Prices, oldest first (may be shorter than requested)
             * @throws common::DataUnavailableError if no history is available
             */
            virtual std::vector<double> get_historical_prices(const std::string &currency,
                                                              const std::string &base,
                                                              int days) const = 0;

            virtual std::string get_name() const = 0;
        };

        /**
         * @class InMemoryMarketDataProvider
         * @brief Provider backed by a rate table and an FX history
         *
         * Rate lookups try the direct pair, then the reciprocal pair, then
         * the latest observation in the history when it is quoted in the
         * target currency. Same-currency conversion is always 1.
         */
        class InMemoryMarketDataProvider : public MarketDataProvider
        {
        public:
            InMemoryMarketDataProvider() = default;
            explicit InMemoryMarketDataProvider(const MarketData &history);

            void set_rate(const std::string &from, const std::string &to, double rate);

            /**
             * @brief Replace the history table
             */
            void set_history(const MarketData &history);

            /**
             * @brief Explicit price series for one currency; takes precedence over the history table
             */
            void set_price_history(const std::string &currency, const std::vector<double> &prices);

            double get_exchange_rate(const std::string &from, const std::string &to) const override;

            std::vector<double> get_historical_prices(const std::string &currency,
                                                      const std::string &base,
                                                      int days) const override;

            std::string get_name() const override { return "InMemoryMarketDataProvider"; }

            size_t num_rates() const { return rates_.size(); }

        private:
            std::map<std::pair<std::string, std::string>, double> rates_;
            std::map<std::string, std::vector<double>> series_;
            MarketData history_;
            bool has_history_ = false;
        };

    } // namespace data
} // namespace fxhedge
