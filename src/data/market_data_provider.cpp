#include "data/market_data_provider.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fxhedge
{
    namespace data
    {

        InMemoryMarketDataProvider::InMemoryMarketDataProvider(const MarketData &history)
            : history_(history), has_history_(true)
        {
        }

        void InMemoryMarketDataProvider::set_rate(const std::string &from, const std::string &to, double rate)
        {
            if (!(rate > 0.0) || !std::isfinite(rate))
            {
                throw std::invalid_argument("Exchange rate " + from + "/" + to +
                                            " must be positive, got: " + std::to_string(rate));
            }
            rates_[{from, to}] = rate;
        }

        void InMemoryMarketDataProvider::set_history(const MarketData &history)
        {
            history_ = history;
            has_history_ = true;
        }

        void InMemoryMarketDataProvider::set_price_history(const std::string &currency,
                                                           const std::vector<double> &prices)
        {
            series_[currency] = prices;
        }

        double InMemoryMarketDataProvider::get_exchange_rate(const std::string &from, const std::string &to) const
        {
            if (from == to)
            {
                return 1.0;
            }

            auto direct = rates_.find({from, to});
            if (direct != rates_.end())
            {
                return direct->second;
            }

            auto inverse = rates_.find({to, from});
            if (inverse != rates_.end())
            {
                return 1.0 / inverse->second;
            }

            if (has_history_ && history_.base_currency() == to && history_.has_currency(from))
            {
                auto latest = history_.latest_rates(from, 1);
                if (!latest.empty() && latest.back() > 0.0)
                {
                    return latest.back();
                }
            }

            throw common::DataUnavailableError(from, "No exchange rate available for " + from + "/" + to);
        }

        std::vector<double> InMemoryMarketDataProvider::get_historical_prices(const std::string &currency,
                                                                              const std::string &base,
                                                                              int days) const
        {
            if (days <= 0)
            {
                throw std::invalid_argument("Requested history length must be positive, got: " + std::to_string(days));
            }

            auto it = series_.find(currency);
            if (it != series_.end() && !it->second.empty())
            {
                const auto &prices = it->second;
                size_t n = std::min(prices.size(), static_cast<size_t>(days));
                return std::vector<double>(prices.end() - static_cast<std::ptrdiff_t>(n), prices.end());
            }

            if (has_history_ && history_.base_currency() == base && history_.has_currency(currency))
            {
                auto prices = history_.latest_rates(currency, static_cast<size_t>(days));
                if (!prices.empty())
                {
                    return prices;
                }
            }

            throw common::DataUnavailableError(currency, "No price history available for " + currency + "/" + base);
        }

    } // namespace data
} // namespace fxhedge
