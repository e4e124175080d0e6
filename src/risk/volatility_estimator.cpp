#include "risk/volatility_estimator.hpp"

#include "common/errors.hpp"
#include "common/statistics.hpp"
#include "data/market_data.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>

namespace fxhedge
{
    namespace risk
    {

        namespace
        {
            const double TRADING_DAYS = 252.0;
            const double DAYS_PER_WEEK = 7.0;
            const double DAYS_PER_MONTH = 30.0;
        }

        nlohmann::json VolatilityProfile::to_json() const
        {
            return {
                {"currency", currency},
                {"daily", daily},
                {"weekly", weekly},
                {"monthly", monthly},
                {"annual", annual},
                {"observations", returns.size()},
                {"recent_returns", recent_returns},
                {"is_fallback", is_fallback}};
        }

        VolatilityEstimator::VolatilityEstimator(const data::MarketDataProvider &provider,
                                                 const config::RiskConfig &config)
            : provider_(provider), config_(config)
        {
            config_.validate();
        }

        VolatilityProfile VolatilityEstimator::from_returns(const std::string &currency,
                                                            const std::vector<double> &returns,
                                                            size_t retained)
        {
            if (returns.size() < 2)
            {
                throw std::invalid_argument("Need at least 2 returns to estimate volatility for " + currency +
                                            ", got: " + std::to_string(returns.size()));
            }

            VolatilityProfile profile;
            profile.currency = currency;
            profile.daily = common::sample_stddev(returns);
            profile.weekly = profile.daily * std::sqrt(DAYS_PER_WEEK);
            profile.monthly = profile.daily * std::sqrt(DAYS_PER_MONTH);
            profile.annual = profile.daily * std::sqrt(TRADING_DAYS);
            profile.returns = returns;

            size_t keep = std::min(retained, returns.size());
            profile.recent_returns.assign(returns.end() - static_cast<std::ptrdiff_t>(keep), returns.end());
            return profile;
        }

        VolatilityProfile VolatilityEstimator::fallback_profile(const std::string &currency) const
        {
            VolatilityProfile profile;
            profile.currency = currency;
            profile.annual = config_.default_annual_volatility;
            profile.daily = profile.annual / std::sqrt(TRADING_DAYS);
            profile.weekly = profile.daily * std::sqrt(DAYS_PER_WEEK);
            profile.monthly = profile.daily * std::sqrt(DAYS_PER_MONTH);
            profile.is_fallback = true;
            return profile;
        }

        VolatilityProfile VolatilityEstimator::estimate(const std::string &currency, const std::string &base) const
        {
            std::vector<double> prices;
            try
            {
                prices = provider_.get_historical_prices(currency, base, config_.active_lookback());
            }
            catch (const common::DataUnavailableError &e)
            {
                std::cerr << "Warning: " << e.what() << "; using default annual volatility of "
                          << config_.default_annual_volatility << " for " << currency << std::endl;
                return fallback_profile(currency);
            }

            auto returns = data::simple_returns(prices);
            if (returns.size() < 2)
            {
                std::cerr << "Warning: insufficient price history for " << currency << " (" << prices.size()
                          << " prices); using default annual volatility of "
                          << config_.default_annual_volatility << std::endl;
                return fallback_profile(currency);
            }

            return from_returns(currency, returns, static_cast<size_t>(config_.retained_returns));
        }

        std::map<std::string, VolatilityProfile> VolatilityEstimator::estimate_all(
            const std::vector<std::string> &currencies,
            const std::string &base) const
        {
            std::vector<std::future<VolatilityProfile>> tasks;
            tasks.reserve(currencies.size());

            for (const auto &currency : currencies)
            {
                tasks.push_back(std::async(std::launch::async, [this, currency, base]()
                                           { return estimate(currency, base); }));
            }

            std::map<std::string, VolatilityProfile> profiles;
            for (size_t i = 0; i < tasks.size(); ++i)
            {
                profiles[currencies[i]] = tasks[i].get();
            }
            return profiles;
        }

    } // namespace risk
} // namespace fxhedge
