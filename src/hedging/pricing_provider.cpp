#include "hedging/pricing_provider.hpp"

#include "common/statistics.hpp"

#include <cmath>
#include <stdexcept>

namespace fxhedge
{
    namespace hedging
    {

        double BasisPointPricingProvider::instrument_cost(const config::InstrumentSpec &instrument,
                                                          double notional,
                                                          const PricingContext &) const
        {
            return std::abs(notional) * instrument.cost_bps / 10000.0;
        }

        OptionPremiumPricingProvider::OptionPremiumPricingProvider(double risk_free_rate, double strike_moneyness)
            : risk_free_rate_(risk_free_rate), strike_moneyness_(strike_moneyness)
        {
            if (strike_moneyness <= 0.0)
            {
                throw std::invalid_argument("strike_moneyness must be positive, got: " + std::to_string(strike_moneyness));
            }
        }

        OptionGreeks OptionPremiumPricingProvider::put_greeks(double spot, double strike,
                                                              double volatility, double time_to_expiry) const
        {
            if (spot <= 0.0 || strike <= 0.0 || volatility <= 0.0 || time_to_expiry <= 0.0)
            {
                throw std::invalid_argument("Option inputs must be positive");
            }

            const double sqrt_t = std::sqrt(time_to_expiry);
            const double d1 = (std::log(spot / strike) +
                               (risk_free_rate_ + 0.5 * volatility * volatility) * time_to_expiry) /
                              (volatility * sqrt_t);
            const double d2 = d1 - volatility * sqrt_t;
            const double discount = std::exp(-risk_free_rate_ * time_to_expiry);
            const double pdf_d1 = common::normal_pdf(d1);

            OptionGreeks g;
            g.premium = strike * discount * common::normal_cdf(-d2) - spot * common::normal_cdf(-d1);
            g.delta = common::normal_cdf(d1) - 1.0;
            g.gamma = pdf_d1 / (spot * volatility * sqrt_t);
            g.vega = spot * pdf_d1 * sqrt_t;
            g.theta = -spot * pdf_d1 * volatility / (2.0 * sqrt_t) +
                      risk_free_rate_ * strike * discount * common::normal_cdf(-d2);
            return g;
        }

        double OptionPremiumPricingProvider::instrument_cost(const config::InstrumentSpec &instrument,
                                                             double notional,
                                                             const PricingContext &context) const
        {
            if (instrument.type != config::InstrumentType::OPTION)
            {
                return fallback_.instrument_cost(instrument, notional, context);
            }

            double volatility = context.annual_volatility > 0.0 ? context.annual_volatility : 0.15;
            int horizon = context.horizon_days > 0 ? context.horizon_days : 90;

            auto greeks = put_greeks(1.0, strike_moneyness_, volatility, horizon / 365.0);
            return std::abs(notional) * greeks.premium;
        }

        std::unique_ptr<PricingProvider> create_pricing_provider(const std::string &name)
        {
            if (name == "basis_points" || name == "bps")
            {
                return std::make_unique<BasisPointPricingProvider>();
            }
            if (name == "option_premium" || name == "black_scholes")
            {
                return std::make_unique<OptionPremiumPricingProvider>();
            }
            throw std::invalid_argument("Unknown pricing model: " + name);
        }

    } // namespace hedging
} // namespace fxhedge
