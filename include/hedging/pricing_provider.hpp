/**
 * @file pricing_provider.hpp
 * @brief Instrument cost models used when building strategy candidates
 *
 * The generator and cost-benefit analyzer never price an instrument
 * themselves. They ask a PricingProvider, so the simplified option-premium
 * approximation can be replaced by a real pricing model without touching
 * the optimization logic.
 *
 * Example configuration:
 * @code{.json}
 * { "pricing_model": "option_premium" }
 * @endcode
 */

#pragma once

#include "config/engine_config.hpp"

#include <memory>
#include <string>

namespace fxhedge
{
    namespace hedging
    {

        /**
         * @struct PricingContext
         * @brief Market inputs available when pricing one leg
         */
        struct PricingContext
        {
            std::string currency;
            double annual_volatility = 0.15;
            int horizon_days = 90;
        };

        /**
         * @class PricingProvider
         * @brief Abstract instrument cost model
         *
         * Thread Safety: implementations must be safe for concurrent const calls.
         */
        class PricingProvider
        {
        public:
            virtual ~PricingProvider() = default;

            /**
             * @brief Cost of hedging a notional with an instrument
             * @param instrument Catalog entry
             * @param notional Notional in base currency
             * @param context Currency volatility and tenor
             * @return Cost in base currency
             */
            virtual double instrument_cost(const config::InstrumentSpec &instrument,
                                           double notional,
                                           const PricingContext &context) const = 0;

            virtual std::string get_name() const = 0;
        };

        /**
         * @class BasisPointPricingProvider
         * @brief cost = notional x catalog basis points / 10,000
         */
        class BasisPointPricingProvider : public PricingProvider
        {
        public:
            double instrument_cost(const config::InstrumentSpec &instrument,
                                   double notional,
                                   const PricingContext &context) const override;

            std::string get_name() const override { return "BasisPointPricingProvider"; }
        };

        /**
         * @struct OptionGreeks
         */
        struct OptionGreeks
        {
            double premium = 0.0; ///< Per unit of notional
            double delta = 0.0;
            double gamma = 0.0;
            double vega = 0.0;
            double theta = 0.0; ///< Per year
        };

        /**
         * @class OptionPremiumPricingProvider
         * @brief Black-Scholes premium for protective options, basis points otherwise
         *
         * Options are priced as a put struck 2% below a spot normalized to 1,
         * with the currency's annual volatility, time to expiry horizon / 365
         * and a flat 2% rate. This is a cost estimate only, not a valuation.
         */
        class OptionPremiumPricingProvider : public PricingProvider
        {
        public:
            explicit OptionPremiumPricingProvider(double risk_free_rate = 0.02,
                                                  double strike_moneyness = 0.98);

            double instrument_cost(const config::InstrumentSpec &instrument,
                                   double notional,
                                   const PricingContext &context) const override;

            /**
             * @brief Put premium and sensitivities
             * @param spot Spot rate
             * @param strike Strike rate
             * @param volatility Annual volatility
             * @param time_to_expiry Years
             * @throws std::invalid_argument for non-positive inputs
             */
            OptionGreeks put_greeks(double spot, double strike, double volatility, double time_to_expiry) const;

            std::string get_name() const override { return "OptionPremiumPricingProvider"; }

        private:
            double risk_free_rate_;
            double strike_moneyness_;
            BasisPointPricingProvider fallback_;
        };

        /**
         * @brief Create a provider from its configuration name
         * @param name "basis_points" or "option_premium"
         * @throws std::invalid_argument for an unknown name
         */
        std::unique_ptr<PricingProvider> create_pricing_provider(const std::string &name);

    } // namespace hedging
} // namespace fxhedge
