/**
 * @file strategy_generator.hpp
 * @brief Builds strategy candidates from hedging needs and the instrument catalog
 */

#pragma once

#include "config/engine_config.hpp"
#include "hedging/hedging_types.hpp"
#include "hedging/pricing_provider.hpp"
#include "risk/correlation_analyzer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace hedging
    {

        /**
         * @class StrategyGenerator
         * @brief Emits single, combination, basket and natural-hedge candidates
         *
         * Natural-hedge pairs come from the computed correlation matrix
         * (correlation below the configured negative threshold). The fixed
         * fallback pair list is consulted only for pairs where either
         * currency has no estimated correlation.
         *
         * With a strategy profile configured, only the profile's instrument
         * families are used, starting ratios are capped at the profile's
         * default ratio, and candidates costing more than the profile's
         * fraction of exposure are dropped.
         */
        class StrategyGenerator
        {
        public:
            StrategyGenerator(const config::EngineConfig &config,
                              std::shared_ptr<const PricingProvider> pricing);

            /**
             * @brief All candidates for a set of needs
             * @param needs Hedging needs, in priority order
             * @param correlations Correlation matrix of the assessment
             */
            std::vector<StrategyCandidate> generate(const std::vector<HedgingNeed> &needs,
                                                    const risk::CorrelationMatrix &correlations) const;

            /**
             * @brief One candidate per eligible catalog instrument
             *
             * Eligible: minimum amount <= exposure and maximum tenor >= horizon.
             */
            std::vector<StrategyCandidate> single_instrument(const HedgingNeed &need) const;

            /**
             * @brief Forward/option split for large high-priority needs
             * @return std::nullopt if the need does not qualify or a leg is below its instrument minimum
             */
            std::optional<StrategyCandidate> combination(const HedgingNeed &need) const;

            /**
             * @brief Portfolio-level swap basket across all needs
             */
            std::optional<StrategyCandidate> basket(const std::vector<HedgingNeed> &needs) const;

            /**
             * @brief Natural hedges for negatively correlated need pairs
             *
             * Hedge ratio is min(exposure) / max(exposure) with zero direct cost.
             */
            std::vector<StrategyCandidate> natural_hedges(const std::vector<HedgingNeed> &needs,
                                                          const risk::CorrelationMatrix &correlations) const;

            /**
             * @brief Whether a pair is on the fallback list (either order)
             */
            bool is_fallback_pair(const std::string &a, const std::string &b) const;

            /**
             * @brief Effectiveness multiplier for market conditions
             *
             * Annual volatility above 25% scales by 0.9, below 10% by 1.1.
             * Low liquidity scales by 0.85, high by 1.05. Capped at 1.2.
             */
            static double market_condition_adjustment(double annual_volatility, config::LiquidityTier liquidity);

            /**
             * @brief Active strategy template, if a profile is configured
             */
            const std::optional<config::StrategyTemplate> &strategy_template() const { return template_; }

            std::string get_name() const { return "StrategyGenerator"; }

        private:
            InstrumentAllocation allocate(const config::InstrumentSpec &instrument,
                                          const HedgingNeed &need,
                                          double portion) const;

            double adjusted_effectiveness(double effectiveness, double annual_volatility,
                                          config::LiquidityTier liquidity) const;
            double starting_ratio(const HedgingNeed &need) const;
            bool allows(config::InstrumentType type) const;
            bool within_cost_ceiling(const StrategyCandidate &candidate) const;

            config::EngineConfig config_;
            std::shared_ptr<const PricingProvider> pricing_;
            std::optional<config::StrategyTemplate> template_;
            bool adjust_for_market_;
        };

    } // namespace hedging
} // namespace fxhedge
