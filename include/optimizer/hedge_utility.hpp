/**
 * @file hedge_utility.hpp
 * @brief Cost/risk utility maximized by the hedge-ratio optimizer
 *
 * U(r) = w_risk x (effectiveness x r)
 *      + w_cost x clamp(1 - direct_cost(r) / (exposure x cost_normalization), 0, 1)
 *      + w_eff  x effectiveness
 *      - moderation_penalty x |r - 0.5|
 */

#pragma once

#include "config/engine_config.hpp"
#include "hedging/hedging_types.hpp"

#include <string>

namespace fxhedge
{
    namespace optimizer
    {

        /**
         * @class HedgeUtility
         * @brief Stateless utility function over (candidate, hedge ratio)
         *
         * The same object scores a ratio during optimization and again during
         * ranking, so both see identical values for identical inputs.
         */
        class HedgeUtility
        {
        public:
            explicit HedgeUtility(const config::OptimizerConfig &config);

            double evaluate(const hedging::StrategyCandidate &candidate, double hedge_ratio) const;

            /**
             * @brief Fraction of risk removed at a ratio (effectiveness x ratio)
             */
            double risk_reduction(const hedging::StrategyCandidate &candidate, double hedge_ratio) const;

            /**
             * @brief Normalized cost score in [0, 1]; 1 means free
             */
            double cost_score(const hedging::StrategyCandidate &candidate, double hedge_ratio) const;

            std::string get_name() const { return "HedgeUtility"; }

        private:
            config::OptimizerConfig config_;
        };

    } // namespace optimizer
} // namespace fxhedge
