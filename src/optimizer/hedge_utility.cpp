#include "optimizer/hedge_utility.hpp"

#include <algorithm>
#include <cmath>

namespace fxhedge
{
    namespace optimizer
    {

        HedgeUtility::HedgeUtility(const config::OptimizerConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        double HedgeUtility::risk_reduction(const hedging::StrategyCandidate &candidate, double hedge_ratio) const
        {
            return candidate.effectiveness * hedge_ratio;
        }

        double HedgeUtility::cost_score(const hedging::StrategyCandidate &candidate, double hedge_ratio) const
        {
            if (candidate.exposure <= 0.0)
            {
                return 1.0;
            }
            double cost_fraction = candidate.cost * hedge_ratio / candidate.exposure;
            double score = 1.0 - cost_fraction / config_.cost_normalization;
            return std::max(0.0, std::min(1.0, score));
        }

        double HedgeUtility::evaluate(const hedging::StrategyCandidate &candidate, double hedge_ratio) const
        {
            return config_.risk_weight * risk_reduction(candidate, hedge_ratio) +
                   config_.cost_weight * cost_score(candidate, hedge_ratio) +
                   config_.effectiveness_weight * candidate.effectiveness -
                   config_.moderation_penalty * std::abs(hedge_ratio - 0.5);
        }

    } // namespace optimizer
} // namespace fxhedge
