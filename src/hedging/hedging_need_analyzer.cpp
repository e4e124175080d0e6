#include "hedging/hedging_need_analyzer.hpp"

#include <algorithm>

namespace fxhedge
{
    namespace hedging
    {

        namespace
        {
            int priority_rank(Priority p)
            {
                switch (p)
                {
                case Priority::HIGH:
                    return 2;
                case Priority::MEDIUM:
                    return 1;
                case Priority::LOW:
                    return 0;
                }
                return 0;
            }
        }

        HedgingNeedAnalyzer::HedgingNeedAnalyzer(const config::HedgingConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        std::optional<HedgingNeed> HedgingNeedAnalyzer::classify(const std::string &currency,
                                                                 double exposure,
                                                                 double concentration,
                                                                 double annual_volatility) const
        {
            HedgingNeed need;
            need.currency = currency;
            need.exposure = exposure;
            need.relative_exposure = concentration;
            need.volatility = annual_volatility;

            // Exactly at the threshold counts as high priority
            if (concentration >= config_.high_concentration_threshold)
            {
                need.priority = Priority::HIGH;
                need.recommended_hedge_ratio = std::min(config_.high_ratio_cap, 2.0 * concentration);
                need.time_horizon = config_.high_priority_horizon;
                need.urgency = "immediate";
                need.reason = "concentration";
            }
            else if (annual_volatility > config_.medium_volatility_threshold)
            {
                need.priority = Priority::MEDIUM;
                need.recommended_hedge_ratio = std::min(config_.medium_ratio_cap, 2.0 * annual_volatility);
                need.time_horizon = config_.medium_priority_horizon;
                need.urgency = "within_30_days";
                need.reason = "volatility";
            }
            else if (concentration > config_.low_concentration_threshold ||
                     annual_volatility > config_.low_volatility_threshold)
            {
                need.priority = Priority::LOW;
                need.recommended_hedge_ratio =
                    std::min(config_.low_ratio_cap, 1.5 * std::max(concentration, annual_volatility));
                need.time_horizon = config_.low_priority_horizon;
                need.urgency = "monitor";
                need.reason = "combined";
            }
            else
            {
                return std::nullopt;
            }

            need.recommended_hedge_ratio = std::max(0.0, std::min(1.0, need.recommended_hedge_ratio));
            return need;
        }

        std::vector<HedgingNeed> HedgingNeedAnalyzer::analyze(const risk::RiskAssessment &assessment) const
        {
            std::vector<HedgingNeed> needs;

            for (const auto &e : assessment.exposures.exposures)
            {
                const auto *profile = assessment.volatility_of(e.currency);
                double vol = profile != nullptr ? profile->annual : 0.0;

                auto need = classify(e.currency, e.absolute_exposure, e.relative_exposure, vol);
                if (need)
                {
                    need->risk_contribution = assessment.individual_risk(e.currency);
                    needs.push_back(*need);
                }
            }

            std::stable_sort(needs.begin(), needs.end(),
                             [](const HedgingNeed &a, const HedgingNeed &b)
                             {
                                 if (a.priority != b.priority)
                                     return priority_rank(a.priority) > priority_rank(b.priority);
                                 return a.risk_contribution > b.risk_contribution;
                             });
            return needs;
        }

    } // namespace hedging
} // namespace fxhedge
