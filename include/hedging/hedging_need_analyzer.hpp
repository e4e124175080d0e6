/**
 * @file hedging_need_analyzer.hpp
 * @brief Classifies exposures into hedging needs
 */

#pragma once

#include "config/engine_config.hpp"
#include "hedging/hedging_types.hpp"
#include "risk/risk_assessment.hpp"

#include <optional>
#include <vector>

namespace fxhedge
{
    namespace hedging
    {

        /**
         * @class HedgingNeedAnalyzer
         * @brief Decides which exposures need hedging and how urgently
         *
         * Rules are tried in order for each exposure:
         * - concentration >= high threshold (25%): high priority,
         *   ratio min(0.8, 2 x concentration), 90 days
         * - annual volatility > medium threshold (20%): medium priority,
         *   ratio min(0.6, 2 x volatility), 180 days
         * - concentration > 15% or volatility > 15%: low priority,
         *   ratio min(0.4, 1.5 x max(concentration, volatility)), 365 days
         * - otherwise no need
         */
        class HedgingNeedAnalyzer
        {
        public:
            explicit HedgingNeedAnalyzer(const config::HedgingConfig &config);

            /**
             * @brief Needs of an assessment, high priority first, then by risk contribution
             */
            std::vector<HedgingNeed> analyze(const risk::RiskAssessment &assessment) const;

            /**
             * @brief Classify one exposure
             * @return The need, or std::nullopt when no hedge is required
             */
            std::optional<HedgingNeed> classify(const std::string &currency,
                                                double exposure,
                                                double concentration,
                                                double annual_volatility) const;

            std::string get_name() const { return "HedgingNeedAnalyzer"; }

        private:
            config::HedgingConfig config_;
        };

    } // namespace hedging
} // namespace fxhedge
