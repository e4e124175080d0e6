/**
 * @file risk_scorer.hpp
 * @brief Bounded risk score and rule-based recommendations
 */

#pragma once

#include "config/engine_config.hpp"
#include "risk/risk_assessment.hpp"

#include <map>
#include <vector>

namespace fxhedge
{
    namespace risk
    {

        /**
         * @class RiskScorer
         * @brief Aggregates concentration, volatility and diversification into a 0-100 score
         *
         * score = 40 x max concentration
         *       + min(40, 200 x average annual volatility)
         *       + max(0, 20 - 2 x number of currencies)
         *
         * An assessment without foreign exposure always scores 0.
         */
        class RiskScorer
        {
        public:
            explicit RiskScorer(const config::RiskConfig &config);

            double score(const exposure::ExposureSummary &exposures,
                         const ConcentrationMetrics &concentration,
                         const std::map<std::string, VolatilityProfile> &volatilities) const;

            /**
             * @brief Concentration, correlation and volatility recommendations
             */
            std::vector<RiskRecommendation> recommend(const ConcentrationMetrics &concentration,
                                                      const std::vector<RiskFactor> &risk_factors,
                                                      const std::map<std::string, VolatilityProfile> &volatilities) const;

            std::string get_name() const { return "RiskScorer"; }

        private:
            config::RiskConfig config_;
        };

    } // namespace risk
} // namespace fxhedge
