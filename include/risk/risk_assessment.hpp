/**
 * @file risk_assessment.hpp
 * @brief Result records produced by the currency risk engine
 */

#pragma once

#include "exposure/exposure_calculator.hpp"
#include "risk/correlation_analyzer.hpp"
#include "risk/volatility_estimator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace risk
    {

        /**
         * @struct VaREstimate
         * @brief Value-at-Risk by every method at one confidence level
         *
         * All figures are positive losses in base currency over one day.
         */
        struct VaREstimate
        {
            double confidence = 0.0;
            double historical = 0.0;
            double parametric = 0.0;
            double monte_carlo = 0.0;
            double expected_shortfall = 0.0; ///< Mean |return| over the Monte Carlo tail
            std::map<std::string, double> historical_by_currency;

            nlohmann::json to_json() const;
        };

        /**
         * @struct MonteCarloSummary
         * @brief Distribution statistics of the simulated portfolio returns
         */
        struct MonteCarloSummary
        {
            int trials = 0;
            int batches = 0;
            double mean = 0.0;
            double std_dev = 0.0;
            bool correlated_draws = false;
            std::optional<std::uint64_t> seed;

            nlohmann::json to_json() const;
        };

        /**
         * @struct ConcentrationAdvice
         * @brief Suggested reduction for one over-concentrated currency
         */
        struct ConcentrationAdvice
        {
            std::string currency;
            double current_concentration = 0.0;
            double recommended_max = 0.0;
            std::string action;

            nlohmann::json to_json() const;
        };

        /**
         * @struct ConcentrationMetrics
         */
        struct ConcentrationMetrics
        {
            double herfindahl_index = 0.0;
            double max_concentration = 0.0;
            std::string max_currency;
            double top3_concentration = 0.0;
            std::vector<std::string> flagged_currencies; ///< Relative exposure above the threshold
            std::string risk_level = "low";              ///< low, medium or high
            std::vector<ConcentrationAdvice> advice;

            nlohmann::json to_json() const;
        };

        enum class RiskFactorType
        {
            INDIVIDUAL,
            CORRELATION
        };

        std::string to_string(RiskFactorType type);

        /**
         * @struct RiskFactor
         * @brief One term of the risk decomposition
         */
        struct RiskFactor
        {
            RiskFactorType type = RiskFactorType::INDIVIDUAL;
            std::vector<std::string> currencies; ///< One currency, or the pair
            double contribution = 0.0;           ///< Signed contribution in base currency
            double relative_contribution = 0.0;  ///< |contribution| / sum of |contributions|
            double correlation = 1.0;            ///< Pair correlation (1 for individual factors)
            bool is_high_correlation = false;

            std::string label() const;
            nlohmann::json to_json() const;
        };

        /**
         * @struct StressTestResult
         */
        struct StressTestResult
        {
            std::string scenario;
            double total_loss = 0.0;
            double loss_fraction = 0.0; ///< total_loss / total foreign exposure
            std::string severity;       ///< low, medium, high or severe
            std::map<std::string, double> currency_losses;

            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskRecommendation
         */
        struct RiskRecommendation
        {
            std::string type; ///< concentration, correlation or volatility
            std::string priority;
            std::string title;
            std::string description;
            std::string action;
            std::string impact;

            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskAlert
         * @brief Threshold breach raised to registered observers
         */
        struct RiskAlert
        {
            std::string type;
            std::string severity;
            std::string message;
            double value = 0.0;
            double threshold = 0.0;

            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskAssessment
         * @brief Complete result of one risk calculation
         *
         * Produced fresh for every request. A later calculation for the same
         * user replaces it in the cache; it is never mutated after creation.
         */
        struct RiskAssessment
        {
            std::string id;
            std::string user_id;
            std::string timestamp;
            std::string base_currency;

            exposure::ExposureSummary exposures;
            std::map<std::string, VolatilityProfile> volatilities;
            CorrelationMatrix correlations;

            std::vector<VaREstimate> var;
            MonteCarloSummary monte_carlo;
            ConcentrationMetrics concentration;
            std::vector<RiskFactor> risk_factors;
            std::vector<StressTestResult> stress_tests;

            double total_risk = 0.0; ///< Sum of exposure x daily volatility
            double risk_score = 0.0; ///< Bounded to [0, 100]
            std::vector<RiskRecommendation> recommendations;
            std::vector<RiskAlert> alerts;

            /**
             * @brief VaR estimate at a confidence level, or nullptr
             */
            const VaREstimate *var_at(double confidence) const;

            /**
             * @brief Volatility profile of a currency, or nullptr
             */
            const VolatilityProfile *volatility_of(const std::string &currency) const;

            /**
             * @brief Contribution of the individual risk factor of a currency (0 if absent)
             */
            double individual_risk(const std::string &currency) const;

            nlohmann::json to_json() const;

            void print_summary() const;
        };

    } // namespace risk
} // namespace fxhedge
