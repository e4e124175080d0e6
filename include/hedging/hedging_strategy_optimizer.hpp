/**
 * @file hedging_strategy_optimizer.hpp
 * @brief Hedging recommendation pipeline
 *
 * RiskAssessment -> HedgingNeedAnalyzer -> StrategyGenerator -> HedgeRatioOptimizer
 *                -> CostBenefitAnalyzer (rank) -> ImplementationPlanner -> HedgingRecommendation
 */

#pragma once

#include "common/cancellation.hpp"
#include "config/engine_config.hpp"
#include "hedging/cost_benefit_analyzer.hpp"
#include "hedging/hedging_types.hpp"
#include "hedging/implementation_planner.hpp"
#include "hedging/pricing_provider.hpp"
#include "hedging/rebalance_scheduler.hpp"
#include "optimizer/hedge_ratio_optimizer.hpp"
#include "risk/risk_assessment.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace hedging
    {

        /**
         * @struct HedgingRecommendation
         * @brief Recommendation bundle returned for one assessment
         *
         * When no exposure needs hedging the bundle carries no recommended
         * strategy, no plan and zero totals.
         */
        struct HedgingRecommendation
        {
            std::string id;
            std::string user_id;
            std::string base_currency;
            std::string timestamp;
            std::string assessment_id;

            std::vector<HedgingNeed> needs;
            std::optional<RankedStrategy> recommended;
            std::vector<RankedStrategy> alternatives;
            std::optional<ImplementationPlan> plan;
            std::optional<RebalanceSchedule> rebalance;
            std::vector<optimizer::RatioOptimizationResult> optimizations;
            int candidates_evaluated = 0;

            double total_cost = 0.0;
            double expected_effectiveness = 0.0; ///< Hedge ratio x effectiveness of the recommended strategy
            double total_risk_reduction = 0.0;

            std::optional<config::StrategyTemplate> strategy_template; ///< Profile the candidates were built under
            bool meets_risk_target = true; ///< expected_effectiveness reached the profile's target

            bool has_recommendation() const { return recommended.has_value(); }

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /**
         * @class StrategyObserver
         * @brief Receives notifications from HedgingStrategyOptimizer
         */
        class StrategyObserver
        {
        public:
            virtual ~StrategyObserver() = default;

            virtual void on_strategy_generated(const HedgingRecommendation &) {}

            virtual void on_error(const std::string &, const std::string &) {}
        };

        /**
         * @class HedgingStrategyOptimizer
         * @brief Builds the recommendation bundle for a risk assessment
         *
         * Candidates are discarded once the bundle is returned. The optimizer
         * keeps no per-user state.
         */
        class HedgingStrategyOptimizer
        {
        public:
            /**
             * @param config Engine configuration (validated here)
             * @param pricing Pricing provider; when null, one is created from config.pricing_model
             */
            explicit HedgingStrategyOptimizer(const config::EngineConfig &config,
                                              std::shared_ptr<const PricingProvider> pricing = nullptr);

            /**
             * @brief Run the full hedging pipeline
             * @param user_id Owner of the assessment
             * @param assessment Risk assessment to hedge
             * @param token Optional cancellation token for the ratio search
             * @throws common::OperationCancelled if the token is cancelled
             */
            HedgingRecommendation generate_recommendations(const std::string &user_id,
                                                           const risk::RiskAssessment &assessment,
                                                           const common::CancellationToken *token = nullptr) const;

            void add_observer(std::shared_ptr<StrategyObserver> observer);

            const PricingProvider &pricing() const { return *pricing_; }
            const config::EngineConfig &config() const { return config_; }

        private:
            std::vector<std::shared_ptr<StrategyObserver>> observers() const;

            config::EngineConfig config_;
            std::shared_ptr<const PricingProvider> pricing_;

            mutable std::mutex mutex_;
            std::vector<std::shared_ptr<StrategyObserver>> observers_;
        };

    } // namespace hedging
} // namespace fxhedge
