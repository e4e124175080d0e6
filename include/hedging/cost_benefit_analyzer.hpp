/**
 * @file cost_benefit_analyzer.hpp
 * @brief Cost/benefit pricing, scenario analysis and ranking of candidates
 */

#pragma once

#include "config/engine_config.hpp"
#include "hedging/hedging_types.hpp"
#include "hedging/transaction_cost_model.hpp"
#include "optimizer/hedge_utility.hpp"
#include "risk/risk_assessment.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fxhedge
{
    namespace hedging
    {

        /**
         * @struct ScenarioOutcome
         */
        struct ScenarioOutcome
        {
            std::string scenario;
            double probability = 0.0;
            double market_move = 0.0;
            double unhedged_loss = 0.0;
            double hedged_loss = 0.0; ///< Includes the hedge cost
            double hedge_cost = 0.0;
            double net_benefit = 0.0;          ///< unhedged_loss - hedged_loss
            double effective_protection = 0.0; ///< net_benefit / unhedged_loss

            nlohmann::json to_json() const;
        };

        /**
         * @struct CostBenefitAnalysis
         */
        struct CostBenefitAnalysis
        {
            std::string strategy_id;

            double direct_cost = 0.0;
            double opportunity_cost = 0.0;
            double transaction_cost = 0.0;
            double total_cost = 0.0;

            double risk_reduction = 0.0;
            double volatility_reduction = 0.0;
            double downside_protection = 0.0;
            double total_benefit = 0.0;

            double benefit_cost_ratio = 0.0; ///< total_benefit / (total_cost + 1)
            double hedge_effectiveness = 0.0;
            std::vector<ScenarioOutcome> scenarios;

            double utility = 0.0;       ///< HedgeUtility at the strategy's hedge ratio
            double ranking_score = 0.0; ///< Set by CostBenefitAnalyzer::rank()

            /**
             * @brief Probability-weighted net benefit over the scenarios
             */
            double expected_net_benefit() const;

            nlohmann::json to_json() const;
        };

        /**
         * @struct RankedStrategy
         */
        struct RankedStrategy
        {
            StrategyCandidate strategy;
            CostBenefitAnalysis analysis;
            int rank = 0;

            nlohmann::json to_json() const;
        };

        /**
         * @class CostBenefitAnalyzer
         * @brief Prices candidates against the risk they remove and ranks them
         *
         * Costs:
         * - direct: instrument cost at the hedge ratio
         * - opportunity: rate x hedged notional x horizon / 365 (zero for natural hedges)
         * - transaction: fixed fee + basis points per booked leg (zero for natural hedges)
         *
         * Benefits (each scaled by hedge ratio x effectiveness):
         * - risk reduction: individual risk contribution of the hedged currencies
         * - volatility reduction: exposure x annual volatility
         * - downside protection: parametric VaR at the lowest confidence level
         *   x relative exposure of the hedged currencies
         */
        class CostBenefitAnalyzer
        {
        public:
            CostBenefitAnalyzer(const config::HedgingConfig &hedging,
                                const config::OptimizerConfig &optimizer);

            CostBenefitAnalysis analyze(const StrategyCandidate &candidate,
                                        const risk::RiskAssessment &assessment) const;

            std::vector<ScenarioOutcome> scenario_analysis(const StrategyCandidate &candidate,
                                                           double total_cost) const;

            /**
             * @brief Analyze and rank candidates
             *
             * Score = weighted blend of capped benefit-cost ratio, risk reduction
             * (relative to the best candidate), effectiveness, liquidity and a
             * simplicity bonus for single-instrument strategies. Ties go to the
             * larger risk reduction, then to the strategy id.
             */
            std::vector<RankedStrategy> rank(const std::vector<StrategyCandidate> &candidates,
                                             const risk::RiskAssessment &assessment) const;

            /**
             * @brief Re-rank already analyzed strategies (scores are recomputed)
             */
            std::vector<RankedStrategy> rank(std::vector<RankedStrategy> strategies) const;

            const TransactionCostModel &transaction_costs() const { return transaction_costs_; }
            std::string get_name() const { return "CostBenefitAnalyzer"; }

        private:
            config::HedgingConfig config_;
            optimizer::HedgeUtility utility_;
            TransactionCostModel transaction_costs_;
        };

    } // namespace hedging
} // namespace fxhedge
