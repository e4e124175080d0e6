/**
 * @file hedge_ratio_optimizer.hpp
 * @brief Numerical hedge-ratio search
 *
 * Each candidate is optimized in two stages:
 *   1. Grid pass over [min, max] with the configured step
 *   2. Finite-difference gradient ascent from the best grid point,
 *      stopping when the ratio moves less than the convergence threshold
 *      or the iteration cap is reached
 *
 * Every ratio is clamped to [min, max]; the best point seen is returned
 * even when the search does not converge.
 */

#pragma once

#include "common/cancellation.hpp"
#include "config/engine_config.hpp"
#include "hedging/hedging_types.hpp"
#include "optimizer/hedge_utility.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fxhedge
{
    namespace optimizer
    {

        /**
         * @struct RatioOptimizationResult
         * @brief Outcome of optimizing one candidate
         */
        struct RatioOptimizationResult
        {
            std::string strategy_id;
            double initial_ratio = 0.0;
            double hedge_ratio = 0.0;
            double utility = 0.0;
            int grid_points = 0;
            int iterations = 0;     ///< Gradient iterations performed
            bool converged = false; ///< False when the iteration cap was hit first
            bool searched = true;   ///< False for natural hedges (ratio is fixed by the exposures)

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /**
         * @class HedgeRatioOptimizer
         * @brief Maximizes HedgeUtility over the hedge ratio of each candidate
         *
         * Thread Safety: optimize() is const and keeps no shared state, so
         * candidates are optimized concurrently by optimize_all().
         */
        class HedgeRatioOptimizer
        {
        public:
            explicit HedgeRatioOptimizer(const config::OptimizerConfig &config);

            /**
             * @brief Optimize one candidate
             * @param candidate Strategy to tune (not modified)
             * @param token Optional cancellation token, checked every iteration
             * @throws common::OperationCancelled if the token is cancelled
             */
            RatioOptimizationResult optimize(const hedging::StrategyCandidate &candidate,
                                             const common::CancellationToken *token = nullptr) const;

            /**
             * @brief Optimize every candidate and write back ratio and utility
             * @param candidates Candidates, updated in place
             * @return One result per candidate, in input order
             */
            std::vector<RatioOptimizationResult> optimize_all(std::vector<hedging::StrategyCandidate> &candidates,
                                                              const common::CancellationToken *token = nullptr) const;

            /**
             * @brief Clamp a ratio into the configured range
             */
            double clamp_ratio(double ratio) const;

            const HedgeUtility &utility() const { return utility_; }
            std::string get_name() const { return "HedgeRatioOptimizer"; }

        private:
            double gradient(const hedging::StrategyCandidate &candidate, double ratio) const;

            config::OptimizerConfig config_;
            HedgeUtility utility_;
        };

    } // namespace optimizer
} // namespace fxhedge
