/**
 * @file hedge_ratio_optimizer.cpp
 * @brief Implementation of HedgeRatioOptimizer
 */

#include "optimizer/hedge_ratio_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>

namespace fxhedge
{
    namespace optimizer
    {

        nlohmann::json RatioOptimizationResult::to_json() const
        {
            return {
                {"strategy_id", strategy_id},
                {"initial_ratio", initial_ratio},
                {"hedge_ratio", hedge_ratio},
                {"utility", utility},
                {"grid_points", grid_points},
                {"iterations", iterations},
                {"converged", converged},
                {"searched", searched}};
        }

        void RatioOptimizationResult::print_summary() const
        {
            std::cout << "  " << std::setw(28) << std::left << strategy_id << std::right
                      << std::fixed << std::setprecision(3)
                      << " ratio " << initial_ratio << " -> " << hedge_ratio
                      << "  utility " << std::setprecision(4) << utility
                      << "  iter " << iterations
                      << (searched ? (converged ? "" : " (not converged)") : " (fixed)") << "\n";
        }

        HedgeRatioOptimizer::HedgeRatioOptimizer(const config::OptimizerConfig &config)
            : config_(config), utility_(config)
        {
            config_.validate();
        }

        double HedgeRatioOptimizer::clamp_ratio(double ratio) const
        {
            if (!std::isfinite(ratio))
            {
                return config_.min_hedge_ratio;
            }
            return std::max(config_.min_hedge_ratio, std::min(config_.max_hedge_ratio, ratio));
        }

        double HedgeRatioOptimizer::gradient(const hedging::StrategyCandidate &candidate, double ratio) const
        {
            // Central difference, one-sided at the bounds
            double lo = clamp_ratio(ratio - config_.gradient_epsilon);
            double hi = clamp_ratio(ratio + config_.gradient_epsilon);
            if (hi - lo <= 0.0)
            {
                return 0.0;
            }
            return (utility_.evaluate(candidate, hi) - utility_.evaluate(candidate, lo)) / (hi - lo);
        }

        RatioOptimizationResult HedgeRatioOptimizer::optimize(const hedging::StrategyCandidate &candidate,
                                                              const common::CancellationToken *token) const
        {
            RatioOptimizationResult result;
            result.strategy_id = candidate.id;
            result.initial_ratio = candidate.hedge_ratio;

            if (candidate.type == hedging::StrategyType::NATURAL)
            {
                result.hedge_ratio = clamp_ratio(candidate.hedge_ratio);
                result.utility = utility_.evaluate(candidate, result.hedge_ratio);
                result.converged = true;
                result.searched = false;
                return result;
            }

            // ===== Grid pass =====
            double best_ratio = clamp_ratio(candidate.hedge_ratio);
            double best_utility = utility_.evaluate(candidate, best_ratio);

            const double min_r = config_.min_hedge_ratio;
            const double max_r = config_.max_hedge_ratio;
            const int steps = static_cast<int>(std::floor((max_r - min_r) / config_.grid_step + 1e-9));
            for (int k = 0; k <= steps + 1; ++k)
            {
                double r = k <= steps ? min_r + k * config_.grid_step : max_r;
                r = clamp_ratio(r);
                double u = utility_.evaluate(candidate, r);
                ++result.grid_points;
                if (u > best_utility)
                {
                    best_utility = u;
                    best_ratio = r;
                }
            }

            // ===== Gradient ascent =====
            double ratio = best_ratio;
            for (int it = 0; it < config_.max_iterations; ++it)
            {
                common::check_cancelled(token, "Hedge ratio optimization");

                double next = clamp_ratio(ratio + config_.learning_rate * gradient(candidate, ratio));
                ++result.iterations;

                double u = utility_.evaluate(candidate, next);
                if (u > best_utility)
                {
                    best_utility = u;
                    best_ratio = next;
                }

                if (std::abs(next - ratio) < config_.convergence_threshold)
                {
                    result.converged = true;
                    break;
                }
                ratio = next;
            }

            result.hedge_ratio = best_ratio;
            result.utility = best_utility;
            return result;
        }

        std::vector<RatioOptimizationResult> HedgeRatioOptimizer::optimize_all(std::vector<hedging::StrategyCandidate> &candidates,
                                                                                const common::CancellationToken *token) const
        {
            std::vector<RatioOptimizationResult> results;
            results.reserve(candidates.size());

            if (config_.parallel && candidates.size() > 1)
            {
                std::vector<std::future<RatioOptimizationResult>> tasks;
                tasks.reserve(candidates.size());
                for (const auto &c : candidates)
                {
                    tasks.push_back(std::async(std::launch::async,
                                               [this, &c, token]()
                                               { return optimize(c, token); }));
                }
                for (auto &task : tasks)
                {
                    results.push_back(task.get());
                }
            }
            else
            {
                for (const auto &c : candidates)
                {
                    results.push_back(optimize(c, token));
                }
            }

            for (size_t i = 0; i < candidates.size(); ++i)
            {
                candidates[i].hedge_ratio = results[i].hedge_ratio;
                candidates[i].utility = results[i].utility;
            }
            return results;
        }

    } // namespace optimizer
} // namespace fxhedge
