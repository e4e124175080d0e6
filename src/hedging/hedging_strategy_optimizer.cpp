/**
 * @file hedging_strategy_optimizer.cpp
 * @brief Implementation of HedgingStrategyOptimizer
 */

#include "hedging/hedging_strategy_optimizer.hpp"

#include "common/time_utils.hpp"
#include "hedging/hedging_need_analyzer.hpp"
#include "hedging/strategy_generator.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace fxhedge
{
    namespace hedging
    {

        // ============================================================================
        // HedgingRecommendation
        // ============================================================================

        nlohmann::json HedgingRecommendation::to_json() const
        {
            nlohmann::json need_list = nlohmann::json::array();
            for (const auto &n : needs)
            {
                need_list.push_back(n.to_json());
            }

            nlohmann::json alt_list = nlohmann::json::array();
            for (const auto &a : alternatives)
            {
                alt_list.push_back(a.to_json());
            }

            nlohmann::json opt_list = nlohmann::json::array();
            for (const auto &o : optimizations)
            {
                opt_list.push_back(o.to_json());
            }

            return {
                {"id", id},
                {"user_id", user_id},
                {"base_currency", base_currency},
                {"timestamp", timestamp},
                {"assessment_id", assessment_id},
                {"hedging_needs", need_list},
                {"recommended_strategy", recommended ? recommended->to_json() : nlohmann::json(nullptr)},
                {"alternative_strategies", alt_list},
                {"implementation_plan", plan ? plan->to_json() : nlohmann::json(nullptr)},
                {"rebalance_schedule", rebalance ? rebalance->to_json() : nlohmann::json(nullptr)},
                {"optimizations", opt_list},
                {"candidates_evaluated", candidates_evaluated},
                {"total_cost", total_cost},
                {"expected_effectiveness", expected_effectiveness},
                {"total_risk_reduction", total_risk_reduction},
                {"strategy_profile", strategy_template ? strategy_template->to_json() : nlohmann::json(nullptr)},
                {"meets_risk_target", meets_risk_target}};
        }

        void HedgingRecommendation::print_summary() const
        {
            std::cout << "\n=== Hedging Recommendation ===\n";
            std::cout << "User: " << user_id << "  Base: " << base_currency << "  At: " << timestamp << "\n";
            std::cout << std::fixed << std::setprecision(2);

            if (needs.empty())
            {
                std::cout << "No exposure requires hedging.\n";
                std::cout << "==============================\n"
                          << std::endl;
                return;
            }

            std::cout << "\nHedging needs:\n";
            for (const auto &n : needs)
            {
                std::cout << "  " << std::setw(5) << std::left << n.currency << std::right
                          << std::setw(8) << to_string(n.priority)
                          << std::setw(16) << n.exposure
                          << "  ratio " << std::setprecision(1) << n.recommended_hedge_ratio * 100.0 << "%"
                          << "  " << n.time_horizon << "d  " << n.urgency << "\n"
                          << std::setprecision(2);
            }

            if (recommended)
            {
                const auto &s = recommended->strategy;
                const auto &a = recommended->analysis;
                std::cout << "\nRecommended: " << s.id << " (" << to_string(s.type) << ")\n";
                std::cout << "  Hedge ratio:    " << std::setprecision(1) << s.hedge_ratio * 100.0 << "%\n";
                std::cout << "  Effectiveness:  " << s.effectiveness * 100.0 << "%\n";
                std::cout << std::setprecision(2);
                std::cout << "  Total cost:     " << a.total_cost << "\n";
                std::cout << "  Total benefit:  " << a.total_benefit << "\n";
                std::cout << "  Benefit/cost:   " << a.benefit_cost_ratio << "\n";
                for (const auto &sc : a.scenarios)
                {
                    std::cout << "    " << std::setw(18) << std::left << sc.scenario << std::right
                              << " net " << std::setw(12) << sc.net_benefit
                              << "  protection " << std::setprecision(1) << sc.effective_protection * 100.0 << "%\n"
                              << std::setprecision(2);
                }
            }

            if (!alternatives.empty())
            {
                std::cout << "\nAlternatives:\n";
                for (const auto &alt : alternatives)
                {
                    std::cout << "  " << alt.rank << ". " << alt.strategy.id
                              << "  cost " << alt.analysis.total_cost
                              << "  score " << std::setprecision(3) << alt.analysis.ranking_score << "\n"
                              << std::setprecision(2);
                }
            }

            if (plan)
            {
                std::cout << "\nImplementation (" << plan->timeline_days() << " days):\n";
                for (const auto &p : plan->phases)
                {
                    std::cout << "  Phase " << p.number << ": " << p.name << " (" << p.duration_days << " days)\n";
                }
            }
            if (rebalance)
            {
                std::cout << "Rebalance: " << to_string(rebalance->frequency)
                          << ", next " << rebalance->next_rebalance << "\n";
            }
            std::cout << "==============================\n"
                      << std::endl;
        }

        // ============================================================================
        // HedgingStrategyOptimizer
        // ============================================================================

        HedgingStrategyOptimizer::HedgingStrategyOptimizer(const config::EngineConfig &config,
                                                           std::shared_ptr<const PricingProvider> pricing)
            : config_(config),
              pricing_(pricing ? std::move(pricing) : std::shared_ptr<const PricingProvider>(create_pricing_provider(config.pricing_model)))
        {
            config_.validate();
        }

        void HedgingStrategyOptimizer::add_observer(std::shared_ptr<StrategyObserver> observer)
        {
            if (!observer)
            {
                throw std::invalid_argument("Observer must not be null");
            }
            std::lock_guard<std::mutex> lock(mutex_);
            observers_.push_back(std::move(observer));
        }

        std::vector<std::shared_ptr<StrategyObserver>> HedgingStrategyOptimizer::observers() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return observers_;
        }

        HedgingRecommendation HedgingStrategyOptimizer::generate_recommendations(const std::string &user_id,
                                                                                 const risk::RiskAssessment &assessment,
                                                                                 const common::CancellationToken *token) const
        {
            HedgingRecommendation rec;
            rec.id = common::make_identifier("hedge");
            rec.user_id = user_id;
            rec.base_currency = assessment.base_currency;
            rec.timestamp = common::current_timestamp();
            rec.assessment_id = assessment.id;

            try
            {
                HedgingNeedAnalyzer need_analyzer(config_.hedging);
                rec.needs = need_analyzer.analyze(assessment);

                if (!rec.needs.empty())
                {
                    StrategyGenerator generator(config_, pricing_);
                    rec.strategy_template = generator.strategy_template();
                    auto candidates = generator.generate(rec.needs, assessment.correlations);
                    rec.candidates_evaluated = static_cast<int>(candidates.size());

                    optimizer::HedgeRatioOptimizer ratio_optimizer(config_.optimizer);
                    rec.optimizations = ratio_optimizer.optimize_all(candidates, token);

                    CostBenefitAnalyzer analyzer(config_.hedging, config_.optimizer);
                    auto ranked = analyzer.rank(candidates, assessment);

                    if (!ranked.empty())
                    {
                        rec.recommended = ranked.front();
                        size_t n_alt = std::min(ranked.size() - 1, static_cast<size_t>(config_.hedging.max_alternatives));
                        rec.alternatives.assign(ranked.begin() + 1, ranked.begin() + 1 + static_cast<std::ptrdiff_t>(n_alt));

                        const auto &best = rec.recommended->strategy;
                        ImplementationPlanner planner;
                        rec.plan = planner.plan(best);

                        RebalanceScheduler scheduler{RebalanceConfig{}};
                        rec.rebalance = scheduler.schedule(best, common::today());

                        rec.total_cost = rec.recommended->analysis.total_cost;
                        rec.expected_effectiveness = rec.recommended->analysis.hedge_effectiveness;
                        rec.total_risk_reduction = rec.recommended->analysis.risk_reduction;

                        if (rec.strategy_template &&
                            rec.expected_effectiveness < rec.strategy_template->risk_reduction_target)
                        {
                            rec.meets_risk_target = false;
                            std::cerr << "Warning: " << rec.strategy_template->name << " targets "
                                      << rec.strategy_template->risk_reduction_target
                                      << " risk reduction, best strategy reaches " << rec.expected_effectiveness
                                      << std::endl;
                        }
                    }
                    else
                    {
                        std::cerr << "Warning: no hedging instrument fits the needs of user " << user_id << std::endl;
                    }
                }
            }
            catch (const common::OperationCancelled &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                for (const auto &observer : observers())
                {
                    observer->on_error(user_id, e.what());
                }
                throw;
            }

            for (const auto &observer : observers())
            {
                observer->on_strategy_generated(rec);
            }
            return rec;
        }

    } // namespace hedging
} // namespace fxhedge
