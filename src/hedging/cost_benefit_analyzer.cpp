/**
 * @file cost_benefit_analyzer.cpp
 * @brief Implementation of CostBenefitAnalyzer
 */

#include "hedging/cost_benefit_analyzer.hpp"

#include <algorithm>
#include <cmath>

namespace fxhedge
{
    namespace hedging
    {

        namespace
        {
            TransactionCostConfig transaction_config(const config::HedgingConfig &hc)
            {
                TransactionCostConfig cfg;
                cfg.fixed_fee = hc.transaction_fixed_fee;
                cfg.variable_bps = hc.transaction_variable_bps;
                return cfg;
            }
        }

        // ===== JSON export =====

        nlohmann::json ScenarioOutcome::to_json() const
        {
            return {
                {"scenario", scenario},
                {"probability", probability},
                {"market_move", market_move},
                {"unhedged_loss", unhedged_loss},
                {"hedged_loss", hedged_loss},
                {"hedge_cost", hedge_cost},
                {"net_benefit", net_benefit},
                {"effective_protection", effective_protection}};
        }

        double CostBenefitAnalysis::expected_net_benefit() const
        {
            double total = 0.0;
            for (const auto &s : scenarios)
            {
                total += s.probability * s.net_benefit;
            }
            return total;
        }

        nlohmann::json CostBenefitAnalysis::to_json() const
        {
            nlohmann::json scen = nlohmann::json::array();
            for (const auto &s : scenarios)
            {
                scen.push_back(s.to_json());
            }
            return {
                {"strategy_id", strategy_id},
                {"costs", {{"direct", direct_cost}, {"opportunity", opportunity_cost}, {"transaction", transaction_cost}, {"total", total_cost}}},
                {"benefits", {{"risk_reduction", risk_reduction}, {"volatility_reduction", volatility_reduction}, {"downside_protection", downside_protection}, {"total", total_benefit}}},
                {"benefit_cost_ratio", benefit_cost_ratio},
                {"hedge_effectiveness", hedge_effectiveness},
                {"scenario_analysis", scen},
                {"expected_net_benefit", expected_net_benefit()},
                {"utility", utility},
                {"ranking_score", ranking_score}};
        }

        nlohmann::json RankedStrategy::to_json() const
        {
            nlohmann::json j = strategy.to_json();
            j["rank"] = rank;
            j["cost_benefit_analysis"] = analysis.to_json();
            return j;
        }

        // ===== CostBenefitAnalyzer =====

        CostBenefitAnalyzer::CostBenefitAnalyzer(const config::HedgingConfig &hedging,
                                                 const config::OptimizerConfig &optimizer)
            : config_(hedging),
              utility_(optimizer),
              transaction_costs_(transaction_config(hedging))
        {
        }

        CostBenefitAnalysis CostBenefitAnalyzer::analyze(const StrategyCandidate &candidate,
                                                         const risk::RiskAssessment &assessment) const
        {
            CostBenefitAnalysis a;
            a.strategy_id = candidate.id;

            const double ratio = candidate.hedge_ratio;
            const double effectiveness = candidate.effectiveness;
            const bool natural = candidate.type == StrategyType::NATURAL;

            // ===== Costs =====
            a.direct_cost = candidate.direct_cost();

            if (!natural)
            {
                a.opportunity_cost = config_.opportunity_cost_rate * candidate.exposure * ratio *
                                     candidate.time_horizon / 365.0;

                std::vector<HedgeOrder> orders;
                for (const auto &leg : candidate.allocations)
                {
                    orders.push_back(HedgeOrder{leg.instrument, leg.currency, leg.amount * ratio});
                }
                a.transaction_cost = transaction_costs_.calculate_total_cost(orders);
            }

            a.total_cost = a.direct_cost + a.opportunity_cost + a.transaction_cost;

            // ===== Benefits =====
            double base_risk = 0.0;
            double exposure_vol = 0.0;
            double relative = 0.0;
            for (const auto &currency : candidate.hedged_currencies())
            {
                base_risk += assessment.individual_risk(currency);

                const auto *e = assessment.exposures.find(currency);
                const auto *vol = assessment.volatility_of(currency);
                if (e != nullptr)
                {
                    relative += e->relative_exposure;
                    if (vol != nullptr)
                    {
                        exposure_vol += e->absolute_exposure * vol->annual;
                    }
                }
            }

            double portfolio_var = 0.0;
            if (!assessment.var.empty())
            {
                auto lowest = std::min_element(assessment.var.begin(), assessment.var.end(),
                                               [](const risk::VaREstimate &x, const risk::VaREstimate &y)
                                               { return x.confidence < y.confidence; });
                portfolio_var = lowest->parametric;
            }

            const double scale = ratio * effectiveness;
            a.risk_reduction = base_risk * scale;
            a.volatility_reduction = exposure_vol * scale;
            a.downside_protection = portfolio_var * relative * scale;
            a.total_benefit = a.risk_reduction + a.volatility_reduction + a.downside_protection;

            a.benefit_cost_ratio = a.total_benefit / (a.total_cost + 1.0);
            a.hedge_effectiveness = scale;
            a.scenarios = scenario_analysis(candidate, a.total_cost);
            a.utility = utility_.evaluate(candidate, ratio);
            return a;
        }

        std::vector<ScenarioOutcome> CostBenefitAnalyzer::scenario_analysis(const StrategyCandidate &candidate,
                                                                            double total_cost) const
        {
            std::vector<ScenarioOutcome> out;
            const double protection = candidate.hedge_ratio * candidate.effectiveness;

            for (const auto &spec : config_.cost_scenarios)
            {
                ScenarioOutcome s;
                s.scenario = spec.name;
                s.probability = spec.probability;
                s.market_move = spec.market_move;
                s.unhedged_loss = candidate.exposure * std::abs(spec.market_move);
                s.hedge_cost = total_cost;
                s.hedged_loss = s.unhedged_loss * (1.0 - protection) + total_cost;
                s.net_benefit = s.unhedged_loss - s.hedged_loss;
                s.effective_protection = s.unhedged_loss > 0.0 ? s.net_benefit / s.unhedged_loss : 0.0;
                out.push_back(s);
            }
            return out;
        }

        std::vector<RankedStrategy> CostBenefitAnalyzer::rank(const std::vector<StrategyCandidate> &candidates,
                                                              const risk::RiskAssessment &assessment) const
        {
            std::vector<RankedStrategy> ranked;
            ranked.reserve(candidates.size());
            for (const auto &c : candidates)
            {
                RankedStrategy r;
                r.strategy = c;
                r.analysis = analyze(c, assessment);
                ranked.push_back(r);
            }
            return rank(std::move(ranked));
        }

        std::vector<RankedStrategy> CostBenefitAnalyzer::rank(std::vector<RankedStrategy> strategies) const
        {
            const auto &w = config_.ranking;

            double max_risk_reduction = 0.0;
            for (const auto &s : strategies)
            {
                max_risk_reduction = std::max(max_risk_reduction, s.analysis.risk_reduction);
            }

            for (auto &s : strategies)
            {
                double bcr = std::min(s.analysis.benefit_cost_ratio, w.benefit_cost_cap) / w.benefit_cost_cap;
                double rr = max_risk_reduction > 0.0 ? s.analysis.risk_reduction / max_risk_reduction : 0.0;
                double simplicity = s.strategy.type == StrategyType::SINGLE ? 1.0 : 0.0;

                s.analysis.ranking_score = w.benefit_cost * bcr +
                                           w.risk_reduction * rr +
                                           w.effectiveness * s.strategy.effectiveness +
                                           w.liquidity * config::liquidity_score(s.strategy.liquidity) +
                                           w.simplicity * simplicity;
            }

            std::stable_sort(strategies.begin(), strategies.end(),
                             [](const RankedStrategy &a, const RankedStrategy &b)
                             {
                                 if (a.analysis.ranking_score != b.analysis.ranking_score)
                                     return a.analysis.ranking_score > b.analysis.ranking_score;
                                 if (a.analysis.risk_reduction != b.analysis.risk_reduction)
                                     return a.analysis.risk_reduction > b.analysis.risk_reduction;
                                 return a.strategy.id < b.strategy.id;
                             });

            for (size_t i = 0; i < strategies.size(); ++i)
            {
                strategies[i].rank = static_cast<int>(i) + 1;
            }
            return strategies;
        }

    } // namespace hedging
} // namespace fxhedge
