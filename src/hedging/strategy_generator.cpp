/**
 * @file strategy_generator.cpp
 * @brief Implementation of StrategyGenerator
 */

#include "hedging/strategy_generator.hpp"

#include <algorithm>
#include <stdexcept>

namespace fxhedge
{
    namespace hedging
    {

        StrategyGenerator::StrategyGenerator(const config::EngineConfig &config,
                                             std::shared_ptr<const PricingProvider> pricing)
            : config_(config), pricing_(std::move(pricing)), adjust_for_market_(config.hedging.market_condition_adjustment)
        {
            if (!pricing_)
            {
                throw std::invalid_argument("StrategyGenerator requires a pricing provider");
            }
            if (config_.hedging.strategy_profile)
            {
                template_ = config::StrategyTemplate::for_profile(*config_.hedging.strategy_profile);
                if (template_->profile == config::StrategyProfile::DYNAMIC)
                {
                    adjust_for_market_ = true;
                }
            }
        }

        // ============================================================================
        // Profile and market conditions
        // ============================================================================

        double StrategyGenerator::market_condition_adjustment(double annual_volatility, config::LiquidityTier liquidity)
        {
            double adjustment = 1.0;

            if (annual_volatility > 0.25)
            {
                adjustment *= 0.9;
            }
            else if (annual_volatility < 0.10)
            {
                adjustment *= 1.1;
            }

            if (liquidity == config::LiquidityTier::LOW)
            {
                adjustment *= 0.85;
            }
            else if (liquidity == config::LiquidityTier::HIGH)
            {
                adjustment *= 1.05;
            }

            return std::min(adjustment, 1.2);
        }

        double StrategyGenerator::adjusted_effectiveness(double effectiveness, double annual_volatility,
                                                         config::LiquidityTier liquidity) const
        {
            if (!adjust_for_market_)
            {
                return effectiveness;
            }
            return std::min(effectiveness * market_condition_adjustment(annual_volatility, liquidity), 1.0);
        }

        double StrategyGenerator::starting_ratio(const HedgingNeed &need) const
        {
            if (!template_)
            {
                return need.recommended_hedge_ratio;
            }
            return std::min(need.recommended_hedge_ratio, template_->default_hedge_ratio);
        }

        bool StrategyGenerator::allows(config::InstrumentType type) const
        {
            return !template_ || template_->allows(type);
        }

        bool StrategyGenerator::within_cost_ceiling(const StrategyCandidate &candidate) const
        {
            if (!template_)
            {
                return true;
            }
            return candidate.cost <= template_->max_cost_fraction * candidate.exposure;
        }

        InstrumentAllocation StrategyGenerator::allocate(const config::InstrumentSpec &instrument,
                                                         const HedgingNeed &need,
                                                         double portion) const
        {
            PricingContext context;
            context.currency = need.currency;
            context.annual_volatility = need.volatility;
            context.horizon_days = need.time_horizon;

            InstrumentAllocation a;
            a.instrument = instrument.name;
            a.currency = need.currency;
            a.amount = need.exposure * portion;
            a.portion = portion;
            a.cost = pricing_->instrument_cost(instrument, a.amount, context);
            a.effectiveness = adjusted_effectiveness(instrument.effectiveness, need.volatility, instrument.liquidity);
            return a;
        }

        // ============================================================================
        // Per-need candidates
        // ============================================================================

        std::vector<StrategyCandidate> StrategyGenerator::single_instrument(const HedgingNeed &need) const
        {
            std::vector<StrategyCandidate> out;

            for (const auto &instrument : config_.instruments)
            {
                if (!allows(instrument.type) ||
                    instrument.min_amount > need.exposure || instrument.max_tenor_days < need.time_horizon)
                {
                    continue;
                }

                StrategyCandidate c;
                c.id = "single-" + need.currency + "-" + instrument.name;
                c.type = StrategyType::SINGLE;
                c.currencies = {need.currency};
                c.exposure = need.exposure;
                c.allocations.push_back(allocate(instrument, need, 1.0));
                c.hedge_ratio = starting_ratio(need);
                c.time_horizon = need.time_horizon;
                c.cost = c.allocations.front().cost;
                c.effectiveness = c.allocations.front().effectiveness;
                c.liquidity = instrument.liquidity;
                if (within_cost_ceiling(c))
                {
                    out.push_back(c);
                }
            }

            return out;
        }

        std::optional<StrategyCandidate> StrategyGenerator::combination(const HedgingNeed &need) const
        {
            const auto &hc = config_.hedging;
            if (need.priority != Priority::HIGH || need.exposure <= hc.combination_size_threshold)
            {
                return std::nullopt;
            }

            const auto *forward = config_.find_instrument(config::InstrumentType::FORWARD);
            const auto *option = config_.find_instrument(config::InstrumentType::OPTION);
            if (forward == nullptr || option == nullptr ||
                !allows(config::InstrumentType::FORWARD) || !allows(config::InstrumentType::OPTION))
            {
                return std::nullopt;
            }

            const double forward_share = hc.combination_forward_share;
            const double option_share = 1.0 - forward_share;
            if (need.exposure * forward_share < forward->min_amount ||
                need.exposure * option_share < option->min_amount)
            {
                return std::nullopt;
            }
            if (std::min(forward->max_tenor_days, option->max_tenor_days) < need.time_horizon)
            {
                return std::nullopt;
            }

            StrategyCandidate c;
            c.id = "combination-" + need.currency;
            c.type = StrategyType::COMBINATION;
            c.currencies = {need.currency};
            c.exposure = need.exposure;
            c.allocations.push_back(allocate(*forward, need, forward_share));
            c.allocations.push_back(allocate(*option, need, option_share));
            c.hedge_ratio = starting_ratio(need);
            c.time_horizon = need.time_horizon;
            for (const auto &a : c.allocations)
            {
                c.cost += a.cost;
                c.effectiveness += a.portion * a.effectiveness;
            }
            c.liquidity = std::min(forward->liquidity, option->liquidity);
            if (!within_cost_ceiling(c))
            {
                return std::nullopt;
            }
            return c;
        }

        // ============================================================================
        // Portfolio-level candidates
        // ============================================================================

        std::optional<StrategyCandidate> StrategyGenerator::basket(const std::vector<HedgingNeed> &needs) const
        {
            const auto &hc = config_.hedging;
            if (static_cast<int>(needs.size()) < hc.basket_min_needs)
            {
                return std::nullopt;
            }

            const auto *swap = config_.find_instrument(config::InstrumentType::SWAP);
            if (swap == nullptr || !allows(config::InstrumentType::SWAP))
            {
                return std::nullopt;
            }

            double total = 0.0;
            double weighted_ratio = 0.0;
            int horizon = 0;
            for (const auto &n : needs)
            {
                total += n.exposure;
                weighted_ratio += n.exposure * starting_ratio(n);
                horizon = std::max(horizon, n.time_horizon);
            }
            if (total < swap->min_amount || swap->max_tenor_days < horizon || total <= 0.0)
            {
                return std::nullopt;
            }

            StrategyCandidate c;
            c.id = "basket";
            c.type = StrategyType::BASKET;
            c.exposure = total;
            for (const auto &n : needs)
            {
                auto a = allocate(*swap, n, 1.0);
                a.portion = n.exposure / total;
                a.cost *= hc.basket_cost_discount;
                a.effectiveness = hc.basket_effectiveness;
                c.cost += a.cost;
                c.currencies.push_back(n.currency);
                c.id += "-" + n.currency;
                c.allocations.push_back(a);
            }
            c.hedge_ratio = weighted_ratio / total;
            c.time_horizon = horizon;
            c.effectiveness = hc.basket_effectiveness;
            c.liquidity = swap->liquidity;
            if (!within_cost_ceiling(c))
            {
                return std::nullopt;
            }
            return c;
        }

        bool StrategyGenerator::is_fallback_pair(const std::string &a, const std::string &b) const
        {
            for (const auto &p : config_.hedging.fallback_natural_pairs)
            {
                if ((p.first == a && p.second == b) || (p.first == b && p.second == a))
                {
                    return true;
                }
            }
            return false;
        }

        std::vector<StrategyCandidate> StrategyGenerator::natural_hedges(const std::vector<HedgingNeed> &needs,
                                                                         const risk::CorrelationMatrix &correlations) const
        {
            const auto &hc = config_.hedging;
            std::vector<StrategyCandidate> out;
            if (template_ && !template_->natural_hedges)
            {
                return out;
            }

            for (size_t i = 0; i < needs.size(); ++i)
            {
                for (size_t j = i + 1; j < needs.size(); ++j)
                {
                    const auto &a = needs[i];
                    const auto &b = needs[j];

                    bool negative;
                    if (correlations.has_data(a.currency) && correlations.has_data(b.currency))
                    {
                        negative = correlations.get(a.currency, b.currency) < hc.natural_hedge_correlation;
                    }
                    else
                    {
                        negative = is_fallback_pair(a.currency, b.currency);
                    }
                    if (!negative)
                    {
                        continue;
                    }

                    const HedgingNeed &larger = a.exposure >= b.exposure ? a : b;
                    const HedgingNeed &smaller = a.exposure >= b.exposure ? b : a;
                    if (larger.exposure <= 0.0)
                    {
                        continue;
                    }

                    StrategyCandidate c;
                    c.id = "natural-" + larger.currency + "-" + smaller.currency;
                    c.type = StrategyType::NATURAL;
                    c.currencies = {larger.currency, smaller.currency};
                    c.exposure = larger.exposure;
                    c.hedge_ratio = smaller.exposure / larger.exposure;
                    c.time_horizon = std::max(larger.time_horizon, smaller.time_horizon);
                    c.cost = 0.0;
                    c.liquidity = config::LiquidityTier::HIGH;
                    c.effectiveness = adjusted_effectiveness(hc.natural_hedge_effectiveness,
                                                             larger.volatility, c.liquidity);

                    InstrumentAllocation leg;
                    leg.instrument = "natural";
                    leg.currency = smaller.currency;
                    leg.amount = smaller.exposure;
                    leg.portion = 1.0;
                    leg.cost = 0.0;
                    leg.effectiveness = c.effectiveness;
                    c.allocations.push_back(leg);

                    out.push_back(c);
                }
            }

            return out;
        }

        std::vector<StrategyCandidate> StrategyGenerator::generate(const std::vector<HedgingNeed> &needs,
                                                                   const risk::CorrelationMatrix &correlations) const
        {
            std::vector<StrategyCandidate> candidates;

            for (const auto &need : needs)
            {
                auto singles = single_instrument(need);
                candidates.insert(candidates.end(), singles.begin(), singles.end());

                auto combo = combination(need);
                if (combo)
                {
                    candidates.push_back(*combo);
                }
            }

            auto portfolio_hedge = basket(needs);
            if (portfolio_hedge)
            {
                candidates.push_back(*portfolio_hedge);
            }

            auto natural = natural_hedges(needs, correlations);
            candidates.insert(candidates.end(), natural.begin(), natural.end());

            return candidates;
        }

    } // namespace hedging
} // namespace fxhedge
