/**
 * @file engine_config.cpp
 * @brief JSON loading, defaults and validation for EngineConfig
 */

#include "config/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fxhedge
{
    namespace config
    {

        namespace
        {
            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            void require_fraction(const std::string &name, double value)
            {
                if (value < 0.0 || value > 1.0)
                {
                    throw std::invalid_argument(name + " must be in [0, 1], got: " + std::to_string(value));
                }
            }

            void require_positive(const std::string &name, double value)
            {
                if (!(value > 0.0))
                {
                    throw std::invalid_argument(name + " must be positive, got: " + std::to_string(value));
                }
            }

            void require_non_negative(const std::string &name, double value)
            {
                if (value < 0.0)
                {
                    throw std::invalid_argument(name + " must be non-negative, got: " + std::to_string(value));
                }
            }
        } // anonymous namespace

        // ============================================================================
        // Enum conversions
        // ============================================================================

        std::string to_string(InstrumentType type)
        {
            switch (type)
            {
            case InstrumentType::FORWARD:
                return "forward";
            case InstrumentType::OPTION:
                return "option";
            case InstrumentType::SWAP:
                return "swap";
            }
            return "forward";
        }

        InstrumentType parse_instrument_type(const std::string &str)
        {
            auto s = to_lower(str);
            if (s == "forward" || s == "forward_contract")
                return InstrumentType::FORWARD;
            if (s == "option" || s == "currency_option")
                return InstrumentType::OPTION;
            if (s == "swap" || s == "currency_swap")
                return InstrumentType::SWAP;
            throw std::invalid_argument("Unknown instrument type: " + str);
        }

        std::string to_string(LiquidityTier tier)
        {
            switch (tier)
            {
            case LiquidityTier::LOW:
                return "low";
            case LiquidityTier::MEDIUM:
                return "medium";
            case LiquidityTier::HIGH:
                return "high";
            }
            return "medium";
        }

        LiquidityTier parse_liquidity_tier(const std::string &str)
        {
            auto s = to_lower(str);
            if (s == "low")
                return LiquidityTier::LOW;
            if (s == "medium")
                return LiquidityTier::MEDIUM;
            if (s == "high")
                return LiquidityTier::HIGH;
            throw std::invalid_argument("Unknown liquidity tier: " + str);
        }

        double liquidity_score(LiquidityTier tier)
        {
            switch (tier)
            {
            case LiquidityTier::HIGH:
                return 1.0;
            case LiquidityTier::MEDIUM:
                return 0.6;
            case LiquidityTier::LOW:
                return 0.3;
            }
            return 0.0;
        }

        std::string to_string(StrategyProfile profile)
        {
            switch (profile)
            {
            case StrategyProfile::CONSERVATIVE:
                return "conservative";
            case StrategyProfile::BALANCED:
                return "balanced";
            case StrategyProfile::AGGRESSIVE:
                return "aggressive";
            case StrategyProfile::DYNAMIC:
                return "dynamic";
            }
            return "balanced";
        }

        StrategyProfile parse_strategy_profile(const std::string &str)
        {
            auto s = to_lower(str);
            if (s == "conservative")
                return StrategyProfile::CONSERVATIVE;
            if (s == "balanced")
                return StrategyProfile::BALANCED;
            if (s == "aggressive")
                return StrategyProfile::AGGRESSIVE;
            if (s == "dynamic")
                return StrategyProfile::DYNAMIC;
            throw std::invalid_argument("Unknown strategy profile: " + str);
        }

        // ============================================================================
        // Strategy templates
        // ============================================================================

        bool StrategyTemplate::allows(InstrumentType type) const
        {
            return std::find(instruments.begin(), instruments.end(), type) != instruments.end();
        }

        StrategyTemplate StrategyTemplate::for_profile(StrategyProfile profile)
        {
            StrategyTemplate t;
            t.profile = profile;
            switch (profile)
            {
            case StrategyProfile::CONSERVATIVE:
                t.name = "Conservative Hedging";
                t.default_hedge_ratio = 0.8;
                t.instruments = {InstrumentType::FORWARD, InstrumentType::SWAP};
                t.risk_reduction_target = 0.7;
                t.max_cost_fraction = 0.02;
                break;
            case StrategyProfile::BALANCED:
                t.name = "Balanced Hedging";
                t.default_hedge_ratio = 0.5;
                t.instruments = {InstrumentType::FORWARD, InstrumentType::OPTION};
                t.risk_reduction_target = 0.5;
                t.max_cost_fraction = 0.015;
                break;
            case StrategyProfile::AGGRESSIVE:
                t.name = "Aggressive Hedging";
                t.default_hedge_ratio = 0.3;
                t.instruments = {InstrumentType::OPTION};
                t.natural_hedges = true;
                t.risk_reduction_target = 0.3;
                t.max_cost_fraction = 0.01;
                break;
            case StrategyProfile::DYNAMIC:
                t.name = "Dynamic Hedging";
                t.default_hedge_ratio = 0.6;
                t.instruments = {InstrumentType::FORWARD, InstrumentType::OPTION, InstrumentType::SWAP};
                t.risk_reduction_target = 0.6;
                t.max_cost_fraction = 0.025;
                break;
            }
            return t;
        }

        nlohmann::json StrategyTemplate::to_json() const
        {
            nlohmann::json families = nlohmann::json::array();
            for (auto type : instruments)
            {
                families.push_back(to_string(type));
            }
            if (natural_hedges)
            {
                families.push_back("natural");
            }
            return {
                {"profile", to_string(profile)},
                {"name", name},
                {"default_hedge_ratio", default_hedge_ratio},
                {"instruments", families},
                {"risk_reduction_target", risk_reduction_target},
                {"max_cost_fraction", max_cost_fraction}};
        }

        // ============================================================================
        // Catalog entries and scenarios
        // ============================================================================

        InstrumentSpec InstrumentSpec::from_json(const nlohmann::json &j)
        {
            InstrumentSpec spec;
            spec.type = parse_instrument_type(j.value("type", std::string("forward")));
            spec.name = j.value("name", to_string(spec.type));
            spec.cost_bps = j.value("cost_bps", 0.0);
            spec.effectiveness = j.value("effectiveness", 0.0);
            spec.min_amount = j.value("min_amount", 0.0);
            spec.max_tenor_days = j.value("max_tenor_days", 0);
            spec.liquidity = parse_liquidity_tier(j.value("liquidity", std::string("medium")));
            return spec;
        }

        nlohmann::json InstrumentSpec::to_json() const
        {
            return {
                {"name", name},
                {"type", to_string(type)},
                {"cost_bps", cost_bps},
                {"effectiveness", effectiveness},
                {"min_amount", min_amount},
                {"max_tenor_days", max_tenor_days},
                {"liquidity", to_string(liquidity)}};
        }

        void InstrumentSpec::validate() const
        {
            require_non_negative("Instrument '" + name + "' cost_bps", cost_bps);
            require_fraction("Instrument '" + name + "' effectiveness", effectiveness);
            require_non_negative("Instrument '" + name + "' min_amount", min_amount);
            if (max_tenor_days <= 0)
            {
                throw std::invalid_argument("Instrument '" + name + "' max_tenor_days must be positive, got: " +
                                            std::to_string(max_tenor_days));
            }
        }

        StressScenarioSpec StressScenarioSpec::from_json(const nlohmann::json &j)
        {
            StressScenarioSpec spec;
            spec.name = j.at("name").get<std::string>();
            if (j.contains("shocks"))
            {
                spec.shocks = j.at("shocks").get<std::map<std::string, double>>();
            }
            return spec;
        }

        nlohmann::json StressScenarioSpec::to_json() const
        {
            return {{"name", name}, {"shocks", shocks}};
        }

        CostScenarioSpec CostScenarioSpec::from_json(const nlohmann::json &j)
        {
            CostScenarioSpec spec;
            spec.name = j.at("name").get<std::string>();
            spec.probability = j.value("probability", 0.0);
            spec.market_move = j.value("market_move", 0.0);
            return spec;
        }

        nlohmann::json CostScenarioSpec::to_json() const
        {
            return {{"name", name}, {"probability", probability}, {"market_move", market_move}};
        }

        std::vector<InstrumentSpec> default_instrument_catalog()
        {
            InstrumentSpec forward;
            forward.name = "forward";
            forward.type = InstrumentType::FORWARD;
            forward.cost_bps = 10.0;
            forward.effectiveness = 0.95;
            forward.min_amount = 10000.0;
            forward.max_tenor_days = 365;
            forward.liquidity = LiquidityTier::HIGH;

            InstrumentSpec option;
            option.name = "option";
            option.type = InstrumentType::OPTION;
            option.cost_bps = 50.0;
            option.effectiveness = 0.85;
            option.min_amount = 25000.0;
            option.max_tenor_days = 180;
            option.liquidity = LiquidityTier::MEDIUM;

            InstrumentSpec swap;
            swap.name = "swap";
            swap.type = InstrumentType::SWAP;
            swap.cost_bps = 25.0;
            swap.effectiveness = 0.90;
            swap.min_amount = 100000.0;
            swap.max_tenor_days = 1825;
            swap.liquidity = LiquidityTier::MEDIUM;

            return {forward, option, swap};
        }

        std::vector<StressScenarioSpec> default_stress_scenarios()
        {
            return {
                {"2008 Financial Crisis", {{"EUR", -0.15}, {"GBP", -0.20}, {"JPY", 0.10}}},
                {"COVID-19 Pandemic", {{"EUR", -0.12}, {"GBP", -0.18}, {"AUD", -0.25}}},
                {"Brexit Referendum", {{"GBP", -0.30}, {"EUR", -0.08}}},
                {"Emerging Market Crisis", {{"BRL", -0.40}, {"TRY", -0.35}, {"ZAR", -0.30}}},
                {"USD Strength", {{"EUR", -0.10}, {"GBP", -0.12}, {"JPY", -0.08}, {"CAD", -0.15}}}};
        }

        std::vector<CostScenarioSpec> default_cost_scenarios()
        {
            return {
                {"Base Case", 0.50, -0.02},
                {"Adverse", 0.25, -0.10},
                {"Favorable", 0.15, 0.10},
                {"Extreme Adverse", 0.10, -0.25}};
        }

        // ============================================================================
        // RiskConfig
        // ============================================================================

        int RiskConfig::active_lookback() const
        {
            auto window = to_lower(lookback_window);
            if (window == "short")
                return short_lookback;
            if (window == "long")
                return long_lookback;
            if (window == "medium")
                return medium_lookback;
            throw std::invalid_argument("Unknown lookback window: " + lookback_window);
        }

        RiskConfig RiskConfig::default_config()
        {
            RiskConfig config;
            config.stress_scenarios = default_stress_scenarios();
            return config;
        }

        RiskConfig RiskConfig::from_json(const nlohmann::json &j)
        {
            RiskConfig config = default_config();
            config.confidence_levels = j.value("confidence_levels", config.confidence_levels);
            config.retained_returns = j.value("retained_returns", config.retained_returns);
            config.default_annual_volatility = j.value("default_annual_volatility", config.default_annual_volatility);

            if (j.contains("lookback"))
            {
                const auto &lb = j["lookback"];
                config.short_lookback = lb.value("short", config.short_lookback);
                config.medium_lookback = lb.value("medium", config.medium_lookback);
                config.long_lookback = lb.value("long", config.long_lookback);
                config.lookback_window = lb.value("window", config.lookback_window);
            }

            if (j.contains("monte_carlo"))
            {
                const auto &mc = j["monte_carlo"];
                config.monte_carlo_trials = mc.value("trials", config.monte_carlo_trials);
                config.monte_carlo_batches = mc.value("batches", config.monte_carlo_batches);
                config.correlated_draws = mc.value("correlated_draws", config.correlated_draws);
                if (mc.contains("seed") && !mc["seed"].is_null())
                {
                    config.random_seed = mc["seed"].get<std::uint64_t>();
                }
            }

            if (j.contains("thresholds"))
            {
                const auto &th = j["thresholds"];
                config.correlation_threshold = th.value("correlation", config.correlation_threshold);
                config.high_correlation_threshold = th.value("high_correlation", config.high_correlation_threshold);
                config.concentration_threshold = th.value("concentration", config.concentration_threshold);
                config.high_volatility_threshold = th.value("high_volatility", config.high_volatility_threshold);
            }

            if (j.contains("alerts"))
            {
                const auto &al = j["alerts"];
                config.var_alert_limit = al.value("var_limit", config.var_alert_limit);
                config.concentration_alert_limit = al.value("concentration_limit", config.concentration_alert_limit);
            }

            if (j.contains("stress_scenarios"))
            {
                config.stress_scenarios.clear();
                for (const auto &s : j["stress_scenarios"])
                {
                    config.stress_scenarios.push_back(StressScenarioSpec::from_json(s));
                }
            }

            return config;
        }

        nlohmann::json RiskConfig::to_json() const
        {
            nlohmann::json scenarios = nlohmann::json::array();
            for (const auto &s : stress_scenarios)
            {
                scenarios.push_back(s.to_json());
            }

            nlohmann::json mc = {
                {"trials", monte_carlo_trials},
                {"batches", monte_carlo_batches},
                {"correlated_draws", correlated_draws}};
            mc["seed"] = random_seed ? nlohmann::json(*random_seed) : nlohmann::json(nullptr);

            return {
                {"confidence_levels", confidence_levels},
                {"lookback", {{"short", short_lookback}, {"medium", medium_lookback}, {"long", long_lookback}, {"window", lookback_window}}},
                {"retained_returns", retained_returns},
                {"monte_carlo", mc},
                {"thresholds", {{"correlation", correlation_threshold}, {"high_correlation", high_correlation_threshold}, {"concentration", concentration_threshold}, {"high_volatility", high_volatility_threshold}}},
                {"default_annual_volatility", default_annual_volatility},
                {"alerts", {{"var_limit", var_alert_limit}, {"concentration_limit", concentration_alert_limit}}},
                {"stress_scenarios", scenarios}};
        }

        void RiskConfig::validate() const
        {
            if (confidence_levels.empty())
            {
                throw std::invalid_argument("At least one confidence level is required");
            }
            for (double c : confidence_levels)
            {
                if (c <= 0.0 || c >= 1.0)
                {
                    throw std::invalid_argument("Confidence level must be in (0, 1), got: " + std::to_string(c));
                }
            }
            if (short_lookback < 2 || medium_lookback < 2 || long_lookback < 2)
            {
                throw std::invalid_argument("Lookback windows need at least 2 observations");
            }
            active_lookback();
            if (retained_returns < 1)
            {
                throw std::invalid_argument("retained_returns must be positive, got: " + std::to_string(retained_returns));
            }
            if (monte_carlo_trials <= 0)
            {
                throw std::invalid_argument("Monte Carlo trial count must be positive, got: " + std::to_string(monte_carlo_trials));
            }
            if (monte_carlo_batches <= 0)
            {
                throw std::invalid_argument("Monte Carlo batch count must be positive, got: " + std::to_string(monte_carlo_batches));
            }
            require_fraction("correlation threshold", correlation_threshold);
            require_fraction("high correlation threshold", high_correlation_threshold);
            require_fraction("concentration threshold", concentration_threshold);
            require_positive("default annual volatility", default_annual_volatility);
            require_non_negative("high volatility threshold", high_volatility_threshold);
            require_non_negative("VaR alert limit", var_alert_limit);
            require_fraction("concentration alert limit", concentration_alert_limit);
        }

        // ============================================================================
        // HedgingConfig
        // ============================================================================

        HedgingConfig HedgingConfig::default_config()
        {
            HedgingConfig config;
            config.cost_scenarios = default_cost_scenarios();
            return config;
        }

        HedgingConfig HedgingConfig::from_json(const nlohmann::json &j)
        {
            HedgingConfig config = default_config();

            if (j.contains("needs"))
            {
                const auto &n = j["needs"];
                config.high_concentration_threshold = n.value("high_concentration", config.high_concentration_threshold);
                config.medium_volatility_threshold = n.value("medium_volatility", config.medium_volatility_threshold);
                config.low_concentration_threshold = n.value("low_concentration", config.low_concentration_threshold);
                config.low_volatility_threshold = n.value("low_volatility", config.low_volatility_threshold);
                config.high_ratio_cap = n.value("high_ratio_cap", config.high_ratio_cap);
                config.medium_ratio_cap = n.value("medium_ratio_cap", config.medium_ratio_cap);
                config.low_ratio_cap = n.value("low_ratio_cap", config.low_ratio_cap);
                config.high_priority_horizon = n.value("high_horizon_days", config.high_priority_horizon);
                config.medium_priority_horizon = n.value("medium_horizon_days", config.medium_priority_horizon);
                config.low_priority_horizon = n.value("low_horizon_days", config.low_priority_horizon);
            }

            if (j.contains("strategies"))
            {
                const auto &s = j["strategies"];
                config.combination_size_threshold = s.value("combination_size_threshold", config.combination_size_threshold);
                config.combination_forward_share = s.value("combination_forward_share", config.combination_forward_share);
                config.basket_min_needs = s.value("basket_min_needs", config.basket_min_needs);
                config.basket_cost_discount = s.value("basket_cost_discount", config.basket_cost_discount);
                config.basket_effectiveness = s.value("basket_effectiveness", config.basket_effectiveness);
                config.natural_hedge_effectiveness = s.value("natural_hedge_effectiveness", config.natural_hedge_effectiveness);
                config.natural_hedge_correlation = s.value("natural_hedge_correlation", config.natural_hedge_correlation);
                config.market_condition_adjustment = s.value("market_condition_adjustment", config.market_condition_adjustment);
                if (s.contains("profile") && !s["profile"].is_null())
                {
                    config.strategy_profile = parse_strategy_profile(s["profile"].get<std::string>());
                }
                if (s.contains("fallback_natural_pairs"))
                {
                    config.fallback_natural_pairs.clear();
                    for (const auto &pair : s["fallback_natural_pairs"])
                    {
                        if (!pair.is_array() || pair.size() != 2)
                        {
                            throw std::invalid_argument("fallback_natural_pairs entries must be [currency, currency]");
                        }
                        config.fallback_natural_pairs.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
                    }
                }
            }

            if (j.contains("costs"))
            {
                const auto &c = j["costs"];
                config.opportunity_cost_rate = c.value("opportunity_cost_rate", config.opportunity_cost_rate);
                config.transaction_fixed_fee = c.value("transaction_fixed_fee", config.transaction_fixed_fee);
                config.transaction_variable_bps = c.value("transaction_variable_bps", config.transaction_variable_bps);
            }

            if (j.contains("scenarios"))
            {
                config.cost_scenarios.clear();
                for (const auto &s : j["scenarios"])
                {
                    config.cost_scenarios.push_back(CostScenarioSpec::from_json(s));
                }
            }

            if (j.contains("ranking"))
            {
                const auto &r = j["ranking"];
                config.ranking.benefit_cost = r.value("benefit_cost", config.ranking.benefit_cost);
                config.ranking.risk_reduction = r.value("risk_reduction", config.ranking.risk_reduction);
                config.ranking.effectiveness = r.value("effectiveness", config.ranking.effectiveness);
                config.ranking.liquidity = r.value("liquidity", config.ranking.liquidity);
                config.ranking.simplicity = r.value("simplicity", config.ranking.simplicity);
                config.ranking.benefit_cost_cap = r.value("benefit_cost_cap", config.ranking.benefit_cost_cap);
            }

            config.max_alternatives = j.value("max_alternatives", config.max_alternatives);
            return config;
        }

        nlohmann::json HedgingConfig::to_json() const
        {
            nlohmann::json pairs = nlohmann::json::array();
            for (const auto &p : fallback_natural_pairs)
            {
                pairs.push_back({p.first, p.second});
            }

            nlohmann::json scenarios = nlohmann::json::array();
            for (const auto &s : cost_scenarios)
            {
                scenarios.push_back(s.to_json());
            }

            nlohmann::json profile = nullptr;
            if (strategy_profile)
            {
                profile = to_string(*strategy_profile);
            }

            return {
                {"needs", {{"high_concentration", high_concentration_threshold}, {"medium_volatility", medium_volatility_threshold}, {"low_concentration", low_concentration_threshold}, {"low_volatility", low_volatility_threshold}, {"high_ratio_cap", high_ratio_cap}, {"medium_ratio_cap", medium_ratio_cap}, {"low_ratio_cap", low_ratio_cap}, {"high_horizon_days", high_priority_horizon}, {"medium_horizon_days", medium_priority_horizon}, {"low_horizon_days", low_priority_horizon}}},
                {"strategies", {{"combination_size_threshold", combination_size_threshold}, {"combination_forward_share", combination_forward_share}, {"basket_min_needs", basket_min_needs}, {"basket_cost_discount", basket_cost_discount}, {"basket_effectiveness", basket_effectiveness}, {"natural_hedge_effectiveness", natural_hedge_effectiveness}, {"natural_hedge_correlation", natural_hedge_correlation}, {"profile", profile}, {"market_condition_adjustment", market_condition_adjustment}, {"fallback_natural_pairs", pairs}}},
                {"costs", {{"opportunity_cost_rate", opportunity_cost_rate}, {"transaction_fixed_fee", transaction_fixed_fee}, {"transaction_variable_bps", transaction_variable_bps}}},
                {"scenarios", scenarios},
                {"ranking", {{"benefit_cost", ranking.benefit_cost}, {"risk_reduction", ranking.risk_reduction}, {"effectiveness", ranking.effectiveness}, {"liquidity", ranking.liquidity}, {"simplicity", ranking.simplicity}, {"benefit_cost_cap", ranking.benefit_cost_cap}}},
                {"max_alternatives", max_alternatives}};
        }

        void HedgingConfig::validate() const
        {
            require_fraction("high concentration threshold", high_concentration_threshold);
            require_fraction("low concentration threshold", low_concentration_threshold);
            require_non_negative("medium volatility threshold", medium_volatility_threshold);
            require_non_negative("low volatility threshold", low_volatility_threshold);
            require_fraction("high ratio cap", high_ratio_cap);
            require_fraction("medium ratio cap", medium_ratio_cap);
            require_fraction("low ratio cap", low_ratio_cap);
            if (high_priority_horizon <= 0 || medium_priority_horizon <= 0 || low_priority_horizon <= 0)
            {
                throw std::invalid_argument("Hedging horizons must be positive");
            }
            require_non_negative("combination size threshold", combination_size_threshold);
            require_fraction("combination forward share", combination_forward_share);
            if (basket_min_needs < 2)
            {
                throw std::invalid_argument("basket_min_needs must be at least 2, got: " + std::to_string(basket_min_needs));
            }
            require_fraction("basket cost discount", basket_cost_discount);
            require_fraction("basket effectiveness", basket_effectiveness);
            require_fraction("natural hedge effectiveness", natural_hedge_effectiveness);
            if (natural_hedge_correlation >= 0.0 || natural_hedge_correlation < -1.0)
            {
                throw std::invalid_argument("natural_hedge_correlation must be in [-1, 0), got: " +
                                            std::to_string(natural_hedge_correlation));
            }
            require_non_negative("opportunity cost rate", opportunity_cost_rate);
            require_non_negative("transaction fixed fee", transaction_fixed_fee);
            require_non_negative("transaction variable bps", transaction_variable_bps);
            for (const auto &s : cost_scenarios)
            {
                require_fraction("Scenario '" + s.name + "' probability", s.probability);
            }
            if (ranking.benefit_cost_cap <= 0.0)
            {
                throw std::invalid_argument("benefit_cost_cap must be positive");
            }
            if (max_alternatives < 0)
            {
                throw std::invalid_argument("max_alternatives must be non-negative");
            }
        }

        // ============================================================================
        // OptimizerConfig
        // ============================================================================

        OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
        {
            OptimizerConfig config;

            if (j.contains("hedge_ratio_range"))
            {
                const auto &r = j["hedge_ratio_range"];
                config.min_hedge_ratio = r.value("min", config.min_hedge_ratio);
                config.max_hedge_ratio = r.value("max", config.max_hedge_ratio);
            }

            config.grid_step = j.value("grid_step", config.grid_step);
            config.gradient_epsilon = j.value("gradient_epsilon", config.gradient_epsilon);
            config.learning_rate = j.value("learning_rate", config.learning_rate);
            config.convergence_threshold = j.value("convergence_threshold", config.convergence_threshold);
            config.max_iterations = j.value("max_iterations", config.max_iterations);
            config.parallel = j.value("parallel", config.parallel);

            if (j.contains("utility"))
            {
                const auto &u = j["utility"];
                config.risk_weight = u.value("risk_weight", config.risk_weight);
                config.cost_weight = u.value("cost_weight", config.cost_weight);
                config.effectiveness_weight = u.value("effectiveness_weight", config.effectiveness_weight);
                config.cost_normalization = u.value("cost_normalization", config.cost_normalization);
                config.moderation_penalty = u.value("moderation_penalty", config.moderation_penalty);
            }

            return config;
        }

        nlohmann::json OptimizerConfig::to_json() const
        {
            return {
                {"hedge_ratio_range", {{"min", min_hedge_ratio}, {"max", max_hedge_ratio}}},
                {"grid_step", grid_step},
                {"gradient_epsilon", gradient_epsilon},
                {"learning_rate", learning_rate},
                {"convergence_threshold", convergence_threshold},
                {"max_iterations", max_iterations},
                {"parallel", parallel},
                {"utility", {{"risk_weight", risk_weight}, {"cost_weight", cost_weight}, {"effectiveness_weight", effectiveness_weight}, {"cost_normalization", cost_normalization}, {"moderation_penalty", moderation_penalty}}}};
        }

        void OptimizerConfig::validate() const
        {
            require_fraction("min hedge ratio", min_hedge_ratio);
            require_fraction("max hedge ratio", max_hedge_ratio);
            if (min_hedge_ratio > max_hedge_ratio)
            {
                throw std::invalid_argument("min hedge ratio (" + std::to_string(min_hedge_ratio) +
                                            ") exceeds max hedge ratio (" + std::to_string(max_hedge_ratio) + ")");
            }
            require_positive("grid step", grid_step);
            require_positive("gradient epsilon", gradient_epsilon);
            require_positive("learning rate", learning_rate);
            require_positive("convergence threshold", convergence_threshold);
            if (max_iterations < 0)
            {
                throw std::invalid_argument("max_iterations must be non-negative, got: " + std::to_string(max_iterations));
            }
            require_non_negative("risk weight", risk_weight);
            require_non_negative("cost weight", cost_weight);
            require_non_negative("effectiveness weight", effectiveness_weight);
            require_positive("cost normalization", cost_normalization);
            require_non_negative("moderation penalty", moderation_penalty);
        }

        // ============================================================================
        // EngineConfig
        // ============================================================================

        EngineConfig EngineConfig::default_config()
        {
            EngineConfig config;
            config.risk = RiskConfig::default_config();
            config.hedging = HedgingConfig::default_config();
            config.optimizer = OptimizerConfig();
            config.instruments = default_instrument_catalog();
            return config;
        }

        EngineConfig EngineConfig::from_json(const nlohmann::json &j)
        {
            EngineConfig config = default_config();

            if (j.contains("risk"))
            {
                config.risk = RiskConfig::from_json(j["risk"]);
            }
            if (j.contains("hedging"))
            {
                config.hedging = HedgingConfig::from_json(j["hedging"]);
            }
            if (j.contains("optimizer"))
            {
                config.optimizer = OptimizerConfig::from_json(j["optimizer"]);
            }
            if (j.contains("instruments"))
            {
                config.instruments.clear();
                for (const auto &inst : j["instruments"])
                {
                    config.instruments.push_back(InstrumentSpec::from_json(inst));
                }
            }
            config.pricing_model = j.value("pricing_model", config.pricing_model);

            config.validate();
            return config;
        }

        nlohmann::json EngineConfig::to_json() const
        {
            nlohmann::json catalog = nlohmann::json::array();
            for (const auto &inst : instruments)
            {
                catalog.push_back(inst.to_json());
            }

            return {
                {"risk", risk.to_json()},
                {"hedging", hedging.to_json()},
                {"optimizer", optimizer.to_json()},
                {"instruments", catalog},
                {"pricing_model", pricing_model}};
        }

        void EngineConfig::validate() const
        {
            risk.validate();
            hedging.validate();
            optimizer.validate();

            if (instruments.empty())
            {
                throw std::invalid_argument("Instrument catalog must not be empty");
            }
            for (const auto &inst : instruments)
            {
                inst.validate();
            }

            if (pricing_model != "basis_points" && pricing_model != "option_premium")
            {
                throw std::invalid_argument("Expected one of 'basis_points','option_premium' for parameter 'pricing_model', got: " +
                                            pricing_model);
            }
        }

        const InstrumentSpec *EngineConfig::find_instrument(InstrumentType type) const
        {
            for (const auto &inst : instruments)
            {
                if (inst.type == type)
                {
                    return &inst;
                }
            }
            return nullptr;
        }

    } // namespace config
} // namespace fxhedge
