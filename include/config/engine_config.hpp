/**
 * @file engine_config.hpp
 * @brief Configuration for the risk engine, hedging analysis and hedge-ratio optimizer
 *
 * One EngineConfig is built (usually from JSON) and handed to every component
 * at construction. Every field has a default, so a partial JSON document only
 * overrides the values it names.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fxhedge
{
    namespace config
    {

        /**
         * @enum InstrumentType
         * @brief Hedging instrument families carried in the catalog
         */
        enum class InstrumentType
        {
            FORWARD,
            OPTION,
            SWAP
        };

        /**
         * @enum LiquidityTier
         * @brief Market depth class of an instrument
         */
        enum class LiquidityTier
        {
            LOW,
            MEDIUM,
            HIGH
        };

        std::string to_string(InstrumentType type);
        InstrumentType parse_instrument_type(const std::string &str);

        std::string to_string(LiquidityTier tier);
        LiquidityTier parse_liquidity_tier(const std::string &str);

        /**
         * @brief Ranking score for a liquidity tier (high 1.0, medium 0.6, low 0.3)
         */
        double liquidity_score(LiquidityTier tier);

        /**
         * @enum StrategyProfile
         * @brief Named hedging stance selecting a StrategyTemplate
         */
        enum class StrategyProfile
        {
            CONSERVATIVE,
            BALANCED,
            AGGRESSIVE,
            DYNAMIC
        };

        std::string to_string(StrategyProfile profile);
        StrategyProfile parse_strategy_profile(const std::string &str);

        /**
         * @struct StrategyTemplate
         * @brief Instrument preferences and cost ceiling of a strategy profile
         *
         * | Profile      | Ratio | Instruments             | Target | Max cost |
         * |--------------|-------|-------------------------|--------|----------|
         * | conservative | 0.8   | forward, swap           | 0.7    | 2.0%     |
         * | balanced     | 0.5   | forward, option         | 0.5    | 1.5%     |
         * | aggressive   | 0.3   | option, natural         | 0.3    | 1.0%     |
         * | dynamic      | 0.6   | forward, option, swap   | 0.6    | 2.5%     |
         *
         * The dynamic profile also turns on the market-condition effectiveness
         * adjustment.
         */
        struct StrategyTemplate
        {
            StrategyProfile profile = StrategyProfile::BALANCED;
            std::string name;
            double default_hedge_ratio = 0.5;       ///< Upper bound on a candidate's starting ratio
            std::vector<InstrumentType> instruments; ///< Catalog families the profile may use
            bool natural_hedges = false;
            double risk_reduction_target = 0.5;     ///< Expected hedge_ratio x effectiveness
            double max_cost_fraction = 0.015;       ///< Candidate cost / exposure ceiling

            bool allows(InstrumentType type) const;

            static StrategyTemplate for_profile(StrategyProfile profile);
            nlohmann::json to_json() const;
        };

        /**
         * @struct InstrumentSpec
         * @brief One entry of the hedge-instrument catalog
         */
        struct InstrumentSpec
        {
            std::string name;                            ///< Catalog key (e.g. "forward")
            InstrumentType type = InstrumentType::FORWARD;
            double cost_bps = 0.0;                       ///< Cost in basis points of notional
            double effectiveness = 0.0;                  ///< Fraction of risk removed, in [0, 1]
            double min_amount = 0.0;                     ///< Minimum tradeable notional
            int max_tenor_days = 0;                      ///< Longest available tenor
            LiquidityTier liquidity = LiquidityTier::MEDIUM;

            static InstrumentSpec from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
            void validate() const;
        };

        /**
         * @struct StressScenarioSpec
         * @brief Named historical scenario: currency -> signed shock (fraction)
         */
        struct StressScenarioSpec
        {
            std::string name;
            std::map<std::string, double> shocks;

            static StressScenarioSpec from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct CostScenarioSpec
         * @brief Macro scenario used in cost-benefit scenario analysis
         */
        struct CostScenarioSpec
        {
            std::string name;
            double probability = 0.0;
            double market_move = 0.0; ///< Signed move of the foreign currency (fraction)

            static CostScenarioSpec from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskConfig
         * @brief Parameters of the currency risk assessment
         */
        struct RiskConfig
        {
            std::vector<double> confidence_levels{0.95, 0.99};
            int short_lookback = 30;
            int medium_lookback = 90;
            int long_lookback = 252;
            std::string lookback_window = "medium"; ///< short, medium or long
            int retained_returns = 30;              ///< Recent returns kept on each volatility profile

            int monte_carlo_trials = 10000;
            int monte_carlo_batches = 8;
            std::optional<std::uint64_t> random_seed;
            bool correlated_draws = false; ///< Apply a Cholesky factor to Monte Carlo draws

            double correlation_threshold = 0.7;
            double high_correlation_threshold = 0.8;
            double concentration_threshold = 0.25;
            double default_annual_volatility = 0.15;
            double high_volatility_threshold = 0.20;

            double var_alert_limit = 100000.0;
            double concentration_alert_limit = 0.40;

            std::vector<StressScenarioSpec> stress_scenarios;

            /**
             * @brief Number of price observations for the active lookback window
             */
            int active_lookback() const;

            static RiskConfig default_config();
            static RiskConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
            void validate() const;
        };

        /**
         * @struct RankingWeights
         * @brief Blend weights of the final strategy ranking score
         */
        struct RankingWeights
        {
            double benefit_cost = 0.35;
            double risk_reduction = 0.25;
            double effectiveness = 0.20;
            double liquidity = 0.10;
            double simplicity = 0.10;
            double benefit_cost_cap = 10.0; ///< Benefit-cost ratio that earns the full component
        };

        /**
         * @struct HedgingConfig
         * @brief Need thresholds, strategy construction and cost-benefit parameters
         */
        struct HedgingConfig
        {
            // Need classification
            double high_concentration_threshold = 0.25;
            double medium_volatility_threshold = 0.20;
            double low_concentration_threshold = 0.15;
            double low_volatility_threshold = 0.15;
            double high_ratio_cap = 0.8;
            double medium_ratio_cap = 0.6;
            double low_ratio_cap = 0.4;
            int high_priority_horizon = 90;
            int medium_priority_horizon = 180;
            int low_priority_horizon = 365;

            // Strategy construction
            double combination_size_threshold = 100000.0;
            double combination_forward_share = 0.7;
            int basket_min_needs = 3;
            double basket_cost_discount = 0.8;
            double basket_effectiveness = 0.75;
            double natural_hedge_effectiveness = 0.7;
            double natural_hedge_correlation = -0.3;
            std::vector<std::pair<std::string, std::string>> fallback_natural_pairs{
                {"AUD", "JPY"}, {"NZD", "JPY"}, {"CAD", "JPY"}};
            std::optional<StrategyProfile> strategy_profile; ///< Unset: every catalog instrument, no cost ceiling
            bool market_condition_adjustment = false;         ///< Scale effectiveness by volatility and liquidity

            // Cost-benefit
            double opportunity_cost_rate = 0.02;
            double transaction_fixed_fee = 50.0;
            double transaction_variable_bps = 2.0;
            std::vector<CostScenarioSpec> cost_scenarios;
            RankingWeights ranking;
            int max_alternatives = 3;

            static HedgingConfig default_config();
            static HedgingConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
            void validate() const;
        };

        /**
         * @struct OptimizerConfig
         * @brief Hedge-ratio search parameters
         */
        struct OptimizerConfig
        {
            double min_hedge_ratio = 0.25;
            double max_hedge_ratio = 1.0;
            double grid_step = 0.1;
            double gradient_epsilon = 1e-3;
            double learning_rate = 0.05;
            double convergence_threshold = 1e-4;
            int max_iterations = 1000;

            double risk_weight = 0.6;
            double cost_weight = 0.3;
            double effectiveness_weight = 0.1;
            double cost_normalization = 0.01; ///< Cost/exposure fraction at which the cost score reaches 0
            double moderation_penalty = 0.0;  ///< Penalty per unit of |ratio - 0.5|

            bool parallel = true;

            static OptimizerConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
            void validate() const;
        };

        /**
         * @struct EngineConfig
         * @brief Complete engine configuration
         */
        struct EngineConfig
        {
            RiskConfig risk;
            HedgingConfig hedging;
            OptimizerConfig optimizer;
            std::vector<InstrumentSpec> instruments;
            std::string pricing_model = "basis_points"; ///< basis_points or option_premium

            /**
             * @brief Configuration with the default instrument catalog and scenario sets
             */
            static EngineConfig default_config();

            /**
             * @brief Build from JSON; absent sections keep their defaults
             * @throws std::invalid_argument if the resulting configuration is inconsistent
             */
            static EngineConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;

            /**
             * @brief Check cross-field consistency
             * @throws std::invalid_argument describing the first violation found
             */
            void validate() const;

            /**
             * @brief First catalog entry of a given type, or nullptr
             */
            const InstrumentSpec *find_instrument(InstrumentType type) const;
        };

        std::vector<InstrumentSpec> default_instrument_catalog();
        std::vector<StressScenarioSpec> default_stress_scenarios();
        std::vector<CostScenarioSpec> default_cost_scenarios();

    } // namespace config
} // namespace fxhedge
