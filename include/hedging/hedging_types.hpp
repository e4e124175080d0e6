/**
 * @file hedging_types.hpp
 * @brief Hedging needs and strategy candidates
 */

#pragma once

#include "config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fxhedge
{
    namespace hedging
    {

        enum class Priority
        {
            LOW,
            MEDIUM,
            HIGH
        };

        std::string to_string(Priority priority);

        /**
         * @struct HedgingNeed
         * @brief An exposure that requires hedging
         */
        struct HedgingNeed
        {
            std::string currency;
            double exposure = 0.0;          ///< Absolute exposure in base currency
            double relative_exposure = 0.0; ///< Share of total foreign exposure
            Priority priority = Priority::LOW;
            double risk_contribution = 0.0;       ///< Individual risk factor (exposure x daily vol)
            double volatility = 0.0;              ///< Annual volatility
            double recommended_hedge_ratio = 0.0; ///< In [0, 1]
            int time_horizon = 0;                 ///< Days
            std::string urgency;                  ///< immediate, within_30_days or monitor
            std::string reason;

            nlohmann::json to_json() const;
        };

        enum class StrategyType
        {
            SINGLE,
            COMBINATION,
            BASKET,
            NATURAL
        };

        std::string to_string(StrategyType type);

        /**
         * @struct InstrumentAllocation
         * @brief One leg of a strategy
         *
         * Amount and cost are quoted at full coverage (hedge ratio 1); the
         * cost actually incurred scales with the strategy's hedge ratio.
         */
        struct InstrumentAllocation
        {
            std::string instrument; ///< Catalog name, or "natural"
            std::string currency;
            double amount = 0.0;  ///< Notional covered by this leg
            double portion = 0.0; ///< Share of the strategy exposure
            double cost = 0.0;
            double effectiveness = 0.0;

            nlohmann::json to_json() const;
        };

        /**
         * @struct StrategyCandidate
         * @brief A hedging strategy proposed for one or more needs
         */
        struct StrategyCandidate
        {
            std::string id;
            StrategyType type = StrategyType::SINGLE;
            std::vector<std::string> currencies; ///< For natural hedges the offset (larger) currency comes first
            double exposure = 0.0;
            std::vector<InstrumentAllocation> allocations;
            double hedge_ratio = 0.0;
            int time_horizon = 0;
            double cost = 0.0;          ///< Sum of allocation costs at full coverage
            double effectiveness = 0.0; ///< Portion-weighted effectiveness
            config::LiquidityTier liquidity = config::LiquidityTier::MEDIUM;
            double utility = 0.0; ///< Utility at hedge_ratio, set by the optimizer

            /**
             * @brief Currencies whose risk the strategy reduces
             *
             * A natural hedge reduces the risk of its first (larger) currency
             * only; every other strategy covers all of its currencies.
             */
            std::vector<std::string> hedged_currencies() const;

            const std::string &primary_currency() const;

            /**
             * @brief Direct cost at the current hedge ratio
             */
            double direct_cost() const { return cost * hedge_ratio; }

            nlohmann::json to_json() const;
        };

    } // namespace hedging
} // namespace fxhedge
