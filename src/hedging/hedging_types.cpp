#include "hedging/hedging_types.hpp"

#include <stdexcept>

namespace fxhedge
{
    namespace hedging
    {

        std::string to_string(Priority priority)
        {
            switch (priority)
            {
            case Priority::HIGH:
                return "high";
            case Priority::MEDIUM:
                return "medium";
            case Priority::LOW:
                return "low";
            }
            return "low";
        }

        std::string to_string(StrategyType type)
        {
            switch (type)
            {
            case StrategyType::SINGLE:
                return "single";
            case StrategyType::COMBINATION:
                return "combination";
            case StrategyType::BASKET:
                return "basket";
            case StrategyType::NATURAL:
                return "natural";
            }
            return "single";
        }

        nlohmann::json HedgingNeed::to_json() const
        {
            return {
                {"currency", currency},
                {"exposure", exposure},
                {"relative_exposure", relative_exposure},
                {"priority", to_string(priority)},
                {"risk_contribution", risk_contribution},
                {"volatility", volatility},
                {"recommended_hedge_ratio", recommended_hedge_ratio},
                {"time_horizon", time_horizon},
                {"urgency", urgency},
                {"reason", reason}};
        }

        nlohmann::json InstrumentAllocation::to_json() const
        {
            return {
                {"instrument", instrument},
                {"currency", currency},
                {"amount", amount},
                {"portion", portion},
                {"cost", cost},
                {"effectiveness", effectiveness}};
        }

        std::vector<std::string> StrategyCandidate::hedged_currencies() const
        {
            if (type == StrategyType::NATURAL && !currencies.empty())
            {
                return {currencies.front()};
            }
            return currencies;
        }

        const std::string &StrategyCandidate::primary_currency() const
        {
            if (currencies.empty())
            {
                throw std::logic_error("Strategy " + id + " has no currency");
            }
            return currencies.front();
        }

        nlohmann::json StrategyCandidate::to_json() const
        {
            nlohmann::json legs = nlohmann::json::array();
            for (const auto &a : allocations)
            {
                legs.push_back(a.to_json());
            }
            return {
                {"id", id},
                {"type", to_string(type)},
                {"currencies", currencies},
                {"exposure", exposure},
                {"allocations", legs},
                {"hedge_ratio", hedge_ratio},
                {"time_horizon", time_horizon},
                {"cost", cost},
                {"direct_cost", direct_cost()},
                {"effectiveness", effectiveness},
                {"liquidity", config::to_string(liquidity)},
                {"utility", utility}};
        }

    } // namespace hedging
} // namespace fxhedge
