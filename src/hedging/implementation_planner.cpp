#include "hedging/implementation_planner.hpp"

#include <algorithm>

namespace fxhedge
{
    namespace hedging
    {

        namespace
        {
            bool uses_instrument(const StrategyCandidate &s, const std::string &name)
            {
                return std::any_of(s.allocations.begin(), s.allocations.end(),
                                   [&name](const InstrumentAllocation &a)
                                   { return a.instrument == name; });
            }
        }

        nlohmann::json ImplementationPhase::to_json() const
        {
            return {
                {"phase", number},
                {"name", name},
                {"duration", duration_days},
                {"tasks", tasks},
                {"deliverables", deliverables}};
        }

        nlohmann::json MonitoringPlan::to_json() const
        {
            return {
                {"frequency", frequency},
                {"metrics", metrics},
                {"review_triggers", review_triggers}};
        }

        int ImplementationPlan::timeline_days() const
        {
            int total = 0;
            for (const auto &p : phases)
            {
                total += p.duration_days;
            }
            return total;
        }

        nlohmann::json ImplementationPlan::to_json() const
        {
            nlohmann::json phase_list = nlohmann::json::array();
            for (const auto &p : phases)
            {
                phase_list.push_back(p.to_json());
            }
            return {
                {"strategy_id", strategy_id},
                {"phases", phase_list},
                {"prerequisites", prerequisites},
                {"risks", risks},
                {"monitoring_plan", monitoring.to_json()},
                {"timeline", timeline_days()}};
        }

        ImplementationPlanner::ImplementationPlanner(double large_hedge_threshold)
            : large_hedge_threshold_(large_hedge_threshold)
        {
        }

        std::vector<std::string> ImplementationPlanner::prerequisites(const StrategyCandidate &strategy) const
        {
            std::vector<std::string> out{"Hedging policy approval"};

            if (strategy.type == StrategyType::NATURAL)
            {
                out.push_back("Operational cash-flow matching review");
                return out;
            }

            out.push_back("Counterparty credit lines");
            if (uses_instrument(strategy, "option"))
                out.push_back("Options trading authorization");
            if (uses_instrument(strategy, "swap"))
                out.push_back("ISDA master agreement");
            if (strategy.type == StrategyType::BASKET)
                out.push_back("Portfolio-level hedge documentation");
            if (strategy.exposure > large_hedge_threshold_)
                out.push_back("Board approval for large hedge");
            return out;
        }

        std::vector<std::string> ImplementationPlanner::risks(const StrategyCandidate &strategy) const
        {
            std::vector<std::string> out;

            if (strategy.type == StrategyType::NATURAL)
            {
                out.push_back("Correlation breakdown");
                out.push_back("Exposure mismatch over time");
                return out;
            }

            out.push_back("Counterparty default");
            out.push_back("Basis risk");
            if (strategy.liquidity != config::LiquidityTier::HIGH)
                out.push_back("Limited liquidity when unwinding");
            if (uses_instrument(strategy, "option"))
                out.push_back("Premium decay");
            if (strategy.type == StrategyType::COMBINATION || strategy.type == StrategyType::BASKET)
                out.push_back("Operational complexity");
            return out;
        }

        ImplementationPlan ImplementationPlanner::plan(const StrategyCandidate &strategy) const
        {
            ImplementationPlan p;
            p.strategy_id = strategy.id;

            ImplementationPhase preparation;
            preparation.number = 1;
            preparation.name = "Preparation";
            preparation.duration_days = 2;
            preparation.tasks = {"Confirm exposure amounts", "Obtain approvals", "Select counterparties"};
            preparation.deliverables = {"Approved hedge mandate", "Counterparty shortlist"};
            p.phases.push_back(preparation);

            ImplementationPhase execution;
            execution.number = 2;
            execution.name = "Initial Execution";
            execution.duration_days = 1;
            execution.tasks = {"Request quotes", "Execute hedge trades", "Confirm settlement details"};
            execution.deliverables = {"Trade confirmations", "Hedge documentation"};
            p.phases.push_back(execution);

            ImplementationPhase monitoring;
            monitoring.number = 3;
            monitoring.name = "Ongoing Monitoring";
            monitoring.duration_days = strategy.time_horizon;
            monitoring.tasks = {"Track hedge effectiveness", "Mark positions to market", "Rebalance on triggers"};
            monitoring.deliverables = {"Effectiveness reports", "Rebalance log"};
            p.phases.push_back(monitoring);

            p.prerequisites = prerequisites(strategy);
            p.risks = risks(strategy);

            p.monitoring.frequency = strategy.time_horizon <= 90 ? "weekly" : "monthly";
            p.monitoring.metrics = {"Hedge effectiveness", "Mark-to-market P&L", "Basis tracking", "Correlation stability"};
            p.monitoring.review_triggers = {"Effectiveness below 80%", "Exposure change above 10%"};
            return p;
        }

    } // namespace hedging
} // namespace fxhedge
