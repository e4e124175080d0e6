/**
 * @file implementation_planner.hpp
 * @brief Phased rollout plan for a recommended strategy
 */

#pragma once

#include "hedging/hedging_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fxhedge
{
    namespace hedging
    {

        struct ImplementationPhase
        {
            int number = 0;
            std::string name;
            int duration_days = 0;
            std::vector<std::string> tasks;
            std::vector<std::string> deliverables;

            nlohmann::json to_json() const;
        };

        struct MonitoringPlan
        {
            std::string frequency;
            std::vector<std::string> metrics;
            std::vector<std::string> review_triggers;

            nlohmann::json to_json() const;
        };

        /**
         * @struct ImplementationPlan
         */
        struct ImplementationPlan
        {
            std::string strategy_id;
            std::vector<ImplementationPhase> phases;
            std::vector<std::string> prerequisites;
            std::vector<std::string> risks;
            MonitoringPlan monitoring;

            /**
             * @brief Sum of phase durations in days
             */
            int timeline_days() const;

            nlohmann::json to_json() const;
        };

        /**
         * @class ImplementationPlanner
         * @brief Preparation (2 days), execution (1 day), monitoring (strategy horizon)
         */
        class ImplementationPlanner
        {
        public:
            /**
             * @param large_hedge_threshold Exposure above which board approval is a prerequisite
             */
            explicit ImplementationPlanner(double large_hedge_threshold = 1000000.0);

            ImplementationPlan plan(const StrategyCandidate &strategy) const;

            std::vector<std::string> prerequisites(const StrategyCandidate &strategy) const;
            std::vector<std::string> risks(const StrategyCandidate &strategy) const;

            std::string get_name() const { return "ImplementationPlanner"; }

        private:
            double large_hedge_threshold_;
        };

    } // namespace hedging
} // namespace fxhedge
