#include "hedging/rebalance_scheduler.hpp"

#include "common/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace fxhedge {
namespace hedging {

std::string to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
        case RebalanceFrequency::QUARTERLY: return "quarterly";
        case RebalanceFrequency::ANNUALLY: return "annually";
    }
    return "monthly";
}

RebalanceFrequency RebalanceConfig::frequency_for_horizon(int horizon_days) {
    if (horizon_days <= 30) return RebalanceFrequency::WEEKLY;
    if (horizon_days <= 90) return RebalanceFrequency::MONTHLY;
    if (horizon_days <= 365) return RebalanceFrequency::QUARTERLY;
    return RebalanceFrequency::ANNUALLY;
}

nlohmann::json RebalanceSchedule::to_json() const {
    return {
        {"strategy_id", strategy_id},
        {"frequency", to_string(frequency)},
        {"next_rebalance", next_rebalance},
        {"triggers", triggers},
        {"drift_threshold", drift_threshold}};
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config) {
    if (config_.drift_threshold < 0.0 || config_.exposure_change_threshold < 0.0) {
        throw std::invalid_argument("Rebalance thresholds must be non-negative");
    }
}

std::string RebalanceScheduler::next_rebalance_date(const std::string& from_date,
                                                    RebalanceFrequency frequency) const {
    switch (frequency) {
        case RebalanceFrequency::WEEKLY: return common::add_days(from_date, 7);
        case RebalanceFrequency::MONTHLY: return common::add_days(from_date, 30);
        case RebalanceFrequency::QUARTERLY: return common::add_days(from_date, 91);
        case RebalanceFrequency::ANNUALLY: return common::add_days(from_date, 365);
    }
    return common::add_days(from_date, 30);
}

RebalanceSchedule RebalanceScheduler::schedule(const StrategyCandidate& strategy,
                                               const std::string& start_date) const {
    RebalanceSchedule s;
    s.strategy_id = strategy.id;
    s.frequency = RebalanceConfig::frequency_for_horizon(strategy.time_horizon);
    s.next_rebalance = next_rebalance_date(start_date, s.frequency);
    s.drift_threshold = config_.drift_threshold;

    std::ostringstream drift;
    drift << "Hedge ratio drift > " << std::fixed << std::setprecision(1) << config_.drift_threshold * 100.0 << "%";
    std::ostringstream exposure;
    exposure << "Exposure change > " << std::fixed << std::setprecision(1) << config_.exposure_change_threshold * 100.0 << "%";

    s.triggers = {"Calendar: " + to_string(s.frequency), drift.str(), exposure.str()};
    if (strategy.type == StrategyType::NATURAL) {
        s.triggers.push_back("Correlation above natural hedge threshold");
    }
    return s;
}

} // namespace hedging
} // namespace fxhedge
