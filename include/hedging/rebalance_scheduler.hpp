#pragma once

#include "hedging/hedging_types.hpp"

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fxhedge {
namespace hedging {

enum class RebalanceFrequency {
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUALLY
};

std::string to_string(RebalanceFrequency frequency);

struct RebalanceConfig {
    double drift_threshold = 0.05;           // hedge ratio drift that forces a rebalance
    double exposure_change_threshold = 0.10; // relative exposure change that forces a rebalance

    // Shorter hedges are reviewed more often
    static RebalanceFrequency frequency_for_horizon(int horizon_days);
};

struct RebalanceSchedule {
    std::string strategy_id;
    RebalanceFrequency frequency = RebalanceFrequency::MONTHLY;
    std::string next_rebalance;
    std::vector<std::string> triggers;
    double drift_threshold = 0.0;

    nlohmann::json to_json() const;
};

class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    // Schedule for a strategy starting on start_date (YYYY-MM-DD); the
    // frequency follows the strategy horizon
    RebalanceSchedule schedule(const StrategyCandidate& strategy, const std::string& start_date) const;

    std::string next_rebalance_date(const std::string& from_date, RebalanceFrequency frequency) const;

    const RebalanceConfig& config() const { return config_; }

private:
    RebalanceConfig config_;
};

} // namespace hedging
} // namespace fxhedge
