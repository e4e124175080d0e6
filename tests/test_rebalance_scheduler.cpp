#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "hedging/rebalance_scheduler.hpp"
#include <nlohmann/json.hpp>

using namespace fxhedge::hedging;

TEST_CASE("RebalanceScheduler schedule for a strategy", "[RebalanceScheduler]") {
    RebalanceScheduler s{RebalanceConfig{}};

    StrategyCandidate forward;
    forward.id = "single-EUR-forward";
    forward.type = StrategyType::SINGLE;
    forward.time_horizon = 90;

    RebalanceSchedule sched = s.schedule(forward, "2024-01-01");
    REQUIRE(sched.strategy_id == "single-EUR-forward");
    REQUIRE(sched.frequency == RebalanceFrequency::MONTHLY);
    REQUIRE(sched.next_rebalance == "2024-01-31");
    REQUIRE(sched.drift_threshold == Catch::Approx(0.05));
    REQUIRE(sched.triggers.size() == 3);
    REQUIRE(sched.triggers[0] == "Calendar: monthly");
    REQUIRE(sched.triggers[1] == "Hedge ratio drift > 5.0%");
    REQUIRE(sched.triggers[2] == "Exposure change > 10.0%");

    // Leap year: 91 days from Jan 1
    forward.time_horizon = 365;
    sched = s.schedule(forward, "2024-01-01");
    REQUIRE(sched.frequency == RebalanceFrequency::QUARTERLY);
    REQUIRE(sched.next_rebalance == "2024-04-01");

    StrategyCandidate natural;
    natural.id = "natural-AUD-JPY";
    natural.type = StrategyType::NATURAL;
    natural.time_horizon = 180;
    sched = s.schedule(natural, "2024-01-01");
    REQUIRE(sched.triggers.size() == 4);
    REQUIRE(sched.to_json()["frequency"] == "quarterly");

    REQUIRE(RebalanceConfig::frequency_for_horizon(30) == RebalanceFrequency::WEEKLY);
    REQUIRE(RebalanceConfig::frequency_for_horizon(1825) == RebalanceFrequency::ANNUALLY);
    REQUIRE(s.next_rebalance_date("2024-12-25", RebalanceFrequency::WEEKLY) == "2025-01-01");
}

TEST_CASE("RebalanceScheduler configuration", "[RebalanceScheduler]") {
    RebalanceConfig cfg;
    cfg.drift_threshold = 0.08;
    cfg.exposure_change_threshold = 0.2;

    StrategyCandidate forward;
    forward.id = "single-EUR-forward";
    forward.time_horizon = 30;

    RebalanceScheduler s(cfg);
    RebalanceSchedule sched = s.schedule(forward, "2024-01-01");
    REQUIRE(sched.frequency == RebalanceFrequency::WEEKLY);
    REQUIRE(sched.next_rebalance == "2024-01-08");
    REQUIRE(sched.drift_threshold == Catch::Approx(0.08));
    REQUIRE(sched.triggers[1] == "Hedge ratio drift > 8.0%");
    REQUIRE(sched.triggers[2] == "Exposure change > 20.0%");

    SECTION("Error: negative threshold") {
        cfg.drift_threshold = -0.1;
        REQUIRE_THROWS_AS(RebalanceScheduler(cfg), std::invalid_argument);
    }

    SECTION("Error: malformed start date") {
        REQUIRE_THROWS_AS(s.schedule(forward, "2024-1-5"), std::invalid_argument);
    }
}
