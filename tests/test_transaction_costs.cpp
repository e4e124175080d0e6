// Unit tests for TransactionCostModel

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "hedging/transaction_cost_model.hpp"

#include <cmath>

using namespace fxhedge::hedging;
using Catch::Matchers::WithinAbs;

TEST_CASE("TransactionCostModel construction", "[TransactionCostModel]") {
    SECTION("Default config") {
        TransactionCostModel m;
        REQUIRE(m.get_name() == "TransactionCostModel");
        REQUIRE(m.config().fixed_fee == 50.0);
        REQUIRE(m.config().variable_bps == 2.0);
    }

    SECTION("Config from JSON") {
        nlohmann::json j = {{"fixed_fee", 25.0}};
        TransactionCostConfig cfg = TransactionCostConfig::from_json(j);
        REQUIRE(cfg.fixed_fee == 25.0);
        REQUIRE(cfg.variable_bps == 2.0);
    }

    SECTION("Error: negative fixed fee") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.fixed_fee = -1.0;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }

    SECTION("Error: negative variable fee") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.variable_bps = -0.5;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }
}

TEST_CASE("Per-leg cost", "[TransactionCostModel]") {
    TransactionCostModel m(TransactionCostConfig::default_config());

    HedgeOrder forward{"forward", "EUR", 100000.0};
    HedgeTradeCost c = m.calculate_cost(forward);
    REQUIRE_THAT(c.fixed_fee, WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(c.variable_fee, WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(c.total(), WithinAbs(70.0, 1e-12));

    HedgeOrder short_leg{"forward", "EUR", -100000.0};
    REQUIRE_THAT(m.calculate_cost(short_leg).total(), WithinAbs(c.total(), 1e-12));

    HedgeOrder zero{"forward", "EUR", 0.0};
    REQUIRE_THAT(m.calculate_cost(zero).total(), WithinAbs(0.0, 1e-12));

    HedgeOrder natural{"natural", "JPY", 50000.0};
    REQUIRE_THAT(m.calculate_cost(natural).total(), WithinAbs(0.0, 1e-12));

    HedgeOrder bad{"forward", "EUR", std::nan("")};
    REQUIRE_THROWS_AS(m.calculate_cost(bad), std::invalid_argument);
}

TEST_CASE("Total cost across legs", "[TransactionCostModel]") {
    TransactionCostModel m;

    std::vector<HedgeOrder> orders = {
        {"forward", "EUR", 140000.0},
        {"option", "EUR", 60000.0},
        {"natural", "JPY", 10000.0}};
    // Two booked tickets plus 2bp on 200k
    REQUIRE_THAT(m.calculate_total_cost(orders), WithinAbs(100.0 + 40.0, 1e-9));
    REQUIRE_THAT(m.calculate_total_cost({}), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.variable_cost(-250000.0), WithinAbs(50.0, 1e-12));
}
