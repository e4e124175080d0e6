/**
 * @file test_hedge_ratio_optimizer.cpp
 * @brief Unit tests for HedgeUtility and HedgeRatioOptimizer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "common/errors.hpp"
#include "optimizer/hedge_ratio_optimizer.hpp"

#include <cmath>

using namespace fxhedge;
using namespace fxhedge::optimizer;
using Catch::Matchers::WithinAbs;

class OptimizerFixture
{
protected:
    config::OptimizerConfig config;
    hedging::StrategyCandidate cheap;

    OptimizerFixture()
    {
        config.parallel = false;

        // Forward at 10bp on 100k: cost score falls by 0.1 per unit of ratio
        cheap.id = "single-EUR-forward";
        cheap.type = hedging::StrategyType::SINGLE;
        cheap.currencies = {"EUR"};
        cheap.exposure = 100000.0;
        cheap.cost = 100.0;
        cheap.effectiveness = 0.95;
        cheap.hedge_ratio = 0.5;
        cheap.time_horizon = 90;
    }
};

// ============================================================================
// Utility
// ============================================================================

TEST_CASE_METHOD(OptimizerFixture, "Utility components", "[HedgeUtility]")
{
    HedgeUtility utility(config);

    SECTION("Weighted blend at a given ratio")
    {
        REQUIRE_THAT(utility.risk_reduction(cheap, 0.5), WithinAbs(0.475, 1e-12));
        REQUIRE_THAT(utility.cost_score(cheap, 0.5), WithinAbs(0.95, 1e-12));
        REQUIRE_THAT(utility.evaluate(cheap, 0.5), WithinAbs(0.665, 1e-12));
    }

    SECTION("Cost score is clamped to [0, 1]")
    {
        auto expensive = cheap;
        expensive.cost = 2000.0;
        REQUIRE_THAT(utility.cost_score(expensive, 1.0), WithinAbs(0.0, 1e-12));

        auto empty = cheap;
        empty.exposure = 0.0;
        REQUIRE_THAT(utility.cost_score(empty, 1.0), WithinAbs(1.0, 1e-12));
    }

    SECTION("Moderation penalty")
    {
        config.moderation_penalty = 1.0;
        HedgeUtility penalized(config);
        REQUIRE_THAT(penalized.evaluate(cheap, 0.9), WithinAbs(utility.evaluate(cheap, 0.9) - 0.4, 1e-12));
        REQUIRE_THAT(penalized.evaluate(cheap, 0.5), WithinAbs(utility.evaluate(cheap, 0.5), 1e-12));
    }

    SECTION("Error: invalid weights")
    {
        config.cost_weight = -0.1;
        REQUIRE_THROWS_AS(HedgeUtility(config), std::invalid_argument);
    }
}

// ============================================================================
// Optimizer
// ============================================================================

TEST_CASE_METHOD(OptimizerFixture, "Monotone utility converges at the upper bound", "[HedgeRatioOptimizer]")
{
    HedgeRatioOptimizer optimizer(config);
    auto result = optimizer.optimize(cheap);

    REQUIRE(result.strategy_id == "single-EUR-forward");
    REQUIRE_THAT(result.initial_ratio, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(result.hedge_ratio, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(result.utility, WithinAbs(0.935, 1e-9));
    REQUIRE(result.converged);
    REQUIRE(result.searched);
    REQUIRE(result.grid_points > 0);
    REQUIRE(result.iterations >= 1);
}

TEST_CASE_METHOD(OptimizerFixture, "Ratios stay within the configured range", "[HedgeRatioOptimizer]")
{
    config.min_hedge_ratio = 0.3;
    config.max_hedge_ratio = 0.7;
    config.max_iterations = 0;
    HedgeRatioOptimizer optimizer(config);

    cheap.hedge_ratio = 0.95;
    auto result = optimizer.optimize(cheap);

    REQUIRE_THAT(result.hedge_ratio, WithinAbs(0.7, 1e-12));
    REQUIRE(result.iterations == 0);
    REQUIRE_FALSE(result.converged);

    REQUIRE_THAT(optimizer.clamp_ratio(0.1), WithinAbs(0.3, 1e-12));
    REQUIRE_THAT(optimizer.clamp_ratio(2.0), WithinAbs(0.7, 1e-12));
    REQUIRE_THAT(optimizer.clamp_ratio(std::nan("")), WithinAbs(0.3, 1e-12));
}

TEST_CASE_METHOD(OptimizerFixture, "Penalty pulls the optimum toward a half hedge", "[HedgeRatioOptimizer]")
{
    config.moderation_penalty = 2.0;
    HedgeRatioOptimizer optimizer(config);

    cheap.hedge_ratio = 0.9;
    auto result = optimizer.optimize(cheap);

    // U(0.5) = 0.665 and any ratio beating the best grid point lies in [0.471, 0.55]
    REQUIRE_THAT(result.hedge_ratio, WithinAbs(0.5, 0.051));
    REQUIRE(result.utility >= optimizer.utility().evaluate(cheap, 0.55));
    REQUIRE(result.utility <= 0.665 + 1e-12);
}

TEST_CASE_METHOD(OptimizerFixture, "Iteration cap returns the best point without convergence", "[HedgeRatioOptimizer]")
{
    config.moderation_penalty = 2.0;
    config.grid_step = 0.3;
    config.learning_rate = 1e-6;
    config.max_iterations = 3;
    config.convergence_threshold = 1e-9;
    HedgeRatioOptimizer optimizer(config);

    cheap.hedge_ratio = 0.9;

    auto result = optimizer.optimize(cheap);

    REQUIRE(result.iterations == 3);
    REQUIRE_FALSE(result.converged);
    REQUIRE_THAT(result.hedge_ratio, WithinAbs(0.55, 1e-4));
}

TEST_CASE_METHOD(OptimizerFixture, "Natural hedges keep their exposure ratio", "[HedgeRatioOptimizer]")
{
    HedgeRatioOptimizer optimizer(config);

    hedging::StrategyCandidate natural;
    natural.id = "natural-AUD-JPY";
    natural.type = hedging::StrategyType::NATURAL;
    natural.currencies = {"AUD", "JPY"};
    natural.exposure = 80000.0;
    natural.effectiveness = 0.7;
    natural.hedge_ratio = 0.625;

    auto result = optimizer.optimize(natural);
    REQUIRE_FALSE(result.searched);
    REQUIRE(result.iterations == 0);
    REQUIRE_THAT(result.hedge_ratio, WithinAbs(0.625, 1e-12));

    natural.hedge_ratio = 0.1;
    REQUIRE_THAT(optimizer.optimize(natural).hedge_ratio, WithinAbs(0.25, 1e-12));
}

TEST_CASE_METHOD(OptimizerFixture, "Optimize all candidates", "[HedgeRatioOptimizer]")
{
    auto second = cheap;
    second.id = "single-EUR-option";
    second.cost = 500.0;
    second.effectiveness = 0.85;

    std::vector<hedging::StrategyCandidate> sequential = {cheap, second};
    auto seq_results = HedgeRatioOptimizer(config).optimize_all(sequential);

    config.parallel = true;
    std::vector<hedging::StrategyCandidate> parallel = {cheap, second};
    auto par_results = HedgeRatioOptimizer(config).optimize_all(parallel);

    REQUIRE(seq_results.size() == 2);
    REQUIRE(par_results.size() == 2);
    for (size_t i = 0; i < 2; ++i)
    {
        REQUIRE(seq_results[i].strategy_id == sequential[i].id);
        REQUIRE(par_results[i].hedge_ratio == seq_results[i].hedge_ratio);
        REQUIRE(par_results[i].utility == seq_results[i].utility);
        REQUIRE(sequential[i].hedge_ratio == seq_results[i].hedge_ratio);
        REQUIRE(sequential[i].utility == seq_results[i].utility);
    }
}

TEST_CASE_METHOD(OptimizerFixture, "Cancelled optimization", "[HedgeRatioOptimizer]")
{
    common::CancellationToken token;
    token.cancel();

    HedgeRatioOptimizer optimizer(config);
    REQUIRE_THROWS_AS(optimizer.optimize(cheap, &token), common::OperationCancelled);

    config.parallel = true;
    std::vector<hedging::StrategyCandidate> candidates = {cheap, cheap};
    REQUIRE_THROWS_AS(HedgeRatioOptimizer(config).optimize_all(candidates, &token), common::OperationCancelled);
}
