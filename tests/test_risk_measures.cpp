/**
 * @file test_risk_measures.cpp
 * @brief Unit tests for RiskMeasureEngine and RiskScorer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "common/cancellation.hpp"
#include "common/statistics.hpp"
#include "risk/risk_measure_engine.hpp"
#include "risk/risk_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace fxhedge;
using namespace fxhedge::risk;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace
{
    exposure::ExposureSummary make_exposures(const std::vector<std::pair<std::string, double>> &items)
    {
        exposure::ExposureSummary summary;
        summary.base_currency = "USD";
        for (const auto &item : items)
        {
            exposure::CurrencyExposure e;
            e.currency = item.first;
            e.absolute_exposure = item.second;
            e.original_amount = item.second;
            e.exchange_rate = 1.0;
            summary.total_foreign_exposure += item.second;
            summary.exposures.push_back(e);
        }
        for (auto &e : summary.exposures)
        {
            e.relative_exposure = e.absolute_exposure / summary.total_foreign_exposure;
        }
        summary.total_portfolio_value = summary.total_foreign_exposure;
        return summary;
    }

    VolatilityProfile flat_profile(const std::string &currency, double daily)
    {
        VolatilityProfile p;
        p.currency = currency;
        p.daily = daily;
        p.annual = daily * std::sqrt(252.0);
        return p;
    }

    std::vector<double> twenty_returns()
    {
        // Two worst days: -0.05 and -0.03
        return {0.01, -0.05, 0.002, 0.004, -0.03, 0.006, -0.01, 0.0, 0.01, -0.02,
                0.015, 0.003, -0.004, 0.007, -0.008, 0.012, -0.006, 0.001, 0.009, -0.002};
    }
}

TEST_CASE("Historical VaR", "[RiskMeasures][VaR]")
{
    RiskMeasureEngine engine(config::RiskConfig::default_config());
    auto exposures = make_exposures({{"EUR", 100000.0}, {"BRL", 50000.0}});

    VolatilityMap vols;
    vols["EUR"] = VolatilityEstimator::from_returns("EUR", twenty_returns(), 30);
    vols["BRL"] = flat_profile("BRL", 0.01);
    vols["BRL"].is_fallback = true;

    auto var95 = engine.historical_var_by_currency(exposures, vols, 0.95);
    auto var99 = engine.historical_var_by_currency(exposures, vols, 0.99);

    SECTION("Tail observation of the sorted returns")
    {
        // floor(20 * 0.05) = 1 -> second worst; floor(20 * 0.01) = 0 -> worst
        REQUIRE_THAT(var95.at("EUR"), WithinAbs(0.03 * 100000.0, 1e-6));
        REQUIRE_THAT(var99.at("EUR"), WithinAbs(0.05 * 100000.0, 1e-6));
    }

    SECTION("Currency without history uses daily volatility x z-score")
    {
        REQUIRE_THAT(var95.at("BRL"), WithinAbs(0.01 * 1.645 * 50000.0, 1e-6));
        REQUIRE_THAT(var99.at("BRL"), WithinAbs(0.01 * 2.326 * 50000.0, 1e-6));
    }

    SECTION("Portfolio figure is the sum over currencies")
    {
        REQUIRE_THAT(engine.historical_var(exposures, vols, 0.95),
                     WithinAbs(var95.at("EUR") + var95.at("BRL"), 1e-6));
    }

    SECTION("Missing profile is an error")
    {
        vols.erase("BRL");
        REQUIRE_THROWS_AS(engine.historical_var(exposures, vols, 0.95), std::invalid_argument);
    }
}

TEST_CASE("Parametric VaR", "[RiskMeasures][VaR]")
{
    RiskMeasureEngine engine(config::RiskConfig::default_config());
    auto exposures = make_exposures({{"EUR", 100000.0}, {"GBP", 50000.0}});

    VolatilityMap vols{{"EUR", flat_profile("EUR", 0.006)}, {"GBP", flat_profile("GBP", 0.008)}};
    CorrelationMatrix corr({"EUR", "GBP"});
    corr.set("EUR", "GBP", 0.5);

    double w1 = 100000.0 * 0.006;
    double w2 = 50000.0 * 0.008;
    double expected_std = std::sqrt(w1 * w1 + w2 * w2 + 2.0 * 0.5 * w1 * w2);

    REQUIRE_THAT(engine.portfolio_std_dev(exposures, vols, corr), WithinAbs(expected_std, 1e-9));
    REQUIRE_THAT(engine.parametric_var(exposures, vols, corr, 0.95), WithinAbs(expected_std * 1.645, 1e-9));
    REQUIRE(engine.parametric_var(exposures, vols, corr, 0.99) > engine.parametric_var(exposures, vols, corr, 0.95));

    SECTION("Empty portfolio has zero VaR")
    {
        auto empty = make_exposures({});
        REQUIRE_THAT(engine.parametric_var(empty, vols, corr, 0.95), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Monte Carlo simulation", "[RiskMeasures][MonteCarlo]")
{
    auto config = config::RiskConfig::default_config();
    config.monte_carlo_trials = 100000;
    config.monte_carlo_batches = 4;

    auto exposures = make_exposures({{"EUR", 100000.0}});
    VolatilityMap vols{{"EUR", flat_profile("EUR", 0.01)}};
    CorrelationMatrix corr({"EUR"});

    SECTION("Same seed reproduces the sample")
    {
        RiskMeasureEngine engine(config);
        auto a = engine.simulate(exposures, vols, corr, common::RandomSource(42));
        auto b = engine.simulate(exposures, vols, corr, common::RandomSource(42));
        REQUIRE(a.sorted_returns == b.sorted_returns);
        REQUIRE(a.summary.seed.has_value());
        REQUIRE(*a.summary.seed == 42u);
        REQUIRE(a.summary.batches == 4);
    }

    SECTION("Different seeds give different samples")
    {
        RiskMeasureEngine engine(config);
        auto a = engine.simulate(exposures, vols, corr, common::RandomSource(1));
        auto b = engine.simulate(exposures, vols, corr, common::RandomSource(2));
        REQUIRE(a.sorted_returns != b.sorted_returns);
    }

    SECTION("Converges to the parametric figure")
    {
        RiskMeasureEngine engine(config);
        auto sim = engine.simulate(exposures, vols, corr, common::RandomSource(7));
        REQUIRE(sim.sorted_returns.size() == 100000);
        REQUIRE(std::is_sorted(sim.sorted_returns.begin(), sim.sorted_returns.end()));

        double parametric = 100000.0 * 0.01 * 1.645;
        REQUIRE_THAT(RiskMeasureEngine::monte_carlo_var(sim.sorted_returns, 0.95), WithinRel(parametric, 0.03));
        REQUIRE_THAT(sim.summary.std_dev, WithinRel(1000.0, 0.02));
    }

    SECTION("Spread across seeds shrinks with more trials")
    {
        auto var_spread = [&](int trials)
        {
            auto run_config = config;
            run_config.monte_carlo_trials = trials;
            RiskMeasureEngine engine(run_config);

            std::vector<double> estimates;
            for (std::uint64_t seed = 1; seed <= 10; ++seed)
            {
                auto sim = engine.simulate(exposures, vols, corr, common::RandomSource(seed));
                estimates.push_back(RiskMeasureEngine::monte_carlo_var(sim.sorted_returns, 0.95));
            }
            return common::sample_stddev(estimates);
        };

        double coarse = var_spread(500);
        double fine = var_spread(20000);
        REQUIRE(coarse > 0.0);
        REQUIRE(fine < coarse);
    }

    SECTION("Expected shortfall is at least the VaR")
    {
        RiskMeasureEngine engine(config);
        auto sim = engine.simulate(exposures, vols, corr, common::RandomSource(3));
        for (double c : {0.95, 0.99})
        {
            REQUIRE(RiskMeasureEngine::expected_shortfall(sim.sorted_returns, c) >=
                    RiskMeasureEngine::monte_carlo_var(sim.sorted_returns, c));
        }
        REQUIRE(RiskMeasureEngine::monte_carlo_var(sim.sorted_returns, 0.99) >=
                RiskMeasureEngine::monte_carlo_var(sim.sorted_returns, 0.95));
    }

    SECTION("Fewer trials than batches")
    {
        config.monte_carlo_trials = 3;
        config.monte_carlo_batches = 8;
        RiskMeasureEngine engine(config);
        auto sim = engine.simulate(exposures, vols, corr, common::RandomSource(5));
        REQUIRE(sim.sorted_returns.size() == 3);
        REQUIRE(sim.summary.batches == 3);
    }

    SECTION("Correlated draws follow the correlation matrix")
    {
        config.correlated_draws = true;
        config.monte_carlo_trials = 50000;
        RiskMeasureEngine engine(config);

        auto pair = make_exposures({{"EUR", 100000.0}, {"CHF", 100000.0}});
        VolatilityMap pair_vols{{"EUR", flat_profile("EUR", 0.01)}, {"CHF", flat_profile("CHF", 0.01)}};
        CorrelationMatrix pair_corr({"EUR", "CHF"});
        pair_corr.set("EUR", "CHF", 0.9);

        auto sim = engine.simulate(pair, pair_vols, pair_corr, common::RandomSource(11));
        REQUIRE(sim.summary.correlated_draws);
        REQUIRE_THAT(sim.summary.std_dev, WithinRel(engine.portfolio_std_dev(pair, pair_vols, pair_corr), 0.03));
    }

    SECTION("Non positive-definite matrix falls back to independent draws")
    {
        config.correlated_draws = true;
        config.monte_carlo_trials = 1000;
        RiskMeasureEngine engine(config);

        auto triple = make_exposures({{"A", 1.0}, {"B", 1.0}, {"C", 1.0}});
        VolatilityMap triple_vols{{"A", flat_profile("A", 0.01)}, {"B", flat_profile("B", 0.01)}, {"C", flat_profile("C", 0.01)}};
        CorrelationMatrix bad({"A", "B", "C"});
        bad.set("A", "B", 0.99);
        bad.set("B", "C", 0.99);
        bad.set("A", "C", -0.99);

        auto sim = engine.simulate(triple, triple_vols, bad, common::RandomSource(1));
        REQUIRE_FALSE(sim.summary.correlated_draws);
        REQUIRE(sim.sorted_returns.size() == 1000);
    }

    SECTION("Cancelled token stops the simulation")
    {
        RiskMeasureEngine engine(config);
        common::CancellationToken token;
        token.cancel();
        REQUIRE_THROWS_AS(engine.simulate(exposures, vols, corr, common::RandomSource(1), &token),
                          common::OperationCancelled);
    }

    SECTION("Empty sample")
    {
        REQUIRE_THAT(RiskMeasureEngine::monte_carlo_var({}, 0.95), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(RiskMeasureEngine::expected_shortfall({}, 0.95), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("VaR estimates across confidence levels", "[RiskMeasures][VaR]")
{
    auto config = config::RiskConfig::default_config();
    config.confidence_levels = {0.99, 0.95};
    config.monte_carlo_trials = 20000;
    RiskMeasureEngine engine(config);

    auto exposures = make_exposures({{"EUR", 100000.0}, {"GBP", 60000.0}});
    VolatilityMap vols;
    vols["EUR"] = VolatilityEstimator::from_returns("EUR", twenty_returns(), 30);
    vols["GBP"] = flat_profile("GBP", 0.007);
    CorrelationMatrix corr({"EUR", "GBP"});

    auto sim = engine.simulate(exposures, vols, corr, common::RandomSource(42));
    auto estimates = engine.value_at_risk(exposures, vols, corr, sim);

    REQUIRE(estimates.size() == 2);
    REQUIRE_THAT(estimates[0].confidence, WithinAbs(0.95, 1e-12));
    REQUIRE_THAT(estimates[1].confidence, WithinAbs(0.99, 1e-12));
    REQUIRE(estimates[1].historical >= estimates[0].historical);
    REQUIRE(estimates[1].parametric >= estimates[0].parametric);
    REQUIRE(estimates[1].monte_carlo >= estimates[0].monte_carlo);
    REQUIRE(estimates[0].historical_by_currency.size() == 2);
}

TEST_CASE("Concentration metrics", "[RiskMeasures][Concentration]")
{
    RiskMeasureEngine engine(config::RiskConfig::default_config());

    SECTION("Equal weights give HHI of 1/n")
    {
        auto metrics = engine.concentration(make_exposures({{"EUR", 10.0}, {"GBP", 10.0}, {"JPY", 10.0}, {"CHF", 10.0}}));
        REQUIRE_THAT(metrics.herfindahl_index, WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(metrics.top3_concentration, WithinAbs(0.75, 1e-12));
        REQUIRE(metrics.flagged_currencies.empty());
        REQUIRE(metrics.risk_level == "medium");
    }

    SECTION("Single currency is fully concentrated")
    {
        auto metrics = engine.concentration(make_exposures({{"EUR", 10.0}}));
        REQUIRE_THAT(metrics.herfindahl_index, WithinAbs(1.0, 1e-12));
        REQUIRE(metrics.max_currency == "EUR");
        REQUIRE(metrics.risk_level == "high");
    }

    SECTION("Advice for currencies above the threshold")
    {
        auto metrics = engine.concentration(make_exposures({{"EUR", 40.0}, {"GBP", 60.0}}));
        REQUIRE(metrics.max_currency == "GBP");
        REQUIRE(metrics.flagged_currencies == std::vector<std::string>{"GBP", "EUR"});
        REQUIRE(metrics.advice.size() == 2);
        REQUIRE(metrics.advice[0].action == "Reduce GBP exposure by 35.0%");
        REQUIRE_THAT(metrics.advice[0].recommended_max, WithinAbs(0.25, 1e-12));
    }

    SECTION("Level thresholds")
    {
        REQUIRE(RiskMeasureEngine::concentration_level(0.10, 0.51) == "high");
        REQUIRE(RiskMeasureEngine::concentration_level(0.26, 0.20) == "high");
        REQUIRE(RiskMeasureEngine::concentration_level(0.10, 0.31) == "medium");
        REQUIRE(RiskMeasureEngine::concentration_level(0.10, 0.20) == "low");
    }

    SECTION("Empty portfolio")
    {
        auto metrics = engine.concentration(make_exposures({}));
        REQUIRE_THAT(metrics.herfindahl_index, WithinAbs(0.0, 1e-12));
        REQUIRE(metrics.risk_level == "low");
    }
}

TEST_CASE("Risk decomposition", "[RiskMeasures][Decomposition]")
{
    RiskMeasureEngine engine(config::RiskConfig::default_config());
    auto exposures = make_exposures({{"EUR", 100000.0}, {"CHF", 50000.0}, {"JPY", 30000.0}});
    VolatilityMap vols{{"EUR", flat_profile("EUR", 0.006)},
                       {"CHF", flat_profile("CHF", 0.005)},
                       {"JPY", flat_profile("JPY", 0.007)}};
    CorrelationMatrix corr({"EUR", "CHF", "JPY"});
    corr.set("EUR", "CHF", 0.9);
    corr.set("EUR", "JPY", -0.5);

    auto factors = engine.decompose(exposures, vols, corr);

    SECTION("Individual factors plus correlated pairs above the threshold")
    {
        REQUIRE(factors.size() == 4);
        int pairs = 0;
        for (const auto &f : factors)
        {
            if (f.type == RiskFactorType::CORRELATION)
            {
                ++pairs;
                REQUIRE(f.currencies == std::vector<std::string>{"EUR", "CHF"});
                REQUIRE(f.is_high_correlation);
                REQUIRE_THAT(f.contribution, WithinAbs(2.0 * 100000.0 * 50000.0 * 0.006 * 0.005 * 0.9, 1e-6));
            }
        }
        REQUIRE(pairs == 1);
    }

    SECTION("Sorted by magnitude with shares summing to one")
    {
        double total_share = 0.0;
        for (size_t i = 0; i < factors.size(); ++i)
        {
            total_share += factors[i].relative_contribution;
            if (i > 0)
            {
                REQUIRE(std::abs(factors[i - 1].contribution) >= std::abs(factors[i].contribution));
            }
        }
        REQUIRE_THAT(total_share, WithinAbs(1.0, 1e-12));
    }

    SECTION("Total risk")
    {
        REQUIRE_THAT(engine.total_risk(exposures, vols),
                     WithinAbs(100000.0 * 0.006 + 50000.0 * 0.005 + 30000.0 * 0.007, 1e-9));
    }
}

TEST_CASE("Stress tests", "[RiskMeasures][Stress]")
{
    RiskMeasureEngine engine(config::RiskConfig::default_config());
    auto results = engine.stress_test(make_exposures({{"EUR", 100000.0}, {"GBP", 100000.0}}));

    REQUIRE(results.size() == 5);

    SECTION("Largest loss first")
    {
        REQUIRE(results[0].scenario == "Brexit Referendum");
        REQUIRE_THAT(results[0].total_loss, WithinAbs(38000.0, 1e-6));
        REQUIRE_THAT(results[0].loss_fraction, WithinAbs(0.19, 1e-12));
        REQUIRE(results[0].severity == "high");
        REQUIRE(results[1].scenario == "2008 Financial Crisis");
    }

    SECTION("Scenario without matching currencies")
    {
        const auto &last = results.back();
        REQUIRE(last.scenario == "Emerging Market Crisis");
        REQUIRE_THAT(last.total_loss, WithinAbs(0.0, 1e-12));
        REQUIRE(last.severity == "low");
        REQUIRE(last.currency_losses.empty());
    }

    SECTION("Severity bands")
    {
        REQUIRE(RiskMeasureEngine::stress_severity(0.25) == "severe");
        REQUIRE(RiskMeasureEngine::stress_severity(0.15) == "high");
        REQUIRE(RiskMeasureEngine::stress_severity(0.07) == "medium");
        REQUIRE(RiskMeasureEngine::stress_severity(0.05) == "low");
    }
}

TEST_CASE("Risk score and recommendations", "[RiskScorer]")
{
    auto config = config::RiskConfig::default_config();
    RiskScorer scorer(config);
    RiskMeasureEngine engine(config);

    SECTION("Empty portfolio scores zero")
    {
        auto empty = make_exposures({});
        REQUIRE_THAT(scorer.score(empty, engine.concentration(empty), {}), WithinAbs(0.0, 1e-12));
    }

    SECTION("Score components")
    {
        auto exposures = make_exposures({{"EUR", 100.0}});
        VolatilityMap vols{{"EUR", flat_profile("EUR", 0.10 / std::sqrt(252.0))}};
        // 40 * 1.0 + min(40, 200 * 0.10) + (20 - 2)
        REQUIRE_THAT(scorer.score(exposures, engine.concentration(exposures), vols), WithinAbs(78.0, 1e-9));
    }

    SECTION("Score stays within bounds")
    {
        auto exposures = make_exposures({{"EUR", 100.0}});
        VolatilityMap vols{{"EUR", flat_profile("EUR", 1.0)}};
        double s = scorer.score(exposures, engine.concentration(exposures), vols);
        REQUIRE(s >= 0.0);
        REQUIRE(s <= 100.0);
    }

    SECTION("Recommendations for concentration, correlation and volatility")
    {
        auto exposures = make_exposures({{"EUR", 70.0}, {"CHF", 30.0}});
        VolatilityMap vols{{"EUR", flat_profile("EUR", 0.30 / std::sqrt(252.0))},
                           {"CHF", flat_profile("CHF", 0.05 / std::sqrt(252.0))}};
        CorrelationMatrix corr({"EUR", "CHF"});
        corr.set("EUR", "CHF", 0.85);

        auto recs = scorer.recommend(engine.concentration(exposures), engine.decompose(exposures, vols, corr), vols);
        REQUIRE(recs.size() == 3);
        REQUIRE(recs[0].type == "concentration");
        REQUIRE(recs[0].priority == "high");
        REQUIRE(recs[1].type == "correlation");
        REQUIRE(recs[2].type == "volatility");
        REQUIRE(recs[2].description.find("EUR") != std::string::npos);
        REQUIRE(recs[2].description.find("CHF") == std::string::npos);
    }

    SECTION("Diversified low-volatility portfolio needs no action")
    {
        auto exposures = make_exposures({{"EUR", 25.0}, {"GBP", 25.0}, {"JPY", 25.0}, {"CHF", 25.0}});
        VolatilityMap vols{{"EUR", flat_profile("EUR", 0.005)}, {"GBP", flat_profile("GBP", 0.005)},
                           {"JPY", flat_profile("JPY", 0.005)}, {"CHF", flat_profile("CHF", 0.005)}};
        CorrelationMatrix corr({"EUR", "GBP", "JPY", "CHF"});
        REQUIRE(scorer.recommend(engine.concentration(exposures), engine.decompose(exposures, vols, corr), vols).empty());
    }
}
