/**
 * @file test_volatility_correlation.cpp
 * @brief Unit tests for VolatilityEstimator and CorrelationAnalyzer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "common/statistics.hpp"
#include "data/market_data_provider.hpp"
#include "risk/correlation_analyzer.hpp"
#include "risk/volatility_estimator.hpp"

#include <cmath>

using namespace fxhedge;
using namespace fxhedge::risk;
using Catch::Matchers::WithinAbs;

namespace
{
    std::vector<double> prices_from_returns(double start, const std::vector<double> &returns)
    {
        std::vector<double> prices{start};
        for (double r : returns)
        {
            prices.push_back(prices.back() * (1.0 + r));
        }
        return prices;
    }
}

TEST_CASE("Volatility profiles from returns", "[Volatility]")
{
    std::vector<double> returns{0.01, -0.02, 0.015, -0.005, 0.0, 0.01};
    auto profile = VolatilityEstimator::from_returns("EUR", returns, 4);
    double daily = common::sample_stddev(returns);

    SECTION("Horizon scaling")
    {
        REQUIRE_THAT(profile.daily, WithinAbs(daily, 1e-12));
        REQUIRE_THAT(profile.weekly, WithinAbs(daily * std::sqrt(7.0), 1e-12));
        REQUIRE_THAT(profile.monthly, WithinAbs(daily * std::sqrt(30.0), 1e-12));
        REQUIRE_THAT(profile.annual, WithinAbs(daily * std::sqrt(252.0), 1e-12));
        REQUIRE_FALSE(profile.is_fallback);
    }

    SECTION("Trailing window kept for correlation")
    {
        REQUIRE(profile.recent_returns.size() == 4);
        REQUIRE_THAT(profile.recent_returns.front(), WithinAbs(0.015, 1e-12));
    }

    SECTION("Error: fewer than two returns")
    {
        REQUIRE_THROWS_AS(VolatilityEstimator::from_returns("EUR", {0.01}, 4), std::invalid_argument);
    }
}

TEST_CASE("Volatility estimation through a provider", "[Volatility]")
{
    data::InMemoryMarketDataProvider provider;
    auto config = config::RiskConfig::default_config();
    config.lookback_window = "short";
    VolatilityEstimator estimator(provider, config);

    SECTION("Missing history falls back to the default volatility")
    {
        auto profile = estimator.estimate("BRL", "USD");
        REQUIRE(profile.is_fallback);
        REQUIRE_THAT(profile.annual, WithinAbs(0.15, 1e-12));
        REQUIRE_THAT(profile.daily, WithinAbs(0.15 / std::sqrt(252.0), 1e-12));
        REQUIRE_FALSE(profile.has_returns());
    }

    SECTION("Too short a history falls back")
    {
        provider.set_price_history("CHF", {1.1, 1.11});
        REQUIRE(estimator.estimate("CHF", "USD").is_fallback);
    }

    SECTION("Lookback window limits the history")
    {
        std::vector<double> returns(60, 0.0);
        for (size_t i = 0; i < returns.size(); ++i)
        {
            returns[i] = (i % 2 == 0) ? 0.01 : -0.01;
        }
        provider.set_price_history("EUR", prices_from_returns(1.1, returns));
        auto profile = estimator.estimate("EUR", "USD");
        REQUIRE(profile.returns.size() == 29);
    }

    SECTION("Concurrent estimation covers every currency")
    {
        provider.set_price_history("EUR", prices_from_returns(1.1, {0.01, -0.01, 0.02, -0.02, 0.01}));
        auto profiles = estimator.estimate_all({"EUR", "BRL"}, "USD");
        REQUIRE(profiles.size() == 2);
        REQUIRE_FALSE(profiles.at("EUR").is_fallback);
        REQUIRE(profiles.at("BRL").is_fallback);
    }
}

TEST_CASE("Pearson correlation", "[Correlation]")
{
    std::vector<double> x{0.01, -0.02, 0.03, 0.00, -0.01};

    SECTION("Perfect positive and negative")
    {
        std::vector<double> neg;
        for (double v : x)
        {
            neg.push_back(-2.0 * v);
        }
        REQUIRE_THAT(CorrelationAnalyzer::pearson(x, x), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(CorrelationAnalyzer::pearson(x, neg), WithinAbs(-1.0, 1e-12));
    }

    SECTION("Zero variance gives zero")
    {
        std::vector<double> flat(5, 0.004);
        REQUIRE_THAT(CorrelationAnalyzer::pearson(x, flat), WithinAbs(0.0, 1e-12));
    }

    SECTION("Fewer than two points gives zero")
    {
        REQUIRE_THAT(CorrelationAnalyzer::pearson({0.01}, {0.02}), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Correlation matrix", "[Correlation]")
{
    std::map<std::string, VolatilityProfile> profiles;
    profiles["EUR"] = VolatilityEstimator::from_returns("EUR", {0.01, -0.02, 0.03, 0.00, -0.01, 0.02}, 30);
    profiles["CHF"] = VolatilityEstimator::from_returns("CHF", {0.008, -0.015, 0.025, 0.001, -0.012, 0.018}, 30);
    profiles["JPY"] = VolatilityEstimator::from_returns("JPY", {-0.01, 0.02, -0.03, 0.0, 0.01, -0.02}, 30);

    VolatilityProfile fallback;
    fallback.currency = "BRL";
    fallback.is_fallback = true;
    profiles["BRL"] = fallback;

    CorrelationAnalyzer analyzer;
    auto matrix = analyzer.analyze({"EUR", "CHF", "JPY", "BRL"}, profiles);

    SECTION("Symmetric with unit diagonal")
    {
        const auto &m = matrix.values();
        REQUIRE(m.rows() == 4);
        REQUIRE_THAT((m - m.transpose()).norm(), WithinAbs(0.0, 1e-12));
        for (int i = 0; i < m.rows(); ++i)
        {
            REQUIRE_THAT(m(i, i), WithinAbs(1.0, 1e-12));
        }
        REQUIRE(m.cwiseAbs().maxCoeff() <= 1.0);
    }

    SECTION("Estimated pairs")
    {
        REQUIRE(matrix.get("EUR", "CHF") > 0.9);
        REQUIRE_THAT(matrix.get("EUR", "JPY"), WithinAbs(-1.0, 1e-12));
    }

    SECTION("Fallback currency has no correlation data")
    {
        REQUIRE_FALSE(matrix.has_data("BRL"));
        REQUIRE(matrix.has_data("EUR"));
        REQUIRE_THAT(matrix.get("EUR", "BRL"), WithinAbs(0.0, 1e-12));
    }

    SECTION("Unknown currencies")
    {
        REQUIRE_THAT(matrix.get("EUR", "ZAR"), WithinAbs(0.0, 1e-12));
        REQUIRE_THROWS_AS(matrix.set("EUR", "ZAR", 0.5), std::invalid_argument);
    }

    SECTION("Values are clamped")
    {
        matrix.set("EUR", "CHF", 1.7);
        REQUIRE_THAT(matrix.get("CHF", "EUR"), WithinAbs(1.0, 1e-12));
    }
}
