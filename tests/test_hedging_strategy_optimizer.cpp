/**
 * @file test_hedging_strategy_optimizer.cpp
 * @brief Tests for the hedging recommendation pipeline
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "common/errors.hpp"
#include "hedging/hedging_strategy_optimizer.hpp"

#include <cmath>
#include <limits>

using namespace fxhedge;
using namespace fxhedge::hedging;
using Catch::Matchers::WithinAbs;

namespace
{
    class RecordingObserver : public StrategyObserver
    {
    public:
        void on_strategy_generated(const HedgingRecommendation &recommendation) override
        {
            generated.push_back(recommendation.id);
        }

        void on_error(const std::string &user_id, const std::string &message) override
        {
            errors.push_back(user_id + ": " + message);
        }

        std::vector<std::string> generated;
        std::vector<std::string> errors;
    };
}

class PipelineFixture
{
protected:
    config::EngineConfig config;
    risk::RiskAssessment assessment;

    PipelineFixture()
        : config(config::EngineConfig::default_config())
    {
        assessment.id = "risk_test_1";
        assessment.user_id = "user-1";
        assessment.base_currency = "USD";

        add_exposure("EUR", 300000.0, 0.60, 0.08);
        add_exposure("GBP", 130000.0, 0.26, 0.09);
        add_exposure("CHF", 50000.0, 0.10, 0.16);
        add_exposure("BRL", 20000.0, 0.04, 0.30);

        risk::VaREstimate var95;
        var95.confidence = 0.95;
        var95.parametric = 6000.0;
        assessment.var.push_back(var95);
    }

    void add_exposure(const std::string &ccy, double exposure, double relative, double annual_vol)
    {
        exposure::CurrencyExposure e;
        e.currency = ccy;
        e.absolute_exposure = exposure;
        e.relative_exposure = relative;
        assessment.exposures.exposures.push_back(e);

        risk::VolatilityProfile p;
        p.currency = ccy;
        p.annual = annual_vol;
        p.daily = annual_vol / std::sqrt(252.0);
        assessment.volatilities[ccy] = p;

        risk::RiskFactor f;
        f.currencies = {ccy};
        f.contribution = exposure * p.daily;
        assessment.risk_factors.push_back(f);
    }
};

TEST_CASE_METHOD(PipelineFixture, "Full recommendation bundle", "[HedgingStrategyOptimizer]")
{
    HedgingStrategyOptimizer optimizer(config);
    REQUIRE(optimizer.pricing().get_name() == "BasisPointPricingProvider");

    auto rec = optimizer.generate_recommendations("user-1", assessment);

    REQUIRE(rec.id.rfind("hedge_", 0) == 0);
    REQUIRE(rec.user_id == "user-1");
    REQUIRE(rec.base_currency == "USD");
    REQUIRE(rec.assessment_id == "risk_test_1");

    SECTION("Needs and candidates")
    {
        REQUIRE(rec.needs.size() == 4);
        REQUIRE(rec.needs[0].currency == "EUR");
        REQUIRE(rec.needs[1].currency == "GBP");
        REQUIRE(rec.needs[2].currency == "BRL");
        REQUIRE(rec.needs[3].currency == "CHF");

        // EUR and GBP: three singles and a combination each; BRL and CHF:
        // a forward each; plus the basket
        REQUIRE(rec.candidates_evaluated == 11);
        REQUIRE(rec.optimizations.size() == 11);
    }

    SECTION("Recommended strategy and alternatives")
    {
        REQUIRE(rec.has_recommendation());
        REQUIRE(rec.recommended->rank == 1);
        REQUIRE(rec.alternatives.size() == 3);
        for (size_t i = 0; i < rec.alternatives.size(); ++i)
        {
            REQUIRE(rec.alternatives[i].rank == static_cast<int>(i) + 2);
            REQUIRE(rec.alternatives[i].analysis.ranking_score <= rec.recommended->analysis.ranking_score);
        }

        const auto &best = *rec.recommended;
        REQUIRE(best.strategy.hedge_ratio >= config.optimizer.min_hedge_ratio);
        REQUIRE(best.strategy.hedge_ratio <= config.optimizer.max_hedge_ratio);
        REQUIRE_THAT(rec.total_cost, WithinAbs(best.analysis.total_cost, 1e-12));
        REQUIRE_THAT(rec.expected_effectiveness,
                     WithinAbs(best.strategy.hedge_ratio * best.strategy.effectiveness, 1e-12));
        REQUIRE_THAT(rec.total_risk_reduction, WithinAbs(best.analysis.risk_reduction, 1e-12));
    }

    SECTION("Plan and rebalance schedule follow the recommendation")
    {
        REQUIRE(rec.plan.has_value());
        REQUIRE(rec.plan->strategy_id == rec.recommended->strategy.id);
        REQUIRE(rec.plan->phases.size() == 3);
        REQUIRE(rec.rebalance.has_value());
        REQUIRE(rec.rebalance->strategy_id == rec.recommended->strategy.id);
    }

    SECTION("JSON export")
    {
        auto j = rec.to_json();
        REQUIRE(j.contains("recommended_strategy"));
        REQUIRE(j["alternative_strategies"].size() == 3);
        REQUIRE(j["hedging_needs"].size() == 4);
    }
}

TEST_CASE_METHOD(PipelineFixture, "Alternative count is configurable", "[HedgingStrategyOptimizer]")
{
    config.hedging.max_alternatives = 1;
    auto rec = HedgingStrategyOptimizer(config).generate_recommendations("user-1", assessment);
    REQUIRE(rec.alternatives.size() == 1);

    config.hedging.max_alternatives = 50;
    rec = HedgingStrategyOptimizer(config).generate_recommendations("user-1", assessment);
    REQUIRE(rec.alternatives.size() == 10);
}

TEST_CASE_METHOD(PipelineFixture, "Strategy profile shapes the bundle", "[HedgingStrategyOptimizer]")
{
    config.hedging.strategy_profile = config::StrategyProfile::BALANCED;
    HedgingStrategyOptimizer optimizer(config);

    auto rec = optimizer.generate_recommendations("user-1", assessment);

    // Swaps and the basket are outside the balanced profile
    REQUIRE(rec.candidates_evaluated == 8);
    REQUIRE(rec.has_recommendation());
    REQUIRE(rec.strategy_template.has_value());
    REQUIRE(rec.meets_risk_target == (rec.expected_effectiveness >= rec.strategy_template->risk_reduction_target));

    auto j = rec.to_json();
    REQUIRE(j["strategy_profile"]["profile"] == "balanced");
    REQUIRE(j["meets_risk_target"].get<bool>() == rec.meets_risk_target);

    SECTION("Unreachable target is reported")
    {
        config.hedging.strategy_profile = config::StrategyProfile::CONSERVATIVE;
        config.optimizer.max_hedge_ratio = 0.5;
        HedgingStrategyOptimizer capped(config);
        auto low = capped.generate_recommendations("user-1", assessment);
        REQUIRE(low.has_recommendation());
        REQUIRE(low.expected_effectiveness < 0.7);
        REQUIRE_FALSE(low.meets_risk_target);
    }

    SECTION("No profile, no template")
    {
        config.hedging.strategy_profile.reset();
        auto plain = HedgingStrategyOptimizer(config).generate_recommendations("user-1", assessment);
        REQUIRE_FALSE(plain.strategy_template.has_value());
        REQUIRE(plain.meets_risk_target);
        REQUIRE(plain.to_json()["strategy_profile"].is_null());
    }
}

TEST_CASE_METHOD(PipelineFixture, "Nothing to hedge", "[HedgingStrategyOptimizer]")
{
    risk::RiskAssessment calm;
    calm.id = "risk_calm";
    calm.base_currency = "USD";

    exposure::CurrencyExposure chf;
    chf.currency = "CHF";
    chf.absolute_exposure = 10000.0;
    chf.relative_exposure = 0.10;
    calm.exposures.exposures.push_back(chf);
    risk::VolatilityProfile p;
    p.currency = "CHF";
    p.annual = 0.05;
    calm.volatilities["CHF"] = p;

    auto rec = HedgingStrategyOptimizer(config).generate_recommendations("user-2", calm);

    REQUIRE(rec.needs.empty());
    REQUIRE_FALSE(rec.has_recommendation());
    REQUIRE(rec.alternatives.empty());
    REQUIRE_FALSE(rec.plan.has_value());
    REQUIRE(rec.candidates_evaluated == 0);
    REQUIRE(rec.total_cost == 0.0);
    REQUIRE(rec.expected_effectiveness == 0.0);
    REQUIRE(rec.to_json()["recommended_strategy"].is_null());
}

TEST_CASE_METHOD(PipelineFixture, "Observers and errors", "[HedgingStrategyOptimizer]")
{
    HedgingStrategyOptimizer optimizer(config);
    auto observer = std::make_shared<RecordingObserver>();
    optimizer.add_observer(observer);

    SECTION("Successful run is announced")
    {
        auto rec = optimizer.generate_recommendations("user-1", assessment);
        REQUIRE(observer->generated == std::vector<std::string>{rec.id});
        REQUIRE(observer->errors.empty());
    }

    SECTION("Cancelled run is neither announced nor reported as an error")
    {
        common::CancellationToken token;
        token.cancel();
        REQUIRE_THROWS_AS(optimizer.generate_recommendations("user-1", assessment, &token),
                          common::OperationCancelled);
        REQUIRE(observer->generated.empty());
        REQUIRE(observer->errors.empty());
    }

    SECTION("Error: non-finite exposure is reported to observers")
    {
        assessment.exposures.exposures[0].absolute_exposure = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(optimizer.generate_recommendations("user-1", assessment), std::invalid_argument);
        REQUIRE(observer->errors.size() == 1);
        REQUIRE(observer->errors[0].rfind("user-1: ", 0) == 0);
        REQUIRE(observer->generated.empty());
    }

    SECTION("Error: null observer")
    {
        REQUIRE_THROWS_AS(optimizer.add_observer(nullptr), std::invalid_argument);
    }
}

TEST_CASE_METHOD(PipelineFixture, "Pricing model selection", "[HedgingStrategyOptimizer]")
{
    config.pricing_model = "option_premium";
    HedgingStrategyOptimizer priced(config);
    REQUIRE(priced.pricing().get_name() == "OptionPremiumPricingProvider");

    auto custom = std::make_shared<BasisPointPricingProvider>();
    HedgingStrategyOptimizer injected(config, custom);
    REQUIRE(&injected.pricing() == custom.get());

    config.pricing_model = "lattice";
    REQUIRE_THROWS_AS(HedgingStrategyOptimizer(config), std::invalid_argument);
}
