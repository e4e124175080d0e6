// Unit tests for the hedge instrument pricing providers

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "hedging/pricing_provider.hpp"

#include <stdexcept>

using namespace fxhedge;
using namespace fxhedge::hedging;
using Catch::Matchers::WithinAbs;

namespace {

config::InstrumentSpec catalog_entry(config::InstrumentType type) {
    auto catalog = config::default_instrument_catalog();
    for (const auto& inst : catalog) {
        if (inst.type == type) return inst;
    }
    throw std::logic_error("instrument missing from default catalog");
}

} // namespace

TEST_CASE("Basis-point pricing", "[Pricing]") {
    BasisPointPricingProvider pricing;
    PricingContext ctx;

    REQUIRE(pricing.get_name() == "BasisPointPricingProvider");
    REQUIRE_THAT(pricing.instrument_cost(catalog_entry(config::InstrumentType::FORWARD), 100000.0, ctx),
                 WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(pricing.instrument_cost(catalog_entry(config::InstrumentType::OPTION), 100000.0, ctx),
                 WithinAbs(500.0, 1e-9));
    REQUIRE_THAT(pricing.instrument_cost(catalog_entry(config::InstrumentType::SWAP), -100000.0, ctx),
                 WithinAbs(250.0, 1e-9));
    REQUIRE_THAT(pricing.instrument_cost(catalog_entry(config::InstrumentType::FORWARD), 0.0, ctx),
                 WithinAbs(0.0, 1e-12));
}

TEST_CASE("Black-Scholes put greeks", "[Pricing]") {
    OptionPremiumPricingProvider pricing(0.05, 1.0);

    SECTION("Textbook at-the-money put") {
        auto g = pricing.put_greeks(100.0, 100.0, 0.2, 1.0);
        REQUIRE_THAT(g.premium, WithinAbs(5.5735, 1e-3));
        REQUIRE_THAT(g.delta, WithinAbs(-0.3632, 1e-3));
        REQUIRE_THAT(g.gamma, WithinAbs(0.01876, 1e-4));
        REQUIRE_THAT(g.vega, WithinAbs(37.524, 1e-2));
    }

    SECTION("Put value rises with volatility") {
        auto low = pricing.put_greeks(1.0, 0.98, 0.08, 0.25);
        auto high = pricing.put_greeks(1.0, 0.98, 0.20, 0.25);
        REQUIRE(high.premium > low.premium);
        REQUIRE(low.delta < 0.0);
        REQUIRE(low.delta > -1.0);
    }

    SECTION("Error: non-positive inputs") {
        REQUIRE_THROWS_AS(pricing.put_greeks(1.0, 1.0, 0.0, 1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(pricing.put_greeks(1.0, 1.0, 0.1, 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(OptionPremiumPricingProvider(0.02, 0.0), std::invalid_argument);
    }
}

TEST_CASE("Option-premium pricing of catalog instruments", "[Pricing]") {
    OptionPremiumPricingProvider pricing;
    PricingContext ctx;
    ctx.annual_volatility = 0.12;
    ctx.horizon_days = 90;

    auto option = catalog_entry(config::InstrumentType::OPTION);
    double expected = 100000.0 * pricing.put_greeks(1.0, 0.98, 0.12, 90.0 / 365.0).premium;
    REQUIRE_THAT(pricing.instrument_cost(option, 100000.0, ctx), WithinAbs(expected, 1e-6));

    SECTION("Longer horizon costs more") {
        PricingContext longer = ctx;
        longer.horizon_days = 180;
        REQUIRE(pricing.instrument_cost(option, 100000.0, longer) > pricing.instrument_cost(option, 100000.0, ctx));
    }

    SECTION("Non-option instruments use basis points") {
        REQUIRE_THAT(pricing.instrument_cost(catalog_entry(config::InstrumentType::FORWARD), 100000.0, ctx),
                     WithinAbs(100.0, 1e-9));
    }
}

TEST_CASE("Pricing provider factory", "[Pricing]") {
    REQUIRE(create_pricing_provider("basis_points")->get_name() == "BasisPointPricingProvider");
    REQUIRE(create_pricing_provider("option_premium")->get_name() == "OptionPremiumPricingProvider");
    REQUIRE_THROWS_AS(create_pricing_provider("monte_carlo"), std::invalid_argument);
}
