/**
 * @file test_resilience.cpp
 * @brief Tests for bolt and clamped-parts resilience (substitute cone model)
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "boltjoint/resilience.hpp"
#include "boltjoint/errors.hpp"

#include <cmath>

using namespace boltjoint;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

JointError resilience_error(double lK, double dW, double dh, double E_P,
                            const CalculationSettings& settings = CalculationSettings{}) {
    try {
        clamped_parts_resilience(lK, dW, dh, E_P, settings);
    } catch (const JointCalculationError& e) {
        return e.error();
    }
    return JointError();
}

} // namespace

TEST_CASE("bolt_resilience: lK / (As * E_B)", "[Resilience][bolt]") {
    double delta = bolt_resilience(40.0, 58.0, 210000.0);

    REQUIRE_THAT(delta, WithinRel(40.0 / (58.0 * 210000.0), 1e-12));
    REQUIRE_THAT(delta, WithinRel(3.276e-6, 0.005));
}

TEST_CASE("bolt_resilience: rejects non-positive inputs", "[Resilience][bolt]") {
    REQUIRE_THROWS_AS(bolt_resilience(0.0, 58.0, 210000.0), JointCalculationError);
    REQUIRE_THROWS_AS(bolt_resilience(40.0, 0.0, 210000.0), JointCalculationError);
    REQUIRE_THROWS_AS(bolt_resilience(40.0, 58.0, -1.0), JointCalculationError);
}

TEST_CASE("clamped_parts_resilience: substitute cone formula", "[Resilience][clamped]") {
    double lK = 40.0, dW = 16.0, dh = 11.0, E_P = 210000.0;
    double DA = dW + lK * std::tan(33.0 * M_PI / 180.0);
    double expected = (lK / E_P)
        * std::log((DA * DA + dW * dW - dh * dh) / (DA * DA - dW * dW + dh * dh))
        / (M_PI * dW);

    double delta_p = clamped_parts_resilience(lK, dW, dh, E_P);

    REQUIRE_THAT(delta_p, WithinRel(expected, 1e-12));
    REQUIRE_THAT(delta_p, WithinRel(5.82e-7, 0.01));
}

TEST_CASE("clamped_parts_resilience: softer parts are more resilient", "[Resilience][clamped]") {
    double steel = clamped_parts_resilience(40.0, 16.0, 11.0, 210000.0);
    double aluminium = clamped_parts_resilience(40.0, 16.0, 11.0, 70000.0);

    REQUIRE_THAT(aluminium / steel, WithinRel(3.0, 1e-9));
}

TEST_CASE("clamped_parts_resilience: cone angle is configurable", "[Resilience][clamped]") {
    CalculationSettings narrow;
    narrow.cone_half_angle_deg = 25.0;

    // A narrower cone engages less material
    REQUIRE(clamped_parts_resilience(40.0, 16.0, 11.0, 210000.0, narrow) >
            clamped_parts_resilience(40.0, 16.0, 11.0, 210000.0));
}

TEST_CASE("clamped_parts_resilience: narrow bearing annulus raises InvalidGeometry",
          "[Resilience][clamped][failure]") {
    JointError err = resilience_error(50.0, 10.0, 9.5, 210000.0);

    CHECK(err.code == ErrorCode::INVALID_GEOMETRY);
    CHECK(err.stage == CalculationStage::Resilience);
    CHECK(err.field == "dh");
    CHECK(err.details.count("dh/dW") == 1);
}

TEST_CASE("clamped_parts_resilience: non-positive log argument raises InvalidGeometry",
          "[Resilience][clamped][failure]") {
    // A negative cone angle collapses DA to zero at lK = dW / tan(33°)
    CalculationSettings settings;
    settings.cone_half_angle_deg = -33.0;

    JointError err = resilience_error(15.4, 10.0, 5.0, 210000.0, settings);

    CHECK(err.code == ErrorCode::INVALID_GEOMETRY);
    CHECK(err.stage == CalculationStage::Resilience);
    CHECK(err.details.count("denominator") == 1);
}

TEST_CASE("clamped_parts_resilience: never returns NaN", "[Resilience][clamped][failure]") {
    CalculationSettings settings;
    settings.cone_half_angle_deg = -33.0;

    for (double lK = 1.0; lK <= 40.0; lK += 0.7) {
        try {
            double delta_p = clamped_parts_resilience(lK, 10.0, 5.0, 210000.0, settings);
            CHECK(std::isfinite(delta_p));
            CHECK(delta_p > 0.0);
        } catch (const JointCalculationError& e) {
            CHECK(e.error().code == ErrorCode::INVALID_GEOMETRY);
        }
    }
}

TEST_CASE("clamped_parts_resilience: rejects invalid dimensions", "[Resilience][clamped]") {
    CHECK(resilience_error(0.0, 16.0, 11.0, 210000.0).field == "lK");
    CHECK(resilience_error(40.0, 16.0, 11.0, 0.0).field == "E_P");
    CHECK(resilience_error(40.0, 16.0, 0.0, 210000.0).field == "dh");
    CHECK(resilience_error(40.0, 11.0, 16.0, 210000.0).field == "dh");
}

TEST_CASE("evaluate_resilience: combines bolt and clamped parts", "[Resilience][evaluate]") {
    JointSpec spec;
    spec.stack.lK = 40.0;
    spec.stack.dW = 16.0;
    spec.stack.dh = 11.0;
    spec.stack.E_P = 210000.0;
    spec.material.E_B = 210000.0;

    GeometryState geometry;
    geometry.As = 58.0;

    ResilienceState state = evaluate_resilience(spec, CalculationSettings{}, geometry);

    REQUIRE_THAT(state.delta_bolt, WithinRel(bolt_resilience(40.0, 58.0, 210000.0), 1e-12));
    REQUIRE_THAT(state.delta_p, WithinRel(clamped_parts_resilience(40.0, 16.0, 11.0, 210000.0), 1e-12));
}
