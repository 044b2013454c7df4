/**
 * @file test_geometry.cpp
 * @brief Tests for the geometry stage: stress area, eccentric loading factor
 *        and bearing dimensions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "boltjoint/geometry.hpp"
#include "boltjoint/errors.hpp"

#include <cmath>
#include <limits>

using namespace boltjoint;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

JointError geometry_error(const JointSpec& spec) {
    try {
        evaluate_geometry(spec);
    } catch (const JointCalculationError& e) {
        return e.error();
    }
    return JointError();
}

JointSpec m10_spec() {
    JointSpec spec;
    spec.bolt.d = 10.0;
    spec.bolt.d2 = 9.026;
    spec.bolt.d3 = 8.160;
    spec.bolt.P = 1.5;
    spec.stack.lK = 40.0;
    spec.stack.dW = 16.0;
    spec.stack.dh = 11.0;
    spec.stack.E_P = 210000.0;
    return spec;
}

} // namespace

// =============================================================================
// stress_area
// =============================================================================

TEST_CASE("stress_area: M10 coarse with ISO 68-1 minor diameter", "[Geometry][stress_area]") {
    // ISO 898-1 tabulates As = 58.0 mm² for M10
    REQUIRE_THAT(stress_area(9.026, 8.160), WithinAbs(58.0, 0.1));
}

TEST_CASE("stress_area: follows (pi/4)((d2+d3)/2)^2", "[Geometry][stress_area]") {
    double d_avg = (9.026 + 7.938) / 2.0;
    REQUIRE_THAT(stress_area(9.026, 7.938), WithinRel(M_PI / 4.0 * d_avg * d_avg, 1e-12));
    REQUIRE_THAT(stress_area(9.026, 7.938), WithinAbs(56.5, 0.1));
}

TEST_CASE("stress_area: rejects non-positive diameters", "[Geometry][stress_area]") {
    REQUIRE_THROWS_AS(stress_area(0.0, 8.0), JointCalculationError);
    REQUIRE_THROWS_AS(stress_area(9.0, 0.0), JointCalculationError);
    REQUIRE_THROWS_AS(stress_area(-9.0, 8.0), JointCalculationError);
}

TEST_CASE("stress_area: rejects NaN diameters", "[Geometry][stress_area]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(stress_area(nan, 8.0), JointCalculationError);
    REQUIRE_THROWS_AS(stress_area(9.0, nan), JointCalculationError);
}

TEST_CASE("eccentric_loading_factor: NaN exponent is rejected", "[Geometry][eccentric]") {
    REQUIRE_THROWS_AS(eccentric_loading_factor(std::numeric_limits<double>::quiet_NaN(), 30.0, 16.0),
                      JointCalculationError);
    REQUIRE_THROWS_AS(eccentric_loading_factor(1.0, std::numeric_limits<double>::quiet_NaN(), 16.0),
                      JointCalculationError);
}

TEST_CASE("stress_area: rejects minor diameter not below pitch diameter", "[Geometry][stress_area]") {
    try {
        stress_area(9.0, 9.0);
        FAIL("expected JointCalculationError");
    } catch (const JointCalculationError& e) {
        CHECK(e.error().code == ErrorCode::INVALID_GEOMETRY);
        CHECK(e.error().stage == CalculationStage::Geometry);
        CHECK(e.error().field == "d3");
    }
}

// =============================================================================
// eccentric_loading_factor
// =============================================================================

TEST_CASE("eccentric_loading_factor: concentric load with n = 1", "[Geometry][eccentric]") {
    REQUIRE_THAT(eccentric_loading_factor(1.0, 30.0, 16.0), WithinAbs(1.0 - 16.0 / 30.0, 1e-12));
}

TEST_CASE("eccentric_loading_factor: grows with the exponent", "[Geometry][eccentric]") {
    double phi_1 = eccentric_loading_factor(1.0, 30.0, 16.0);
    double phi_4 = eccentric_loading_factor(4.0, 30.0, 16.0);
    REQUIRE(phi_4 > phi_1);
    REQUIRE(phi_4 < 1.0);
}

TEST_CASE("eccentric_loading_factor: dA must exceed dW", "[Geometry][eccentric]") {
    try {
        eccentric_loading_factor(1.0, 16.0, 16.0);
        FAIL("expected JointCalculationError");
    } catch (const JointCalculationError& e) {
        CHECK(e.error().code == ErrorCode::INVALID_GEOMETRY);
        CHECK(e.error().stage == CalculationStage::LoadDistribution);
        CHECK(e.error().field == "dA");
    }
}

// =============================================================================
// Bearing dimensions
// =============================================================================

TEST_CASE("bearing_area: annulus between dW and dh", "[Geometry][bearing]") {
    REQUIRE_THAT(bearing_area(16.0, 11.0), WithinAbs(M_PI / 4.0 * (256.0 - 121.0), 1e-9));
    REQUIRE_THAT(mean_bearing_diameter(16.0, 11.0), WithinAbs(13.5, 1e-12));
}

// =============================================================================
// evaluate_geometry
// =============================================================================

TEST_CASE("evaluate_geometry: derives As, dKm and bearing area", "[Geometry][evaluate]") {
    GeometryState state = evaluate_geometry(m10_spec());

    REQUIRE_THAT(state.As, WithinAbs(58.0, 0.1));
    REQUIRE_THAT(state.dKm, WithinAbs(13.5, 1e-12));
    REQUIRE_THAT(state.bearing_area, WithinAbs(bearing_area(16.0, 11.0), 1e-12));
}

TEST_CASE("evaluate_geometry: explicit mean bearing diameter is kept", "[Geometry][evaluate]") {
    JointSpec spec = m10_spec();
    spec.friction.dKm = 14.0;

    REQUIRE_THAT(evaluate_geometry(spec).dKm, WithinAbs(14.0, 1e-12));
}

TEST_CASE("evaluate_geometry: invalid inputs name the offending field", "[Geometry][evaluate]") {
    SECTION("pitch diameter not below nominal diameter") {
        JointSpec spec = m10_spec();
        spec.bolt.d2 = 10.0;
        JointError err = geometry_error(spec);
        CHECK(err.code == ErrorCode::INVALID_GEOMETRY);
        CHECK(err.field == "d2");
    }

    SECTION("non-positive pitch") {
        JointSpec spec = m10_spec();
        spec.bolt.P = 0.0;
        CHECK(geometry_error(spec).field == "P");
    }

    SECTION("non-positive clamped length") {
        JointSpec spec = m10_spec();
        spec.stack.lK = 0.0;
        CHECK(geometry_error(spec).field == "lK");
    }

    SECTION("hole not smaller than bearing diameter") {
        JointSpec spec = m10_spec();
        spec.stack.dh = 16.0;
        JointError err = geometry_error(spec);
        CHECK(err.code == ErrorCode::INVALID_GEOMETRY);
        CHECK(err.stage == CalculationStage::Geometry);
        CHECK(err.field == "dh");
    }

    SECTION("minor diameter not below pitch diameter") {
        JointSpec spec = m10_spec();
        spec.bolt.d3 = 9.5;
        CHECK(geometry_error(spec).field == "d3");
    }
}
