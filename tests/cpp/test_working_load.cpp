/**
 * @file test_working_load.cpp
 * @brief Tests for bolt and clamping forces under the working load
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "boltjoint/working_load.hpp"
#include "boltjoint/warnings.hpp"

using namespace boltjoint;
using Catch::Matchers::WithinAbs;

TEST_CASE("bolt_force_working: FV + Phi * FA", "[WorkingLoad][FSB]") {
    REQUIRE_THAT(bolt_force_working(15000.0, 5000.0, 0.3), WithinAbs(16500.0, 1e-9));
}

TEST_CASE("clamping_force_working: FV - (1 - Phi) * FA", "[WorkingLoad][FKB]") {
    REQUIRE_THAT(clamping_force_working(15000.0, 5000.0, 0.3), WithinAbs(11500.0, 1e-9));
}

TEST_CASE("bolt_force_working: load share recovers the preload", "[WorkingLoad][FSB]") {
    const double phis[] = {0.05, 0.3, 0.686, 0.95};
    for (double phi : phis) {
        double FSB = bolt_force_working(15000.0, 5000.0, phi);
        CHECK_THAT(FSB - phi * 5000.0, WithinAbs(15000.0, 1e-9));
    }
}

TEST_CASE("bolt_force_working: rigid bolt (Phi = 0) carries only the preload", "[WorkingLoad][FSB]") {
    REQUIRE_THAT(bolt_force_working(15000.0, 5000.0, 0.0), WithinAbs(15000.0, 1e-12));
    REQUIRE_THAT(clamping_force_working(15000.0, 5000.0, 0.0), WithinAbs(10000.0, 1e-12));
}

TEST_CASE("working load: bolt and clamp forces sum to preload plus load", "[WorkingLoad]") {
    double FSB = bolt_force_working(15000.0, 5000.0, 0.3);
    double FKB = clamping_force_working(15000.0, 5000.0, 0.3);
    REQUIRE_THAT(FSB - FKB, WithinAbs(5000.0, 1e-9));
}

TEST_CASE("evaluate_working_load: clamp loss is reported, not thrown", "[WorkingLoad][evaluate]") {
    JointSpec spec;
    spec.load.FA = 30000.0;

    PreloadState preload;
    preload.FV_assembly = 15000.0;
    preload.FV_residual = 14000.0;

    LoadDistributionState distribution;
    distribution.Phi = 0.3;

    WarningList warnings;
    WorkingLoadState state = evaluate_working_load(spec, preload, distribution, warnings);

    REQUIRE_THAT(state.FSB, WithinAbs(24000.0, 1e-9));
    REQUIRE_THAT(state.FKB, WithinAbs(-7000.0, 1e-9));
    REQUIRE(state.clamp_loss);
    REQUIRE(warnings.contains(WarningCode::CLAMP_LOSS));
}

TEST_CASE("evaluate_working_load: FSB uses assembly preload, FKB residual preload",
          "[WorkingLoad][evaluate]") {
    JointSpec spec;
    spec.load.FA = 5000.0;

    PreloadState preload;
    preload.FV_assembly = 15000.0;
    preload.FV_residual = 13000.0;

    LoadDistributionState distribution;
    distribution.Phi = 0.3;

    WarningList warnings;
    WorkingLoadState state = evaluate_working_load(spec, preload, distribution, warnings);

    REQUIRE_THAT(state.FSB, WithinAbs(16500.0, 1e-9));
    REQUIRE_THAT(state.FKB, WithinAbs(9500.0, 1e-9));
    REQUIRE_FALSE(state.clamp_loss);
    REQUIRE_FALSE(warnings.has_warnings());
}
