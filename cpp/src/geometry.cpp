#include "boltjoint/geometry.hpp"
#include "boltjoint/errors.hpp"
#include "boltjoint/logging.hpp"

#include <cmath>

namespace boltjoint {

namespace {

[[noreturn]] void fail_geometry(const std::string& field, const std::string& reason) {
    throw JointCalculationError(
        JointError::invalid_geometry(CalculationStage::Geometry, field, reason));
}

} // namespace

double stress_area(double d2, double d3) {
    if (!(d2 > 0.0)) {
        fail_geometry("d2", "pitch diameter must be positive");
    }
    if (!(d3 > 0.0)) {
        fail_geometry("d3", "minor diameter must be positive");
    }
    if (!(d3 < d2)) {
        fail_geometry("d3", "minor diameter must be smaller than pitch diameter");
    }

    double d_avg = (d2 + d3) / 2.0;
    return (M_PI / 4.0) * d_avg * d_avg;
}

double eccentric_loading_factor(double n, double dA, double dW) {
    if (!(dW > 0.0)) {
        throw JointCalculationError(JointError::invalid_geometry(
            CalculationStage::LoadDistribution, "dW", "bearing diameter must be positive"));
    }
    if (!(dA > dW)) {
        throw JointCalculationError(JointError::invalid_geometry(
            CalculationStage::LoadDistribution, "dA",
            "load introduction diameter must exceed the bearing diameter"));
    }
    if (!(n > 0.0) || !std::isfinite(n)) {
        throw JointCalculationError(JointError::invalid_load_case(
            CalculationStage::LoadDistribution, "n", "eccentric load exponent must be positive"));
    }
    return 1.0 - std::pow(dW / dA, n);
}

double bearing_area(double dW, double dh) {
    return (M_PI / 4.0) * (dW * dW - dh * dh);
}

double mean_bearing_diameter(double dW, double dh) {
    return (dW + dh) / 2.0;
}

GeometryState evaluate_geometry(const JointSpec& spec) {
    const BoltGeometry& bolt = spec.bolt;
    const ClampedStack& stack = spec.stack;

    // Thread: d3 < d2 < d, P > 0
    if (!(bolt.d > 0.0)) {
        fail_geometry("d", "nominal diameter must be positive");
    }
    if (!(bolt.d2 < bolt.d)) {
        fail_geometry("d2", "pitch diameter must be smaller than nominal diameter");
    }
    if (!(bolt.P > 0.0)) {
        fail_geometry("P", "thread pitch must be positive");
    }
    if (!(bolt.alpha_deg > 0.0 && bolt.alpha_deg < 90.0)) {
        fail_geometry("alpha_deg", "flank half-angle must lie in (0, 90) degrees");
    }

    // Clamped stack: lK > 0, dW > dh > 0
    if (!(stack.lK > 0.0)) {
        fail_geometry("lK", "clamped length must be positive");
    }
    if (!(stack.dh > 0.0)) {
        fail_geometry("dh", "hole diameter must be positive");
    }
    if (!(stack.dW > stack.dh)) {
        fail_geometry("dh", "hole diameter must be smaller than bearing diameter");
    }

    // dKm = 0 selects the derived mean bearing diameter
    if (!(spec.friction.dKm >= 0.0) || !std::isfinite(spec.friction.dKm)) {
        fail_geometry("dKm", "mean bearing diameter must not be negative");
    }

    GeometryState state;
    state.As = stress_area(bolt.d2, bolt.d3);
    state.dKm = spec.friction.dKm > 0.0
        ? spec.friction.dKm
        : mean_bearing_diameter(stack.dW, stack.dh);
    state.bearing_area = bearing_area(stack.dW, stack.dh);

    logger()->debug("geometry: As={:.3f} mm2, dKm={:.3f} mm, Ap={:.3f} mm2",
                    state.As, state.dKm, state.bearing_area);
    return state;
}

} // namespace boltjoint
