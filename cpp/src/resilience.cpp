#include "boltjoint/resilience.hpp"
#include "boltjoint/errors.hpp"
#include "boltjoint/logging.hpp"

#include <cmath>

namespace boltjoint {

namespace {

[[noreturn]] void fail_geometry(const std::string& field, const std::string& reason) {
    throw JointCalculationError(
        JointError::invalid_geometry(CalculationStage::Resilience, field, reason));
}

} // namespace

double bolt_resilience(double lK, double As, double E_B) {
    if (!(lK > 0.0)) {
        fail_geometry("lK", "clamped length must be positive");
    }
    if (!(As > 0.0)) {
        fail_geometry("As", "stress area must be positive");
    }
    if (!(E_B > 0.0)) {
        fail_geometry("E_B", "bolt modulus of elasticity must be positive");
    }
    return lK / (As * E_B);
}

double clamped_parts_resilience(double lK, double dW, double dh, double E_P,
                                const CalculationSettings& settings) {
    if (!(lK > 0.0)) {
        fail_geometry("lK", "clamped length must be positive");
    }
    if (!(E_P > 0.0)) {
        fail_geometry("E_P", "clamped-part modulus of elasticity must be positive");
    }
    if (!(dh > 0.0)) {
        fail_geometry("dh", "hole diameter must be positive");
    }
    if (!(dW > dh)) {
        fail_geometry("dh", "hole diameter must be smaller than bearing diameter");
    }
    if (!(dh / dW <= settings.max_hole_to_bearing_ratio)) {
        JointError err = JointError::invalid_geometry(CalculationStage::Resilience, "dh",
            "bearing annulus too narrow for the substitute cone");
        err.details["dh/dW"] = std::to_string(dh / dW);
        err.details["max_hole_to_bearing_ratio"] = std::to_string(settings.max_hole_to_bearing_ratio);
        throw JointCalculationError(err);
    }

    double tan_phi = std::tan(settings.cone_half_angle_deg * M_PI / 180.0);
    double DA = dW + lK * tan_phi;

    double numerator = DA * DA + dW * dW - dh * dh;
    double denominator = DA * DA - dW * dW + dh * dh;

    // Hole larger than the effective cone: log argument leaves its domain
    if (!(denominator > 0.0 && numerator > 0.0)) {
        JointError err = JointError::invalid_geometry(CalculationStage::Resilience, "dh",
            "non-positive logarithm argument in substitute cone");
        err.details["DA"] = std::to_string(DA);
        err.details["numerator"] = std::to_string(numerator);
        err.details["denominator"] = std::to_string(denominator);
        throw JointCalculationError(err);
    }

    double delta_p = (lK / E_P) * std::log(numerator / denominator) / (M_PI * dW);
    if (!std::isfinite(delta_p) || !(delta_p > 0.0)) {
        JointError err = JointError::invalid_geometry(CalculationStage::Resilience, "dW",
            "substitute cone yields a non-positive clamped-parts resilience");
        err.details["delta_p"] = std::to_string(delta_p);
        throw JointCalculationError(err);
    }
    return delta_p;
}

ResilienceState evaluate_resilience(const JointSpec& spec,
                                    const CalculationSettings& settings,
                                    const GeometryState& geometry) {
    ResilienceState state;
    state.delta_bolt = bolt_resilience(spec.stack.lK, geometry.As, spec.material.E_B);
    state.delta_p = clamped_parts_resilience(spec.stack.lK, spec.stack.dW, spec.stack.dh,
                                             spec.stack.E_P, settings);

    logger()->debug("resilience: delta_bolt={:.4e} mm/N, delta_p={:.4e} mm/N",
                    state.delta_bolt, state.delta_p);
    return state;
}

} // namespace boltjoint
