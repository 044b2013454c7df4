#include "boltjoint/preload.hpp"
#include "boltjoint/errors.hpp"
#include "boltjoint/logging.hpp"

#include <cmath>

namespace boltjoint {

namespace {

[[noreturn]] void fail_load_case(const std::string& field, const std::string& reason) {
    throw JointCalculationError(
        JointError::invalid_load_case(CalculationStage::Preload, field, reason));
}

void check_resilience_sum(double delta_bolt, double delta_p) {
    if (!(delta_bolt + delta_p > 0.0)) {
        throw JointCalculationError(JointError::invalid_geometry(CalculationStage::Preload,
            "delta_p", "sum of bolt and clamped-parts resilience must be positive"));
    }
}

void check_friction(const std::string& field, double mu) {
    if (!(mu > 0.0 && mu < 1.0)) {
        throw JointCalculationError(
            JointError::invalid_friction(CalculationStage::Preload, field, mu));
    }
}

} // namespace

double embedding_loss(double fZ, double delta_bolt, double delta_p) {
    if (!(fZ >= 0.0)) {
        fail_load_case("fZ", "embedding amount must not be negative");
    }
    check_resilience_sum(delta_bolt, delta_p);
    return fZ / (delta_bolt + delta_p);
}

double minimum_preload(double FA, double FZ, double Phi, int n_interfaces) {
    if (n_interfaces < 1) {
        fail_load_case("n_interfaces", "at least one clamped interface is required");
    }
    if (!(Phi < 1.0)) {
        throw JointCalculationError(JointError::invalid_load_factor(CalculationStage::Preload,
            "Phi", "Phi = 1 leaves no finite preload that retains clamp load"));
    }
    if (!(Phi >= 0.0)) {
        throw JointCalculationError(JointError::invalid_load_factor(CalculationStage::Preload,
            "Phi", "load factor must not be negative"));
    }
    return (FA + FZ) / (n_interfaces * (1.0 - Phi));
}

double assembly_preload(double FM_tab, double alphaA, double alphaP, double deltaT,
                        double lK, double delta_bolt, double delta_p) {
    check_resilience_sum(delta_bolt, delta_p);
    double thermal_effect = (alphaP - alphaA) * deltaT * lK / (delta_bolt + delta_p);
    return FM_tab + thermal_effect;
}

double tightening_torque(double FV, double P, double d2, double muG, double muK,
                         double dKm, double alpha_deg) {
    check_friction("muG", muG);
    check_friction("muK", muK);
    if (!(d2 > 0.0)) {
        throw JointCalculationError(JointError::invalid_geometry(CalculationStage::Preload,
            "d2", "pitch diameter must be positive"));
    }

    double thread_torque = FV * d2 * 0.5
        * ((P / (M_PI * d2)) + (muG / std::cos(alpha_deg * M_PI / 180.0)));
    double head_torque = FV * muK * dKm * 0.5;

    // N·mm -> N·m
    return (thread_torque + head_torque) / 1000.0;
}

double effective_preload_torque(double MGF, double MA) {
    return MA - MGF;
}

PreloadState evaluate_preload(const JointSpec& spec,
                              const CalculationSettings& settings,
                              const GeometryState& geometry,
                              const ResilienceState& resilience,
                              const LoadDistributionState& distribution,
                              WarningList& warnings) {
    const LoadCase& load = spec.load;
    const FrictionModel& friction = spec.friction;

    if (!(load.FA >= 0.0) || !std::isfinite(load.FA)) {
        fail_load_case("FA", "axial working load must be finite and not negative");
    }
    if (!(load.FZ >= 0.0) || !std::isfinite(load.FZ)) {
        fail_load_case("FZ", "additional axial load must be finite and not negative");
    }
    if (!(spec.tightening.FM_tab > 0.0) || !std::isfinite(spec.tightening.FM_tab)) {
        fail_load_case("FM_tab", "tabulated assembly preload must be finite and positive");
    }
    if (!(spec.tightening.prevailing_torque >= 0.0) ||
        !std::isfinite(spec.tightening.prevailing_torque)) {
        fail_load_case("prevailing_torque", "prevailing torque must be finite and not negative");
    }

    if (!std::isfinite(load.deltaT)) {
        fail_load_case("deltaT", "temperature change must be finite");
    }
    if (!std::isfinite(spec.material.alphaA)) {
        throw JointCalculationError(JointError::invalid_material(CalculationStage::Preload,
            "alphaA", "bolt thermal expansion coefficient must be finite"));
    }
    if (!std::isfinite(spec.material.alphaP)) {
        throw JointCalculationError(JointError::invalid_material(CalculationStage::Preload,
            "alphaP", "clamped-part thermal expansion coefficient must be finite"));
    }

    check_friction("muG", friction.muG);
    check_friction("muK", friction.muK);
    if (friction.muG < settings.friction_conventional_min ||
        friction.muG > settings.friction_conventional_max) {
        warnings.add(JointWarning::friction_outside_range("muG", friction.muG,
            settings.friction_conventional_min, settings.friction_conventional_max));
    }
    if (friction.muK < settings.friction_conventional_min ||
        friction.muK > settings.friction_conventional_max) {
        warnings.add(JointWarning::friction_outside_range("muK", friction.muK,
            settings.friction_conventional_min, settings.friction_conventional_max));
    }

    PreloadState state;
    state.FV_assembly = assembly_preload(spec.tightening.FM_tab,
                                         spec.material.alphaA, spec.material.alphaP,
                                         load.deltaT, spec.stack.lK,
                                         resilience.delta_bolt, resilience.delta_p);
    state.F_embed_loss = embedding_loss(load.fZ, resilience.delta_bolt, resilience.delta_p);
    state.FV_residual = state.FV_assembly - state.F_embed_loss;
    state.FV_min = minimum_preload(load.FA, load.FZ, distribution.Phi, load.n_interfaces);
    state.tightening_torque = tightening_torque(spec.tightening.FM_tab, spec.bolt.P, spec.bolt.d2,
                                                friction.muG, friction.muK, geometry.dKm,
                                                spec.bolt.alpha_deg);
    state.assembly_torque = state.tightening_torque + spec.tightening.prevailing_torque;

    if (state.FV_residual < state.FV_min) {
        warnings.add(JointWarning::preload_below_minimum(state.FV_residual, state.FV_min));
    }

    logger()->debug("preload: FV={:.1f} N, F_embed={:.1f} N, FV_min={:.1f} N, MA={:.2f} N*m",
                    state.FV_assembly, state.F_embed_loss, state.FV_min, state.assembly_torque);
    return state;
}

} // namespace boltjoint
