#include "boltjoint/load_distribution.hpp"
#include "boltjoint/geometry.hpp"
#include "boltjoint/errors.hpp"
#include "boltjoint/logging.hpp"

namespace boltjoint {

double load_factor(double delta_bolt, double delta_p) {
    if (!(delta_bolt > 0.0)) {
        throw JointCalculationError(JointError::invalid_load_factor(
            CalculationStage::LoadDistribution, "delta_bolt", "bolt resilience must be positive"));
    }
    if (!(delta_p > 0.0)) {
        throw JointCalculationError(JointError::invalid_load_factor(
            CalculationStage::LoadDistribution, "delta_p",
            "clamped-parts resilience must be positive"));
    }
    return delta_bolt / (delta_bolt + delta_p);
}

LoadDistributionState evaluate_load_distribution(const JointSpec& spec,
                                                 const ResilienceState& resilience) {
    LoadDistributionState state;
    state.Phi = load_factor(resilience.delta_bolt, resilience.delta_p);

    // Round-off can push Phi onto the boundary for extreme stiffness ratios
    if (!(state.Phi > 0.0 && state.Phi < 1.0)) {
        JointError err = JointError::invalid_load_factor(CalculationStage::LoadDistribution, "Phi",
            "load factor must lie strictly in (0, 1)");
        err.details["Phi"] = std::to_string(state.Phi);
        throw JointCalculationError(err);
    }

    state.Phi_n = eccentric_loading_factor(spec.load.n, spec.load.dA, spec.stack.dW);

    logger()->debug("load distribution: Phi={:.4f}, Phi_n={:.4f}", state.Phi, state.Phi_n);
    return state;
}

} // namespace boltjoint
