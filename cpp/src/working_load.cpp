#include "boltjoint/working_load.hpp"
#include "boltjoint/logging.hpp"

namespace boltjoint {

double bolt_force_working(double FV, double FA, double Phi) {
    return FV + Phi * FA;
}

double clamping_force_working(double FV, double FA, double Phi) {
    return FV - (1.0 - Phi) * FA;
}

WorkingLoadState evaluate_working_load(const JointSpec& spec,
                                       const PreloadState& preload,
                                       const LoadDistributionState& distribution,
                                       WarningList& warnings) {
    WorkingLoadState state;
    state.FSB = bolt_force_working(preload.FV_assembly, spec.load.FA, distribution.Phi);
    state.FKB = clamping_force_working(preload.FV_residual, spec.load.FA, distribution.Phi);
    state.clamp_loss = !(state.FKB > 0.0);

    if (state.clamp_loss) {
        warnings.add(JointWarning::clamp_loss(state.FKB));
    }

    logger()->debug("working load: FSB={:.1f} N, FKB={:.1f} N", state.FSB, state.FKB);
    return state;
}

} // namespace boltjoint
