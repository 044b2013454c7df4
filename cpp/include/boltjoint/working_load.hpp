#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"
#include "boltjoint/warnings.hpp"

namespace boltjoint {

/// Bolt force under working load: FSB = FV + Phi * FA [N]
double bolt_force_working(double FV, double FA, double Phi);

/// Clamp force under working load: FKB = FV - (1 - Phi) * FA [N]
double clamping_force_working(double FV, double FA, double Phi);

/**
 * @brief Working load stage
 *
 * FSB is computed from the assembly preload (largest bolt force), FKB from
 * the residual preload after embedding (smallest clamp force). FKB <= 0 sets
 * clamp_loss and adds a CLAMP_LOSS warning; the pipeline continues.
 */
WorkingLoadState evaluate_working_load(const JointSpec& spec,
                                       const PreloadState& preload,
                                       const LoadDistributionState& distribution,
                                       WarningList& warnings);

} // namespace boltjoint
