#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"

namespace boltjoint {

/**
 * @brief Load factor: share of the axial working load carried by the bolt
 *
 * Formula: Phi = delta_S / (delta_S + delta_P)
 *
 * Phi -> 0 for a rigid clamped stack, Phi -> 1 for a very flexible one.
 *
 * @param delta_bolt Bolt resilience [mm/N]
 * @param delta_p Clamped-parts resilience [mm/N]
 * @throws JointCalculationError (INVALID_LOAD_FACTOR) unless both resiliences are positive
 */
double load_factor(double delta_bolt, double delta_p);

/**
 * @brief Load distribution stage: Phi and the eccentric loading factor Phi_n
 *
 * @throws JointCalculationError (INVALID_LOAD_FACTOR) if Phi is not strictly in (0, 1)
 * @throws JointCalculationError (INVALID_GEOMETRY) unless dA > dW
 */
LoadDistributionState evaluate_load_distribution(const JointSpec& spec,
                                                 const ResilienceState& resilience);

} // namespace boltjoint
