#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"
#include "boltjoint/settings.hpp"

namespace boltjoint {

/**
 * @brief Elastic resilience (compliance) of the bolt
 *
 * Formula: delta_S = lK / (As * E_B)
 *
 * @param lK Clamped length [mm]
 * @param As Stress area [mm²]
 * @param E_B Bolt modulus of elasticity [N/mm²]
 * @return Bolt resilience [mm/N]
 * @throws JointCalculationError (INVALID_GEOMETRY) if any argument is non-positive
 */
double bolt_resilience(double lK, double As, double E_B);

/**
 * @brief Resilience of the clamped parts using the VDI 2230 substitute cone
 *
 *   DA = dW + lK * tan(phi)
 *   delta_P = (lK / E_P) * ln[(DA² + dW² - dh²) / (DA² - dW² + dh²)] / (π * dW)
 *
 * with phi = settings.cone_half_angle_deg (33°). The logarithm argument must
 * be strictly positive and the bearing annulus must satisfy
 * dh / dW <= settings.max_hole_to_bearing_ratio; otherwise the geometry lies
 * outside the cone model.
 *
 * @param lK Clamped length [mm]
 * @param dW Bearing diameter [mm]
 * @param dh Hole diameter [mm]
 * @param E_P Clamped-part modulus of elasticity [N/mm²]
 * @param settings Cone angle and annulus limit
 * @return Clamped-parts resilience [mm/N]
 * @throws JointCalculationError (INVALID_GEOMETRY) instead of returning NaN
 */
double clamped_parts_resilience(double lK, double dW, double dh, double E_P,
                                const CalculationSettings& settings = CalculationSettings{});

/**
 * @brief Resilience stage
 */
ResilienceState evaluate_resilience(const JointSpec& spec,
                                    const CalculationSettings& settings,
                                    const GeometryState& geometry);

} // namespace boltjoint
