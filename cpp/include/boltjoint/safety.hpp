#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"
#include "boltjoint/settings.hpp"
#include "boltjoint/warnings.hpp"

#include <Eigen/Dense>

namespace boltjoint {

/**
 * @brief Tensile stress in the bolt thread, FSB / As [N/mm²]
 * @throws JointCalculationError (INVALID_GEOMETRY) if As <= 0
 */
double bolt_stress(double FSB, double As);

/**
 * @brief Utilization factor, sigma / Rp02
 * @throws JointCalculationError (INVALID_MATERIAL) if Rp02 <= 0
 */
double utilization_factor(double sigma, double Rp02);

/**
 * @brief Classify a utilization factor
 *
 * OVERLOAD if u >= settings.utilization_overload, MARGINAL if
 * u >= settings.utilization_marginal, otherwise OK.
 */
UtilizationClass classify_utilization(double utilization,
                                      const CalculationSettings& settings = CalculationSettings{});

/**
 * @brief Combined tensile and shear surface failure criterion
 *
 * With A = π d² / 4 (nominal diameter):
 *   tensile  = [ (Fclamp + Fz) / A / strength ]²
 *   shear    = [ sqrt(Fx² + Fy²) / A / (shear_ratio * strength) ]²
 *   combined = tensile + shear, failed if combined > 1
 *
 * Evaluated independently of the utilization factor.
 *
 * @param force External force (Fx, Fy, Fz) [N]; Fz is axial
 * @param clamp_force Clamp force [N]
 * @param d Nominal bolt diameter [mm]
 * @param strength Strength basis, Rm or Rp02 [N/mm²]
 * @param shear_ratio Shear to tensile strength ratio (0.577)
 * @throws JointCalculationError (INVALID_GEOMETRY) if d <= 0,
 *         (INVALID_MATERIAL) if strength <= 0
 */
SurfaceCheckResult surface_failure_criterion(const Eigen::Vector3d& force,
                                             double clamp_force,
                                             double d,
                                             double strength,
                                             double shear_ratio = 0.577);

/**
 * @brief Safety stage: stress, utilization and surface criterion
 *
 * Both checks are always reported. The surface criterion uses
 * Fclamp = FV_assembly, Fz = FA, (Fx, Fy) = (FQx, FQy) and the strength
 * selected by settings.surface_strength_basis.
 */
SafetyState evaluate_safety(const JointSpec& spec,
                            const CalculationSettings& settings,
                            const GeometryState& geometry,
                            const PreloadState& preload,
                            const WorkingLoadState& working,
                            WarningList& warnings);

} // namespace boltjoint
