#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"
#include "boltjoint/settings.hpp"
#include "boltjoint/warnings.hpp"

namespace boltjoint {

/**
 * @brief Preload lost to embedding (settling of surface asperities)
 *
 * Formula: F_Z = fZ / (delta_S + delta_P)
 *
 * @param fZ Embedding amount [mm] (3-5 µm = 0.003-0.005 mm for machined steel)
 * @param delta_bolt Bolt resilience [mm/N]
 * @param delta_p Clamped-parts resilience [mm/N]
 * @return Preload loss [N]
 */
double embedding_loss(double fZ, double delta_bolt, double delta_p);

/**
 * @brief Minimum preload required to keep all interfaces clamped
 *
 * Formula: FV_min = (FA + FZ) / (n_interfaces * (1 - Phi))
 *
 * @throws JointCalculationError (INVALID_LOAD_FACTOR) if Phi >= 1 or Phi < 0
 * @throws JointCalculationError (INVALID_LOAD_CASE) if n_interfaces < 1
 */
double minimum_preload(double FA, double FZ, double Phi, int n_interfaces);

/**
 * @brief Assembly preload including the thermal preload change
 *
 * Formula: FV = FMTab + (alphaP - alphaA) * deltaT * lK / (delta_S + delta_P)
 *
 * The thermal term is negative when the clamped parts expand less than
 * the bolt; it is not clamped to zero.
 *
 * @param FM_tab Tabulated assembly preload [N]
 * @param alphaA Bolt thermal expansion coefficient [1/K]
 * @param alphaP Clamped-part thermal expansion coefficient [1/K]
 * @param deltaT Temperature change [K]
 * @param lK Clamped length [mm]
 * @param delta_bolt Bolt resilience [mm/N]
 * @param delta_p Clamped-parts resilience [mm/N]
 * @return Assembly preload [N]
 */
double assembly_preload(double FM_tab, double alphaA, double alphaP, double deltaT,
                        double lK, double delta_bolt, double delta_p);

/**
 * @brief Tightening torque needed to reach a preload (VDI 2230)
 *
 *   M_G = FV * d2/2 * (P / (π d2) + muG / cos(alpha))
 *   M_K = FV * muK * dKm / 2
 *   M_A = (M_G + M_K) / 1000
 *
 * @return Tightening torque [N·m]
 * @throws JointCalculationError (INVALID_FRICTION) if a coefficient is outside (0, 1)
 */
double tightening_torque(double FV, double P, double d2, double muG, double muK,
                         double dKm, double alpha_deg = 30.0);

/**
 * @brief Torque that actually produces preload when a locking element is used
 *
 * @param MGF Prevailing torque of the locking element [N·m]
 * @param MA Applied assembly torque [N·m]
 * @return MA - MGF [N·m]
 */
double effective_preload_torque(double MGF, double MA);

/**
 * @brief Preload stage
 *
 * Produces FV_assembly, F_embed_loss, FV_residual, FV_min and the tightening
 * torque for FM_tab. Adds PRELOAD_BELOW_MINIMUM when the residual preload
 * cannot keep the interfaces clamped, and FRICTION_OUTSIDE_CONVENTIONAL_RANGE
 * for unusual friction coefficients.
 */
PreloadState evaluate_preload(const JointSpec& spec,
                              const CalculationSettings& settings,
                              const GeometryState& geometry,
                              const ResilienceState& resilience,
                              const LoadDistributionState& distribution,
                              WarningList& warnings);

} // namespace boltjoint
