#pragma once

#include "boltjoint/derived_state.hpp"
#include "boltjoint/settings.hpp"

#include <Eigen/Dense>

namespace boltjoint {

/**
 * @brief Classical torque and clamping-force rules
 *
 * Single-formula utilities for quick estimates, independent of the VDI 2230
 * pipeline. They share only stress_area() (geometry.hpp) and the surface
 * failure criterion (safety.hpp) with it.
 */
namespace classical {

/**
 * @brief Tightening torque from the general torque equation
 *
 * M = F * (P / (2π) + mu_thread * d2 / (2 cos(alpha)) + mu_head * d_bearing / 2)
 * with d_bearing = (d0 + b0) / 2.
 *
 * @param load_axial Axial preload [N]
 * @param d2 Pitch diameter [mm]
 * @param d0 Bearing surface inner diameter [mm]
 * @param b0 Bearing surface outer diameter [mm]
 * @param mu_thread Thread friction coefficient (typically 0.12-0.18)
 * @param mu_head Head/nut friction coefficient (typically 0.10-0.16)
 * @param alpha_deg Thread flank angle [deg]
 * @param P Thread pitch [mm]
 * @return Tightening torque [N·m]
 * @throws std::invalid_argument for non-positive d2 or P, or alpha outside (0, 90)
 */
double general_torque(double load_axial, double d2, double d0, double b0,
                      double mu_thread, double mu_head, double alpha_deg, double P);

/**
 * @brief Axial load carried at an allowed stress, allowed_stress * As [N]
 */
double axial_load_from_stress(double allowed_stress, double As);

/**
 * @brief Clamping force from torque with a lumped torque coefficient
 *
 * F = T / (K * d), d converted to metres.
 *
 * @param torque Applied torque [N·m]
 * @param coef Torque coefficient K (typically 0.15-0.20)
 * @param bolt_size Nominal diameter [mm]
 * @return Clamping force [N]
 * @throws std::invalid_argument if coef <= 0 or bolt_size <= 0
 */
double clamping_force_from_torque(double torque, double coef, double bolt_size);

/**
 * @brief Surface failure check of a single bolt from external forces
 *
 * @param clamp_force Calculated clamping force [N]
 * @param force External force (Fx, Fy, Fz) [N]
 * @param uts Ultimate tensile strength [N/mm²]
 * @param ys Yield strength [N/mm²]
 * @param bolt_diameter Nominal diameter [mm]
 * @param basis Which strength to compare against
 * @param shear_ratio Shear to tensile strength ratio
 */
SurfaceCheckResult validate_bolt(double clamp_force, const Eigen::Vector3d& force,
                                 double uts, double ys, double bolt_diameter,
                                 StrengthBasis basis = StrengthBasis::UltimateStrength,
                                 double shear_ratio = 0.577);

} // namespace classical
} // namespace boltjoint
