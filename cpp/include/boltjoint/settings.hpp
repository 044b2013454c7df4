#pragma once

namespace boltjoint {

/**
 * @brief Strength value used as the basis of the surface failure criterion
 */
enum class StrengthBasis {
    UltimateStrength,   ///< Rm (UTS)
    YieldStrength       ///< Rp0.2
};

/**
 * @brief Named constants and check thresholds for the joint calculation
 *
 * Passed by const reference into every stage; there is no process-wide
 * mutable configuration.
 */
struct CalculationSettings {
    /// Half-angle of the VDI 2230 substitute deformation cone [deg]
    double cone_half_angle_deg = 33.0;

    /// Utilization at or above which a joint is classified MARGINAL
    /// Static loads are acceptable below this value
    double utilization_marginal = 0.9;

    /// Utilization at or above which a joint is classified OVERLOAD
    double utilization_overload = 1.0;

    /// Ratio of shear strength to tensile strength (von Mises: 1/sqrt(3))
    double shear_strength_ratio = 0.577;

    /// Strength used by the surface failure criterion
    StrengthBasis surface_strength_basis = StrengthBasis::YieldStrength;

    /// Largest admissible hole-to-bearing diameter ratio dh/dW.
    /// Above this the bearing annulus is too narrow for the substitute cone.
    double max_hole_to_bearing_ratio = 0.9;

    /// Conventional friction coefficient range; values outside produce a warning
    double friction_conventional_min = 0.08;
    double friction_conventional_max = 0.20;
};

} // namespace boltjoint
