#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"

namespace boltjoint {

/**
 * @brief Stress area of a threaded fastener (ISO 898-1)
 *
 * Formula: As = (π/4) * ((d2 + d3) / 2)²
 *
 * @param d2 Pitch diameter [mm]
 * @param d3 Minor diameter [mm]
 * @return Stress area [mm²]
 * @throws JointCalculationError (INVALID_GEOMETRY) if d2 <= 0, d3 <= 0 or d3 >= d2
 */
double stress_area(double d2, double d3);

/**
 * @brief Eccentric loading factor
 *
 * Formula: Phi_n = 1 - (dW / dA)^n
 *
 * The exponent n selects the load introduction model (1 = uniform pressure,
 * 4-8 = bending-dominated); it is not checked for engineering plausibility.
 *
 * @param n Load introduction exponent
 * @param dA Load introduction diameter [mm]
 * @param dW Bearing diameter [mm]
 * @throws JointCalculationError (INVALID_GEOMETRY) unless dA > dW > 0
 */
double eccentric_loading_factor(double n, double dA, double dW);

/**
 * @brief Annular bearing area under head or nut, (π/4) * (dW² - dh²) [mm²]
 */
double bearing_area(double dW, double dh);

/// Mean bearing diameter (dW + dh) / 2 [mm]
double mean_bearing_diameter(double dW, double dh);

/**
 * @brief Geometry stage: validate bolt and stack dimensions, derive As and bearing geometry
 *
 * Checks d3 < d2 < d, P > 0, 0° < alpha < 90°, lK > 0 and dW > dh > 0.
 *
 * @throws JointCalculationError (INVALID_GEOMETRY) naming the offending field
 */
GeometryState evaluate_geometry(const JointSpec& spec);

} // namespace boltjoint
