#pragma once

#include "boltjoint/joint_spec.hpp"

#include <optional>
#include <string>
#include <vector>

namespace boltjoint {

/**
 * @brief ISO metric coarse thread with standard head and hole dimensions
 *
 * - dw: minimum bearing face diameter of a hexagon head bolt (ISO 4017) [mm]
 * - dh: medium series clearance hole (ISO 273) [mm]
 */
struct MetricThread {
    std::string name;   ///< Designation, e.g. "M10"
    double d;           ///< Nominal diameter [mm]
    double P;           ///< Coarse pitch [mm]
    double dw;          ///< Bearing face diameter [mm]
    double dh;          ///< Clearance hole diameter [mm]

    /**
     * @brief Thread geometry from the ISO 68-1 basic profile
     */
    BoltGeometry geometry() const;
};

/**
 * @brief Thread geometry from the ISO 68-1 basic profile
 *
 *   d2 = d - 0.649519 * P
 *   d3 = d - 1.226869 * P
 *
 * @param d Nominal diameter [mm]
 * @param P Pitch [mm]
 * @throws std::invalid_argument if d <= 0, P <= 0 or the minor diameter is non-positive
 */
BoltGeometry metric_thread(double d, double P);

/**
 * @brief ISO metric coarse series M3 to M36
 */
const std::vector<MetricThread>& metric_coarse_threads();

/**
 * @brief Look up a coarse thread by nominal diameter
 * @return The thread, or std::nullopt if d is not in the series
 */
std::optional<MetricThread> find_metric_coarse(double d);

} // namespace boltjoint
