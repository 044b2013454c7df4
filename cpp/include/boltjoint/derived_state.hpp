#pragma once

#include <string>

namespace boltjoint {

/**
 * @brief Output of the geometry stage
 */
struct GeometryState {
    double As = 0.0;             ///< Stress area [mm²]
    double dKm = 0.0;            ///< Mean bearing diameter used for head friction [mm]
    double bearing_area = 0.0;   ///< Annular bearing area under head/nut [mm²]
};

/**
 * @brief Output of the resilience stage
 */
struct ResilienceState {
    double delta_bolt = 0.0;   ///< Bolt resilience [mm/N]
    double delta_p = 0.0;      ///< Clamped-parts resilience [mm/N]
};

/**
 * @brief Output of the load distribution stage
 */
struct LoadDistributionState {
    double Phi = 0.0;     ///< Load factor, in (0, 1)
    double Phi_n = 0.0;   ///< Eccentric loading factor
};

/**
 * @brief Output of the preload stage
 */
struct PreloadState {
    double FV_assembly = 0.0;         ///< Assembly preload incl. thermal term [N]
    double F_embed_loss = 0.0;        ///< Preload lost to embedding [N]
    double FV_residual = 0.0;         ///< Assembly preload minus embedding loss [N]
    double FV_min = 0.0;              ///< Minimum required preload [N]
    double tightening_torque = 0.0;   ///< Torque producing FM_tab [N·m]
    double assembly_torque = 0.0;     ///< Tightening torque plus prevailing torque [N·m]
};

/**
 * @brief Output of the working load stage
 */
struct WorkingLoadState {
    double FSB = 0.0;          ///< Bolt force under working load [N]
    double FKB = 0.0;          ///< Clamp force under working load [N]
    bool clamp_loss = false;   ///< FKB <= 0
};

/**
 * @brief Three-way classification of the utilization factor
 */
enum class UtilizationClass {
    OK,         ///< Below the marginal threshold
    MARGINAL,   ///< In [marginal, overload)
    OVERLOAD    ///< At or above the overload threshold
};

/**
 * @brief Convert utilization class to string
 */
inline std::string utilization_class_to_string(UtilizationClass cls) {
    switch (cls) {
        case UtilizationClass::OK: return "OK";
        case UtilizationClass::MARGINAL: return "MARGINAL";
        case UtilizationClass::OVERLOAD: return "OVERLOAD";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result of the combined tensile and shear surface failure criterion
 */
struct SurfaceCheckResult {
    double tensile_ratio = 0.0;    ///< Squared tensile stress ratio
    double shear_ratio = 0.0;      ///< Squared shear stress ratio
    double combined = 0.0;         ///< tensile_ratio + shear_ratio
    bool failed = false;           ///< combined > 1

    std::string to_string() const;
};

/**
 * @brief Output of the safety stage
 */
struct SafetyState {
    double sigma_bolt = 0.0;     ///< Bolt stress [N/mm²]
    double utilization = 0.0;    ///< sigma_bolt / Rp02
    UtilizationClass utilization_class = UtilizationClass::OK;
    SurfaceCheckResult surface;  ///< Independent surface criterion
    bool overload = false;       ///< Utilization OVERLOAD or surface criterion failed
};

/**
 * @brief All derived quantities of one joint analysis, one record per stage
 */
struct DerivedState {
    GeometryState geometry;
    ResilienceState resilience;
    LoadDistributionState distribution;
    PreloadState preload;
    WorkingLoadState working;
    SafetyState safety;
};

} // namespace boltjoint
