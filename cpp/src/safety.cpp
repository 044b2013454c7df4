#include "boltjoint/safety.hpp"
#include "boltjoint/errors.hpp"
#include "boltjoint/logging.hpp"

#include <cmath>
#include <sstream>
#include <iomanip>

namespace boltjoint {

std::string SurfaceCheckResult::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << "Tensile/Max Stress: " << tensile_ratio
        << ", Shear/Max Stress: " << shear_ratio
        << ", Combined: " << combined
        << " -> " << (failed ? "NG" : "OK");
    return oss.str();
}

double bolt_stress(double FSB, double As) {
    if (!(As > 0.0)) {
        throw JointCalculationError(JointError::invalid_geometry(CalculationStage::Safety,
            "As", "stress area must be positive"));
    }
    return FSB / As;
}

double utilization_factor(double sigma, double Rp02) {
    if (!(Rp02 > 0.0) || !std::isfinite(Rp02)) {
        throw JointCalculationError(JointError::invalid_material(CalculationStage::Safety,
            "Rp02", "yield strength must be positive"));
    }
    return sigma / Rp02;
}

UtilizationClass classify_utilization(double utilization, const CalculationSettings& settings) {
    // A non-finite utilization is never classified as safe
    if (utilization < settings.utilization_marginal) {
        return UtilizationClass::OK;
    }
    if (utilization < settings.utilization_overload) {
        return UtilizationClass::MARGINAL;
    }
    return UtilizationClass::OVERLOAD;
}

SurfaceCheckResult surface_failure_criterion(const Eigen::Vector3d& force,
                                             double clamp_force,
                                             double d,
                                             double strength,
                                             double shear_ratio) {
    if (!(d > 0.0)) {
        throw JointCalculationError(JointError::invalid_geometry(CalculationStage::Safety,
            "d", "nominal diameter must be positive"));
    }
    if (!(strength > 0.0)) {
        throw JointCalculationError(JointError::invalid_material(CalculationStage::Safety,
            "strength", "strength basis must be positive"));
    }

    double area = M_PI * d * d / 4.0;
    double tensile_stress = (clamp_force + force.z()) / area;
    double shear_stress = force.head<2>().norm() / area;

    SurfaceCheckResult result;
    result.tensile_ratio = std::pow(tensile_stress / strength, 2);
    result.shear_ratio = std::pow(shear_stress / (shear_ratio * strength), 2);
    result.combined = result.tensile_ratio + result.shear_ratio;
    result.failed = !(result.combined <= 1.0);
    return result;
}

SafetyState evaluate_safety(const JointSpec& spec,
                            const CalculationSettings& settings,
                            const GeometryState& geometry,
                            const PreloadState& preload,
                            const WorkingLoadState& working,
                            WarningList& warnings) {
    const MaterialPair& material = spec.material;

    SafetyState state;
    state.sigma_bolt = bolt_stress(working.FSB, geometry.As);
    state.utilization = utilization_factor(state.sigma_bolt, material.Rp02);
    state.utilization_class = classify_utilization(state.utilization, settings);

    double strength = material.Rp02;
    if (settings.surface_strength_basis == StrengthBasis::UltimateStrength) {
        if (!(material.Rm > 0.0) || !std::isfinite(material.Rm)) {
            throw JointCalculationError(JointError::invalid_material(CalculationStage::Safety,
                "Rm", "ultimate strength must be positive"));
        }
        strength = material.Rm;
    }

    if (!std::isfinite(spec.load.FQx)) {
        throw JointCalculationError(JointError::invalid_load_case(CalculationStage::Safety,
            "FQx", "transverse load must be finite"));
    }
    if (!std::isfinite(spec.load.FQy)) {
        throw JointCalculationError(JointError::invalid_load_case(CalculationStage::Safety,
            "FQy", "transverse load must be finite"));
    }

    Eigen::Vector3d force(spec.load.FQx, spec.load.FQy, spec.load.FA);
    state.surface = surface_failure_criterion(force, preload.FV_assembly, spec.bolt.d,
                                              strength, settings.shear_strength_ratio);

    switch (state.utilization_class) {
        case UtilizationClass::MARGINAL:
            warnings.add(JointWarning::marginal_utilization(state.utilization));
            break;
        case UtilizationClass::OVERLOAD:
            warnings.add(JointWarning::utilization_overload(state.utilization));
            break;
        default:
            break;
    }
    if (state.surface.failed) {
        warnings.add(JointWarning::surface_criterion_exceeded(state.surface.combined));
    }

    state.overload = state.utilization_class == UtilizationClass::OVERLOAD || state.surface.failed;

    logger()->debug("safety: sigma={:.1f} MPa, utilization={:.3f} ({}), surface={:.3f}",
                    state.sigma_bolt, state.utilization,
                    utilization_class_to_string(state.utilization_class), state.surface.combined);
    return state;
}

} // namespace boltjoint
