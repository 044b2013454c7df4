#include "boltjoint/classical.hpp"
#include "boltjoint/safety.hpp"

#include <cmath>
#include <stdexcept>

namespace boltjoint {
namespace classical {

double general_torque(double load_axial, double d2, double d0, double b0,
                      double mu_thread, double mu_head, double alpha_deg, double P) {
    if (!(d2 > 0.0)) {
        throw std::invalid_argument("general_torque: pitch diameter must be positive");
    }
    if (!(P > 0.0)) {
        throw std::invalid_argument("general_torque: thread pitch must be positive");
    }
    if (!(alpha_deg > 0.0 && alpha_deg < 90.0)) {
        throw std::invalid_argument("general_torque: flank angle must lie in (0, 90) degrees");
    }

    double thread_term = (P / (2.0 * M_PI)) + (d2 * mu_thread) / (2.0 * std::cos(alpha_deg * M_PI / 180.0));

    double dKm = (d0 + b0) / 2.0;
    double head_term = mu_head * dKm / 2.0;

    // N·mm -> N·m
    return load_axial * (thread_term + head_term) / 1000.0;
}

double axial_load_from_stress(double allowed_stress, double As) {
    return allowed_stress * As;
}

double clamping_force_from_torque(double torque, double coef, double bolt_size) {
    if (!(coef > 0.0)) {
        throw std::invalid_argument("clamping_force_from_torque: torque coefficient must be positive");
    }
    if (!(bolt_size > 0.0)) {
        throw std::invalid_argument("clamping_force_from_torque: bolt size must be positive");
    }
    return torque / (coef * bolt_size * 0.001);
}

SurfaceCheckResult validate_bolt(double clamp_force, const Eigen::Vector3d& force,
                                 double uts, double ys, double bolt_diameter,
                                 StrengthBasis basis, double shear_ratio) {
    double strength = (basis == StrengthBasis::UltimateStrength) ? uts : ys;
    return surface_failure_criterion(force, clamp_force, bolt_diameter, strength, shear_ratio);
}

} // namespace classical
} // namespace boltjoint
