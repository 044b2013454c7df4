#include "boltjoint/joint_analysis.hpp"
#include "boltjoint/geometry.hpp"
#include "boltjoint/resilience.hpp"
#include "boltjoint/load_distribution.hpp"
#include "boltjoint/preload.hpp"
#include "boltjoint/working_load.hpp"
#include "boltjoint/safety.hpp"
#include "boltjoint/logging.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace boltjoint {

namespace {

void log_warnings(const WarningList& warnings) {
    for (const auto& w : warnings.warnings) {
        logger()->debug("{}", w.to_string());
    }
}

/**
 * @brief Tracks the earliest stage affected by a set of field changes
 */
class StageInvalidation {
public:
    void mark(bool changed, CalculationStage stage) {
        if (changed) {
            earliest_ = std::min(earliest_, static_cast<int>(stage));
        }
    }

    bool any() const { return earliest_ < kStageCount; }

    CalculationStage earliest() const { return static_cast<CalculationStage>(earliest_); }

private:
    int earliest_ = kStageCount;
};

} // namespace

std::string JointResult::summary() const {
    if (!success) {
        return "FAILED " + error.to_string();
    }

    std::ostringstream oss;
    oss << "OK: Phi=" << state->distribution.Phi
        << ", FSB=" << state->working.FSB << " N"
        << ", FKB=" << state->working.FKB << " N"
        << ", utilization=" << state->safety.utilization
        << " (" << utilization_class_to_string(state->safety.utilization_class) << ")"
        << ", surface=" << state->safety.surface.combined
        << "; " << warnings.summary();
    return oss.str();
}

JointResult evaluate_joint(const JointSpec& spec, const CalculationSettings& settings) {
    JointResult result;

    try {
        WarningList warnings;

        GeometryState geometry = evaluate_geometry(spec);
        ResilienceState resilience = evaluate_resilience(spec, settings, geometry);
        LoadDistributionState distribution = evaluate_load_distribution(spec, resilience);
        PreloadState preload = evaluate_preload(spec, settings, geometry, resilience,
                                                distribution, warnings);
        WorkingLoadState working = evaluate_working_load(spec, preload, distribution, warnings);
        SafetyState safety = evaluate_safety(spec, settings, geometry, preload, working, warnings);

        result.state = DerivedState{geometry, resilience, distribution, preload, working, safety};
        result.warnings = warnings;
        result.success = true;
    } catch (const JointCalculationError& e) {
        result.error = e.error();
        logger()->debug("joint evaluation failed: {}", result.error.to_string());
        return result;
    }

    log_warnings(result.warnings);
    return result;
}

std::vector<JointResult> evaluate_joints(const std::vector<JointSpec>& specs,
                                         const CalculationSettings& settings) {
    std::vector<JointResult> results;
    results.reserve(specs.size());
    size_t failed = 0;
    for (const auto& spec : specs) {
        results.push_back(evaluate_joint(spec, settings));
        if (!results.back().success) {
            ++failed;
        }
    }
    logger()->info("evaluated {} joints, {} failed", results.size(), failed);
    return results;
}

std::vector<SweepPoint> sweep_metric_sizes(const JointSpec& base,
                                           const std::vector<double>& diameters,
                                           const CalculationSettings& settings) {
    std::vector<SweepPoint> points;
    points.reserve(diameters.size());

    for (double d : diameters) {
        std::optional<MetricThread> thread = find_metric_coarse(d);
        if (!thread) {
            throw std::invalid_argument("sweep_metric_sizes: no ISO coarse thread with d = " +
                                        std::to_string(d) + " mm");
        }

        JointSpec spec = base;
        spec.bolt = thread->geometry();
        spec.stack.dW = thread->dw;
        spec.stack.dh = thread->dh;

        logger()->debug("sweep: evaluating {}", thread->name);
        points.push_back(SweepPoint{*thread, evaluate_joint(spec, settings)});
    }
    return points;
}

Eigen::VectorXd sweep_utilization(const std::vector<SweepPoint>& points) {
    Eigen::VectorXd utilization(static_cast<Eigen::Index>(points.size()));
    for (size_t i = 0; i < points.size(); ++i) {
        const JointResult& result = points[i].result;
        utilization(static_cast<Eigen::Index>(i)) = result.success
            ? result.state->safety.utilization
            : std::numeric_limits<double>::quiet_NaN();
    }
    return utilization;
}

// =============================================================================
// JointAnalysis
// =============================================================================

JointAnalysis::JointAnalysis(const JointSpec& spec, const CalculationSettings& settings)
    : spec_(spec), settings_(settings) {}

void JointAnalysis::invalidate_from(CalculationStage stage) {
    int first = static_cast<int>(stage);

    if (first <= static_cast<int>(CalculationStage::Geometry)) geometry_.reset();
    if (first <= static_cast<int>(CalculationStage::Resilience)) resilience_.reset();
    if (first <= static_cast<int>(CalculationStage::LoadDistribution)) distribution_.reset();
    if (first <= static_cast<int>(CalculationStage::Preload)) preload_.reset();
    if (first <= static_cast<int>(CalculationStage::WorkingLoad)) working_.reset();
    if (first <= static_cast<int>(CalculationStage::Safety)) safety_.reset();

    for (int i = first; i < kStageCount; ++i) {
        stage_warnings_[i].clear();
    }
    analyzed_ = false;
}

void JointAnalysis::set_bolt(const BoltGeometry& bolt) {
    StageInvalidation inv;
    inv.mark(bolt.d != spec_.bolt.d || bolt.d2 != spec_.bolt.d2 || bolt.d3 != spec_.bolt.d3 ||
             bolt.P != spec_.bolt.P || bolt.alpha_deg != spec_.bolt.alpha_deg,
             CalculationStage::Geometry);
    spec_.bolt = bolt;
    if (inv.any()) invalidate_from(inv.earliest());
}

void JointAnalysis::set_stack(const ClampedStack& stack) {
    StageInvalidation inv;
    inv.mark(stack.lK != spec_.stack.lK || stack.dW != spec_.stack.dW ||
             stack.dh != spec_.stack.dh, CalculationStage::Geometry);
    inv.mark(stack.E_P != spec_.stack.E_P, CalculationStage::Resilience);
    spec_.stack = stack;
    if (inv.any()) invalidate_from(inv.earliest());
}

void JointAnalysis::set_material(const MaterialPair& material) {
    StageInvalidation inv;
    inv.mark(material.E_B != spec_.material.E_B, CalculationStage::Resilience);
    inv.mark(material.alphaA != spec_.material.alphaA ||
             material.alphaP != spec_.material.alphaP, CalculationStage::Preload);
    inv.mark(material.Rp02 != spec_.material.Rp02 ||
             material.Rm != spec_.material.Rm, CalculationStage::Safety);
    spec_.material = material;
    if (inv.any()) invalidate_from(inv.earliest());
}

void JointAnalysis::set_friction(const FrictionModel& friction) {
    StageInvalidation inv;
    // dKm is resolved by the geometry stage
    inv.mark(friction.dKm != spec_.friction.dKm, CalculationStage::Geometry);
    inv.mark(friction.muG != spec_.friction.muG ||
             friction.muK != spec_.friction.muK, CalculationStage::Preload);
    spec_.friction = friction;
    if (inv.any()) invalidate_from(inv.earliest());
}

void JointAnalysis::set_load_case(const LoadCase& load) {
    const LoadCase& old = spec_.load;
    StageInvalidation inv;
    inv.mark(load.n != old.n || load.dA != old.dA, CalculationStage::LoadDistribution);
    inv.mark(load.FA != old.FA || load.FZ != old.FZ || load.deltaT != old.deltaT ||
             load.n_interfaces != old.n_interfaces || load.fZ != old.fZ,
             CalculationStage::Preload);
    inv.mark(load.FQx != old.FQx || load.FQy != old.FQy, CalculationStage::Safety);
    spec_.load = load;
    if (inv.any()) invalidate_from(inv.earliest());
}

void JointAnalysis::set_tightening(const Tightening& tightening) {
    StageInvalidation inv;
    inv.mark(tightening.FM_tab != spec_.tightening.FM_tab ||
             tightening.prevailing_torque != spec_.tightening.prevailing_torque,
             CalculationStage::Preload);
    spec_.tightening = tightening;
    if (inv.any()) invalidate_from(inv.earliest());
}

void JointAnalysis::set_settings(const CalculationSettings& settings) {
    const CalculationSettings& old = settings_;
    StageInvalidation inv;
    inv.mark(settings.cone_half_angle_deg != old.cone_half_angle_deg ||
             settings.max_hole_to_bearing_ratio != old.max_hole_to_bearing_ratio,
             CalculationStage::Resilience);
    inv.mark(settings.friction_conventional_min != old.friction_conventional_min ||
             settings.friction_conventional_max != old.friction_conventional_max,
             CalculationStage::Preload);
    inv.mark(settings.utilization_marginal != old.utilization_marginal ||
             settings.utilization_overload != old.utilization_overload ||
             settings.shear_strength_ratio != old.shear_strength_ratio ||
             settings.surface_strength_basis != old.surface_strength_basis,
             CalculationStage::Safety);
    settings_ = settings;
    if (inv.any()) invalidate_from(inv.earliest());
}

bool JointAnalysis::analyze() {
    error_ = JointError();

    try {
        if (!geometry_) {
            geometry_ = evaluate_geometry(spec_);
            ++evaluation_counts_[static_cast<int>(CalculationStage::Geometry)];
        }
        if (!resilience_) {
            resilience_ = evaluate_resilience(spec_, settings_, *geometry_);
            ++evaluation_counts_[static_cast<int>(CalculationStage::Resilience)];
        }
        if (!distribution_) {
            distribution_ = evaluate_load_distribution(spec_, *resilience_);
            ++evaluation_counts_[static_cast<int>(CalculationStage::LoadDistribution)];
        }
        if (!preload_) {
            WarningList warnings;
            preload_ = evaluate_preload(spec_, settings_, *geometry_, *resilience_,
                                        *distribution_, warnings);
            stage_warnings_[static_cast<int>(CalculationStage::Preload)] = warnings;
            ++evaluation_counts_[static_cast<int>(CalculationStage::Preload)];
        }
        if (!working_) {
            WarningList warnings;
            working_ = evaluate_working_load(spec_, *preload_, *distribution_, warnings);
            stage_warnings_[static_cast<int>(CalculationStage::WorkingLoad)] = warnings;
            ++evaluation_counts_[static_cast<int>(CalculationStage::WorkingLoad)];
        }
        if (!safety_) {
            WarningList warnings;
            safety_ = evaluate_safety(spec_, settings_, *geometry_, *preload_, *working_, warnings);
            stage_warnings_[static_cast<int>(CalculationStage::Safety)] = warnings;
            ++evaluation_counts_[static_cast<int>(CalculationStage::Safety)];
        }
    } catch (const JointCalculationError& e) {
        error_ = e.error();
        analyzed_ = false;
        logger()->debug("joint analysis failed: {}", error_.to_string());
        return false;
    }

    state_ = DerivedState{*geometry_, *resilience_, *distribution_, *preload_, *working_, *safety_};
    analyzed_ = true;
    return true;
}

bool JointAnalysis::is_stage_valid(CalculationStage stage) const {
    switch (stage) {
        case CalculationStage::Geometry: return geometry_.has_value();
        case CalculationStage::Resilience: return resilience_.has_value();
        case CalculationStage::LoadDistribution: return distribution_.has_value();
        case CalculationStage::Preload: return preload_.has_value();
        case CalculationStage::WorkingLoad: return working_.has_value();
        case CalculationStage::Safety: return safety_.has_value();
        default: return false;
    }
}

const DerivedState& JointAnalysis::state() const {
    if (!analyzed_) {
        throw std::runtime_error("JointAnalysis: no current results, call analyze() first");
    }
    return state_;
}

JointResult JointAnalysis::result() const {
    JointResult result;
    result.success = analyzed_;
    result.error = error_;
    if (analyzed_) {
        result.state = state_;
        for (const auto& warnings : stage_warnings_) {
            result.warnings.extend(warnings);
        }
    }
    return result;
}

int JointAnalysis::evaluation_count(CalculationStage stage) const {
    return evaluation_counts_[static_cast<int>(stage)];
}

} // namespace boltjoint
