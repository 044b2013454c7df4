#pragma once

#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"
#include "boltjoint/settings.hpp"
#include "boltjoint/errors.hpp"
#include "boltjoint/warnings.hpp"
#include "boltjoint/thread_catalog.hpp"

#include <Eigen/Dense>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace boltjoint {

/**
 * @brief Outcome of one joint evaluation
 *
 * On success, state holds every derived quantity and warnings lists the
 * non-fatal findings (clamp loss, overload, ...). On failure, state is empty
 * and error names the stage and input field responsible.
 */
struct JointResult {
    /// True if every stage completed
    bool success = false;

    /// Derived quantities (only set on success)
    std::optional<DerivedState> state;

    /// Fatal error (OK on success)
    JointError error;

    /// Non-fatal findings
    WarningList warnings;

    /// True if the joint loses clamp load under working load
    bool has_clamp_loss() const { return state && state->working.clamp_loss; }

    /// True if utilization or surface criterion indicates overload
    bool has_overload() const { return state && state->safety.overload; }

    /**
     * @brief One-line summary for display
     */
    std::string summary() const;
};

/**
 * @brief Evaluate a joint through all six stages
 *
 * Pure and stateless: identical inputs give identical results, and
 * concurrent calls share no state.
 *
 * @param spec Joint geometry, material, friction, load case and tightening data
 * @param settings Named constants and thresholds
 * @return JointResult with either the full derived state or the fatal error
 */
JointResult evaluate_joint(const JointSpec& spec,
                           const CalculationSettings& settings = CalculationSettings{});

/**
 * @brief Evaluate independent joints, preserving order
 */
std::vector<JointResult> evaluate_joints(const std::vector<JointSpec>& specs,
                                         const CalculationSettings& settings = CalculationSettings{});

/**
 * @brief One point of a thread size sweep
 */
struct SweepPoint {
    MetricThread thread;
    JointResult result;
};

/**
 * @brief Re-evaluate a joint across ISO metric coarse thread sizes
 *
 * For each diameter the bolt geometry, bearing diameter dW and hole
 * diameter dh of the base spec are replaced with the catalog values.
 * Everything else (clamped length, materials, loads, FM_tab) is kept.
 *
 * @throws std::invalid_argument if a diameter is not in the coarse series
 */
std::vector<SweepPoint> sweep_metric_sizes(const JointSpec& base,
                                           const std::vector<double>& diameters,
                                           const CalculationSettings& settings = CalculationSettings{});

/**
 * @brief Utilization per sweep point (NaN where the evaluation failed)
 */
Eigen::VectorXd sweep_utilization(const std::vector<SweepPoint>& points);

/**
 * @brief Joint analysis with per-stage caching
 *
 * Holds a JointSpec and the results of each stage. Changing an input
 * invalidates only the stages at or after the first stage that reads the
 * changed field, so analyze() recomputes only what depends on it. For
 * example, changing the eccentric load exponent n re-runs load distribution,
 * preload (including tightening torque), working load and safety, but not
 * geometry or resilience.
 *
 * Usage:
 *   JointAnalysis analysis(spec);
 *   if (!analysis.analyze()) {
 *       std::cerr << analysis.get_error().to_string() << std::endl;
 *   }
 *   LoadCase load = analysis.spec().load;
 *   load.FA = 8000.0;
 *   analysis.set_load_case(load);
 *   analysis.analyze();  // geometry, resilience and load distribution reused
 */
class JointAnalysis {
public:
    explicit JointAnalysis(const JointSpec& spec,
                           const CalculationSettings& settings = CalculationSettings{});

    const JointSpec& spec() const { return spec_; }
    const CalculationSettings& settings() const { return settings_; }

    // Input setters; each invalidates the affected stages
    void set_bolt(const BoltGeometry& bolt);
    void set_stack(const ClampedStack& stack);
    void set_material(const MaterialPair& material);
    void set_friction(const FrictionModel& friction);
    void set_load_case(const LoadCase& load);
    void set_tightening(const Tightening& tightening);
    void set_settings(const CalculationSettings& settings);

    /**
     * @brief Recompute all invalidated stages
     * @return true if every stage completed; otherwise see get_error()
     */
    bool analyze();

    /**
     * @brief Check if all stages are current
     */
    bool is_analyzed() const { return analyzed_; }

    /**
     * @brief Check if a single stage holds a current result
     */
    bool is_stage_valid(CalculationStage stage) const;

    /**
     * @brief Error of the last analyze() (OK if it succeeded)
     */
    const JointError& get_error() const { return error_; }

    /**
     * @brief Derived state of the last successful analyze()
     * @throws std::runtime_error if not analyzed
     */
    const DerivedState& state() const;

    /**
     * @brief Current result, including warnings from all stages
     */
    JointResult result() const;

    /**
     * @brief Number of times a stage has been evaluated successfully
     */
    int evaluation_count(CalculationStage stage) const;

private:
    JointSpec spec_;
    CalculationSettings settings_;

    std::optional<GeometryState> geometry_;
    std::optional<ResilienceState> resilience_;
    std::optional<LoadDistributionState> distribution_;
    std::optional<PreloadState> preload_;
    std::optional<WorkingLoadState> working_;
    std::optional<SafetyState> safety_;

    std::array<WarningList, kStageCount> stage_warnings_;
    std::array<int, kStageCount> evaluation_counts_{};

    bool analyzed_ = false;
    JointError error_;
    DerivedState state_;

    /**
     * @brief Drop cached results of the given stage and all later ones
     */
    void invalidate_from(CalculationStage stage);
};

} // namespace boltjoint
