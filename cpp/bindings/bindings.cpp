#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "boltjoint/errors.hpp"
#include "boltjoint/warnings.hpp"
#include "boltjoint/settings.hpp"
#include "boltjoint/joint_spec.hpp"
#include "boltjoint/derived_state.hpp"
#include "boltjoint/geometry.hpp"
#include "boltjoint/resilience.hpp"
#include "boltjoint/load_distribution.hpp"
#include "boltjoint/preload.hpp"
#include "boltjoint/working_load.hpp"
#include "boltjoint/safety.hpp"
#include "boltjoint/classical.hpp"
#include "boltjoint/thread_catalog.hpp"
#include "boltjoint/joint_analysis.hpp"
#include "boltjoint/logging.hpp"

namespace py = pybind11;

/**
 * boltjoint C++ Python bindings module.
 * Exposes the joint calculation pipeline to Python presentation layers.
 */
PYBIND11_MODULE(_boltjoint_cpp, m) {
    m.doc() = "boltjoint C++ core module - VDI 2230 bolted joint calculation";

    m.attr("__version__") = "1.0.0";

    py::register_exception<boltjoint::JointCalculationError>(m, "JointCalculationError",
                                                             PyExc_ValueError);

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<boltjoint::CalculationStage>(m, "CalculationStage",
        "Stages of the joint calculation pipeline")
        .value("Geometry", boltjoint::CalculationStage::Geometry)
        .value("Resilience", boltjoint::CalculationStage::Resilience)
        .value("LoadDistribution", boltjoint::CalculationStage::LoadDistribution)
        .value("Preload", boltjoint::CalculationStage::Preload)
        .value("WorkingLoad", boltjoint::CalculationStage::WorkingLoad)
        .value("Safety", boltjoint::CalculationStage::Safety)
        .export_values();

    py::enum_<boltjoint::ErrorCode>(m, "ErrorCode",
        "Error codes for joint calculation failures")
        .value("OK", boltjoint::ErrorCode::OK, "No error")
        .value("INVALID_GEOMETRY", boltjoint::ErrorCode::INVALID_GEOMETRY,
               "Non-positive or inconsistent dimensions")
        .value("INVALID_MATERIAL", boltjoint::ErrorCode::INVALID_MATERIAL,
               "Non-positive strength values")
        .value("INVALID_FRICTION", boltjoint::ErrorCode::INVALID_FRICTION,
               "Friction coefficient outside (0, 1)")
        .value("INVALID_LOAD_FACTOR", boltjoint::ErrorCode::INVALID_LOAD_FACTOR,
               "Load factor outside (0, 1)")
        .value("INVALID_LOAD_CASE", boltjoint::ErrorCode::INVALID_LOAD_CASE,
               "Invalid interface count or negative load")
        .value("UNKNOWN_ERROR", boltjoint::ErrorCode::UNKNOWN_ERROR, "Unknown error")
        .export_values();

    py::class_<boltjoint::JointError>(m, "JointError",
        "Structured error with code, failing stage and offending input field")
        .def(py::init<>(), "Create OK (no error) status")
        .def_readwrite("code", &boltjoint::JointError::code, "Error code")
        .def_readwrite("message", &boltjoint::JointError::message, "Error message")
        .def_readwrite("stage", &boltjoint::JointError::stage, "Failing stage")
        .def_readwrite("field", &boltjoint::JointError::field, "Offending input field")
        .def_readwrite("details", &boltjoint::JointError::details,
                       "Additional diagnostic details (key-value pairs)")
        .def_readwrite("suggestion", &boltjoint::JointError::suggestion,
                       "Suggested fix for the error")
        .def("is_ok", &boltjoint::JointError::is_ok)
        .def("is_error", &boltjoint::JointError::is_error)
        .def("code_string", &boltjoint::JointError::code_string)
        .def("stage_string", &boltjoint::JointError::stage_string)
        .def("to_string", &boltjoint::JointError::to_string)
        .def("__repr__", [](const boltjoint::JointError &e) {
            return "<JointError " + e.code_string() + " stage=" + e.stage_string() +
                   " field='" + e.field + "'>";
        });

    py::enum_<boltjoint::WarningCode>(m, "WarningCode", "Non-fatal finding codes")
        .value("FRICTION_OUTSIDE_CONVENTIONAL_RANGE",
               boltjoint::WarningCode::FRICTION_OUTSIDE_CONVENTIONAL_RANGE)
        .value("PRELOAD_BELOW_MINIMUM", boltjoint::WarningCode::PRELOAD_BELOW_MINIMUM)
        .value("CLAMP_LOSS", boltjoint::WarningCode::CLAMP_LOSS)
        .value("MARGINAL_UTILIZATION", boltjoint::WarningCode::MARGINAL_UTILIZATION)
        .value("UTILIZATION_OVERLOAD", boltjoint::WarningCode::UTILIZATION_OVERLOAD)
        .value("SURFACE_CRITERION_EXCEEDED", boltjoint::WarningCode::SURFACE_CRITERION_EXCEEDED)
        .export_values();

    py::enum_<boltjoint::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", boltjoint::WarningSeverity::Low)
        .value("Medium", boltjoint::WarningSeverity::Medium)
        .value("High", boltjoint::WarningSeverity::High)
        .export_values();

    py::class_<boltjoint::JointWarning>(m, "JointWarning", "Structured non-fatal finding")
        .def_readonly("code", &boltjoint::JointWarning::code)
        .def_readonly("severity", &boltjoint::JointWarning::severity)
        .def_readonly("stage", &boltjoint::JointWarning::stage)
        .def_readonly("message", &boltjoint::JointWarning::message)
        .def_readonly("details", &boltjoint::JointWarning::details)
        .def_readonly("suggestion", &boltjoint::JointWarning::suggestion)
        .def("to_string", &boltjoint::JointWarning::to_string);

    py::class_<boltjoint::WarningList>(m, "WarningList", "Collection of warnings")
        .def_readonly("warnings", &boltjoint::WarningList::warnings)
        .def("has_warnings", &boltjoint::WarningList::has_warnings)
        .def("count", &boltjoint::WarningList::count)
        .def("contains", &boltjoint::WarningList::contains, py::arg("code"))
        .def("summary", &boltjoint::WarningList::summary);

    // ========================================================================
    // Settings and input records
    // ========================================================================

    py::enum_<boltjoint::StrengthBasis>(m, "StrengthBasis")
        .value("UltimateStrength", boltjoint::StrengthBasis::UltimateStrength)
        .value("YieldStrength", boltjoint::StrengthBasis::YieldStrength)
        .export_values();

    py::class_<boltjoint::CalculationSettings>(m, "CalculationSettings",
        "Named constants and check thresholds")
        .def(py::init<>())
        .def_readwrite("cone_half_angle_deg", &boltjoint::CalculationSettings::cone_half_angle_deg,
                       "Substitute cone half-angle [deg]")
        .def_readwrite("utilization_marginal", &boltjoint::CalculationSettings::utilization_marginal)
        .def_readwrite("utilization_overload", &boltjoint::CalculationSettings::utilization_overload)
        .def_readwrite("shear_strength_ratio", &boltjoint::CalculationSettings::shear_strength_ratio)
        .def_readwrite("surface_strength_basis", &boltjoint::CalculationSettings::surface_strength_basis)
        .def_readwrite("max_hole_to_bearing_ratio",
                       &boltjoint::CalculationSettings::max_hole_to_bearing_ratio)
        .def_readwrite("friction_conventional_min",
                       &boltjoint::CalculationSettings::friction_conventional_min)
        .def_readwrite("friction_conventional_max",
                       &boltjoint::CalculationSettings::friction_conventional_max);

    py::class_<boltjoint::BoltGeometry>(m, "BoltGeometry", "Thread geometry [mm]")
        .def(py::init<>())
        .def_readwrite("d", &boltjoint::BoltGeometry::d, "Nominal diameter [mm]")
        .def_readwrite("d2", &boltjoint::BoltGeometry::d2, "Pitch diameter [mm]")
        .def_readwrite("d3", &boltjoint::BoltGeometry::d3, "Minor diameter [mm]")
        .def_readwrite("P", &boltjoint::BoltGeometry::P, "Pitch [mm]")
        .def_readwrite("alpha_deg", &boltjoint::BoltGeometry::alpha_deg, "Flank half-angle [deg]");

    py::class_<boltjoint::ClampedStack>(m, "ClampedStack", "Clamped parts")
        .def(py::init<>())
        .def_readwrite("lK", &boltjoint::ClampedStack::lK, "Clamped length [mm]")
        .def_readwrite("dW", &boltjoint::ClampedStack::dW, "Bearing diameter [mm]")
        .def_readwrite("dh", &boltjoint::ClampedStack::dh, "Hole diameter [mm]")
        .def_readwrite("E_P", &boltjoint::ClampedStack::E_P, "Clamped-part modulus [N/mm²]");

    py::class_<boltjoint::MaterialPair>(m, "MaterialPair", "Bolt and clamped-part materials")
        .def(py::init<>())
        .def_readwrite("E_B", &boltjoint::MaterialPair::E_B, "Bolt modulus [N/mm²]")
        .def_readwrite("alphaA", &boltjoint::MaterialPair::alphaA, "Bolt expansion [1/K]")
        .def_readwrite("alphaP", &boltjoint::MaterialPair::alphaP, "Clamped-part expansion [1/K]")
        .def_readwrite("Rp02", &boltjoint::MaterialPair::Rp02, "Yield strength [N/mm²]")
        .def_readwrite("Rm", &boltjoint::MaterialPair::Rm, "Ultimate strength [N/mm²]");

    py::class_<boltjoint::FrictionModel>(m, "FrictionModel", "Thread and head friction")
        .def(py::init<>())
        .def_readwrite("muG", &boltjoint::FrictionModel::muG)
        .def_readwrite("muK", &boltjoint::FrictionModel::muK)
        .def_readwrite("dKm", &boltjoint::FrictionModel::dKm, "Mean bearing diameter [mm] (0 = derive)");

    py::class_<boltjoint::LoadCase>(m, "LoadCase", "Operating load case")
        .def(py::init<>())
        .def_readwrite("FA", &boltjoint::LoadCase::FA, "Axial working load [N]")
        .def_readwrite("FZ", &boltjoint::LoadCase::FZ, "Additional axial load [N]")
        .def_readwrite("n", &boltjoint::LoadCase::n, "Eccentric load exponent")
        .def_readwrite("dA", &boltjoint::LoadCase::dA, "Load introduction diameter [mm]")
        .def_readwrite("deltaT", &boltjoint::LoadCase::deltaT, "Temperature change [K]")
        .def_readwrite("n_interfaces", &boltjoint::LoadCase::n_interfaces)
        .def_readwrite("fZ", &boltjoint::LoadCase::fZ, "Embedding amount [mm]")
        .def_readwrite("FQx", &boltjoint::LoadCase::FQx, "Transverse load x [N]")
        .def_readwrite("FQy", &boltjoint::LoadCase::FQy, "Transverse load y [N]");

    py::class_<boltjoint::Tightening>(m, "Tightening", "Tightening data")
        .def(py::init<>())
        .def_readwrite("FM_tab", &boltjoint::Tightening::FM_tab, "Tabulated assembly preload [N]")
        .def_readwrite("prevailing_torque", &boltjoint::Tightening::prevailing_torque,
                       "Prevailing torque [N·m]");

    py::class_<boltjoint::JointSpec>(m, "JointSpec", "Complete joint input")
        .def(py::init<>())
        .def_readwrite("bolt", &boltjoint::JointSpec::bolt)
        .def_readwrite("stack", &boltjoint::JointSpec::stack)
        .def_readwrite("material", &boltjoint::JointSpec::material)
        .def_readwrite("friction", &boltjoint::JointSpec::friction)
        .def_readwrite("load", &boltjoint::JointSpec::load)
        .def_readwrite("tightening", &boltjoint::JointSpec::tightening);

    // ========================================================================
    // Derived state
    // ========================================================================

    py::class_<boltjoint::GeometryState>(m, "GeometryState")
        .def_readonly("As", &boltjoint::GeometryState::As)
        .def_readonly("dKm", &boltjoint::GeometryState::dKm)
        .def_readonly("bearing_area", &boltjoint::GeometryState::bearing_area);

    py::class_<boltjoint::ResilienceState>(m, "ResilienceState")
        .def_readonly("delta_bolt", &boltjoint::ResilienceState::delta_bolt)
        .def_readonly("delta_p", &boltjoint::ResilienceState::delta_p);

    py::class_<boltjoint::LoadDistributionState>(m, "LoadDistributionState")
        .def_readonly("Phi", &boltjoint::LoadDistributionState::Phi)
        .def_readonly("Phi_n", &boltjoint::LoadDistributionState::Phi_n);

    py::class_<boltjoint::PreloadState>(m, "PreloadState")
        .def_readonly("FV_assembly", &boltjoint::PreloadState::FV_assembly)
        .def_readonly("F_embed_loss", &boltjoint::PreloadState::F_embed_loss)
        .def_readonly("FV_residual", &boltjoint::PreloadState::FV_residual)
        .def_readonly("FV_min", &boltjoint::PreloadState::FV_min)
        .def_readonly("tightening_torque", &boltjoint::PreloadState::tightening_torque)
        .def_readonly("assembly_torque", &boltjoint::PreloadState::assembly_torque);

    py::class_<boltjoint::WorkingLoadState>(m, "WorkingLoadState")
        .def_readonly("FSB", &boltjoint::WorkingLoadState::FSB)
        .def_readonly("FKB", &boltjoint::WorkingLoadState::FKB)
        .def_readonly("clamp_loss", &boltjoint::WorkingLoadState::clamp_loss);

    py::enum_<boltjoint::UtilizationClass>(m, "UtilizationClass")
        .value("OK", boltjoint::UtilizationClass::OK)
        .value("MARGINAL", boltjoint::UtilizationClass::MARGINAL)
        .value("OVERLOAD", boltjoint::UtilizationClass::OVERLOAD)
        .export_values();

    py::class_<boltjoint::SurfaceCheckResult>(m, "SurfaceCheckResult")
        .def_readonly("tensile_ratio", &boltjoint::SurfaceCheckResult::tensile_ratio)
        .def_readonly("shear_ratio", &boltjoint::SurfaceCheckResult::shear_ratio)
        .def_readonly("combined", &boltjoint::SurfaceCheckResult::combined)
        .def_readonly("failed", &boltjoint::SurfaceCheckResult::failed)
        .def("to_string", &boltjoint::SurfaceCheckResult::to_string);

    py::class_<boltjoint::SafetyState>(m, "SafetyState")
        .def_readonly("sigma_bolt", &boltjoint::SafetyState::sigma_bolt)
        .def_readonly("utilization", &boltjoint::SafetyState::utilization)
        .def_readonly("utilization_class", &boltjoint::SafetyState::utilization_class)
        .def_readonly("surface", &boltjoint::SafetyState::surface)
        .def_readonly("overload", &boltjoint::SafetyState::overload);

    py::class_<boltjoint::DerivedState>(m, "DerivedState", "All derived quantities")
        .def_readonly("geometry", &boltjoint::DerivedState::geometry)
        .def_readonly("resilience", &boltjoint::DerivedState::resilience)
        .def_readonly("distribution", &boltjoint::DerivedState::distribution)
        .def_readonly("preload", &boltjoint::DerivedState::preload)
        .def_readonly("working", &boltjoint::DerivedState::working)
        .def_readonly("safety", &boltjoint::DerivedState::safety);

    // ========================================================================
    // Stage primitives
    // ========================================================================

    m.def("stress_area", &boltjoint::stress_area, py::arg("d2"), py::arg("d3"),
          "Stress area As = (π/4)((d2+d3)/2)² [mm²]");
    m.def("eccentric_loading_factor", &boltjoint::eccentric_loading_factor,
          py::arg("n"), py::arg("dA"), py::arg("dW"));
    m.def("bolt_resilience", &boltjoint::bolt_resilience,
          py::arg("lK"), py::arg("As"), py::arg("E_B"));
    m.def("clamped_parts_resilience", &boltjoint::clamped_parts_resilience,
          py::arg("lK"), py::arg("dW"), py::arg("dh"), py::arg("E_P"),
          py::arg("settings") = boltjoint::CalculationSettings{});
    m.def("load_factor", &boltjoint::load_factor, py::arg("delta_bolt"), py::arg("delta_p"));
    m.def("embedding_loss", &boltjoint::embedding_loss,
          py::arg("fZ"), py::arg("delta_bolt"), py::arg("delta_p"));
    m.def("minimum_preload", &boltjoint::minimum_preload,
          py::arg("FA"), py::arg("FZ"), py::arg("Phi"), py::arg("n_interfaces"));
    m.def("assembly_preload", &boltjoint::assembly_preload,
          py::arg("FM_tab"), py::arg("alphaA"), py::arg("alphaP"), py::arg("deltaT"),
          py::arg("lK"), py::arg("delta_bolt"), py::arg("delta_p"));
    m.def("tightening_torque", &boltjoint::tightening_torque,
          py::arg("FV"), py::arg("P"), py::arg("d2"), py::arg("muG"), py::arg("muK"),
          py::arg("dKm"), py::arg("alpha_deg") = 30.0);
    m.def("effective_preload_torque", &boltjoint::effective_preload_torque,
          py::arg("MGF"), py::arg("MA"));
    m.def("bolt_force_working", &boltjoint::bolt_force_working,
          py::arg("FV"), py::arg("FA"), py::arg("Phi"));
    m.def("clamping_force_working", &boltjoint::clamping_force_working,
          py::arg("FV"), py::arg("FA"), py::arg("Phi"));
    m.def("bolt_stress", &boltjoint::bolt_stress, py::arg("FSB"), py::arg("As"));
    m.def("utilization_factor", &boltjoint::utilization_factor, py::arg("sigma"), py::arg("Rp02"));
    m.def("classify_utilization", &boltjoint::classify_utilization,
          py::arg("utilization"), py::arg("settings") = boltjoint::CalculationSettings{});
    m.def("surface_failure_criterion", &boltjoint::surface_failure_criterion,
          py::arg("force"), py::arg("clamp_force"), py::arg("d"), py::arg("strength"),
          py::arg("shear_ratio") = 0.577);

    // ========================================================================
    // Classical rule set
    // ========================================================================

    py::module_ classical = m.def_submodule("classical", "Classical torque and clamping-force rules");
    classical.def("general_torque", &boltjoint::classical::general_torque,
                  py::arg("load_axial"), py::arg("d2"), py::arg("d0"), py::arg("b0"),
                  py::arg("mu_thread"), py::arg("mu_head"), py::arg("alpha_deg"), py::arg("P"));
    classical.def("axial_load_from_stress", &boltjoint::classical::axial_load_from_stress,
                  py::arg("allowed_stress"), py::arg("As"));
    classical.def("clamping_force_from_torque", &boltjoint::classical::clamping_force_from_torque,
                  py::arg("torque"), py::arg("coef"), py::arg("bolt_size"));
    classical.def("validate_bolt", &boltjoint::classical::validate_bolt,
                  py::arg("clamp_force"), py::arg("force"), py::arg("uts"), py::arg("ys"),
                  py::arg("bolt_diameter"),
                  py::arg("basis") = boltjoint::StrengthBasis::UltimateStrength,
                  py::arg("shear_ratio") = 0.577);

    // ========================================================================
    // Thread catalog
    // ========================================================================

    py::class_<boltjoint::MetricThread>(m, "MetricThread", "ISO metric coarse thread")
        .def_readonly("name", &boltjoint::MetricThread::name)
        .def_readonly("d", &boltjoint::MetricThread::d)
        .def_readonly("P", &boltjoint::MetricThread::P)
        .def_readonly("dw", &boltjoint::MetricThread::dw)
        .def_readonly("dh", &boltjoint::MetricThread::dh)
        .def("geometry", &boltjoint::MetricThread::geometry);

    m.def("metric_thread", &boltjoint::metric_thread, py::arg("d"), py::arg("P"));
    m.def("metric_coarse_threads", &boltjoint::metric_coarse_threads);
    m.def("find_metric_coarse", &boltjoint::find_metric_coarse, py::arg("d"));

    // ========================================================================
    // Analysis
    // ========================================================================

    py::class_<boltjoint::JointResult>(m, "JointResult", "Outcome of one joint evaluation")
        .def_readonly("success", &boltjoint::JointResult::success)
        .def_readonly("state", &boltjoint::JointResult::state)
        .def_readonly("error", &boltjoint::JointResult::error)
        .def_readonly("warnings", &boltjoint::JointResult::warnings)
        .def("has_clamp_loss", &boltjoint::JointResult::has_clamp_loss)
        .def("has_overload", &boltjoint::JointResult::has_overload)
        .def("summary", &boltjoint::JointResult::summary)
        .def("__repr__", [](const boltjoint::JointResult &r) {
            return "<JointResult " + r.summary() + ">";
        });

    m.def("evaluate_joint", &boltjoint::evaluate_joint,
          py::arg("spec"), py::arg("settings") = boltjoint::CalculationSettings{},
          "Evaluate a joint through all six stages");
    m.def("evaluate_joints", &boltjoint::evaluate_joints,
          py::arg("specs"), py::arg("settings") = boltjoint::CalculationSettings{});

    py::class_<boltjoint::SweepPoint>(m, "SweepPoint")
        .def_readonly("thread", &boltjoint::SweepPoint::thread)
        .def_readonly("result", &boltjoint::SweepPoint::result);

    m.def("sweep_metric_sizes", &boltjoint::sweep_metric_sizes,
          py::arg("base"), py::arg("diameters"),
          py::arg("settings") = boltjoint::CalculationSettings{});
    m.def("sweep_utilization", &boltjoint::sweep_utilization, py::arg("points"),
          "Utilization per sweep point as numpy array (NaN for failures)");

    py::class_<boltjoint::JointAnalysis>(m, "JointAnalysis",
        "Joint analysis with per-stage caching and partial recomputation")
        .def(py::init<const boltjoint::JointSpec&, const boltjoint::CalculationSettings&>(),
             py::arg("spec"), py::arg("settings") = boltjoint::CalculationSettings{})
        .def("spec", &boltjoint::JointAnalysis::spec, py::return_value_policy::reference_internal)
        .def("settings", &boltjoint::JointAnalysis::settings,
             py::return_value_policy::reference_internal)
        .def("set_bolt", &boltjoint::JointAnalysis::set_bolt, py::arg("bolt"))
        .def("set_stack", &boltjoint::JointAnalysis::set_stack, py::arg("stack"))
        .def("set_material", &boltjoint::JointAnalysis::set_material, py::arg("material"))
        .def("set_friction", &boltjoint::JointAnalysis::set_friction, py::arg("friction"))
        .def("set_load_case", &boltjoint::JointAnalysis::set_load_case, py::arg("load"))
        .def("set_tightening", &boltjoint::JointAnalysis::set_tightening, py::arg("tightening"))
        .def("set_settings", &boltjoint::JointAnalysis::set_settings, py::arg("settings"))
        .def("analyze", &boltjoint::JointAnalysis::analyze,
             "Recompute invalidated stages; returns True on success")
        .def("is_analyzed", &boltjoint::JointAnalysis::is_analyzed)
        .def("is_stage_valid", &boltjoint::JointAnalysis::is_stage_valid, py::arg("stage"))
        .def("get_error", &boltjoint::JointAnalysis::get_error,
             py::return_value_policy::reference_internal)
        .def("state", &boltjoint::JointAnalysis::state, py::return_value_policy::reference_internal)
        .def("result", &boltjoint::JointAnalysis::result)
        .def("evaluation_count", &boltjoint::JointAnalysis::evaluation_count, py::arg("stage"));

    m.def("set_log_level", [](const std::string& level) {
        boltjoint::set_log_level(spdlog::level::from_str(level));
    }, py::arg("level"), "Set library log level ('trace', 'debug', 'info', 'warn', 'error', 'off')");
}
