/**
 * @file errors.hpp
 * @brief Structured error handling for boltjoint.
 *
 * This file defines error codes, calculation stages and error structures
 * for reporting joint calculation failures in a machine-readable format.
 * Every error names the pipeline stage and the input field that caused it.
 */

#ifndef BOLTJOINT_ERRORS_HPP
#define BOLTJOINT_ERRORS_HPP

#include <string>
#include <map>
#include <stdexcept>
#include <utility>

namespace boltjoint {

/**
 * @brief Stages of the joint calculation pipeline, in evaluation order.
 */
enum class CalculationStage {
    Geometry = 0,          ///< Stress area and bearing geometry
    Resilience = 1,        ///< Bolt and clamped-parts resilience
    LoadDistribution = 2,  ///< Load factor and eccentric loading factor
    Preload = 3,           ///< Assembly, minimum and residual preload
    WorkingLoad = 4,       ///< Bolt and clamp force under working load
    Safety = 5             ///< Stress, utilization and surface criterion
};

/// Number of pipeline stages
constexpr int kStageCount = 6;

/**
 * @brief Convert calculation stage to string representation.
 */
inline std::string stage_to_string(CalculationStage stage) {
    switch (stage) {
        case CalculationStage::Geometry: return "Geometry";
        case CalculationStage::Resilience: return "Resilience";
        case CalculationStage::LoadDistribution: return "LoadDistribution";
        case CalculationStage::Preload: return "Preload";
        case CalculationStage::WorkingLoad: return "WorkingLoad";
        case CalculationStage::Safety: return "Safety";
        default: return "Unknown";
    }
}

/**
 * @brief Error codes for joint calculation failures.
 *
 * All codes other than OK are fatal: the pipeline stops at the stage
 * that raised them and no derived state is returned.
 */
enum class ErrorCode {
    /// No error - calculation completed successfully
    OK = 0,

    // === Input Errors (100-199) ===

    /// Non-positive or inconsistent dimensions (d3 >= d2, dh >= dW, log domain)
    INVALID_GEOMETRY = 100,

    /// Non-positive strength values
    INVALID_MATERIAL = 101,

    /// Friction coefficient outside (0, 1)
    INVALID_FRICTION = 102,

    // === Load Distribution Errors (200-299) ===

    /// Load factor outside (0, 1) or undefined minimum preload
    INVALID_LOAD_FACTOR = 200,

    // === Load Case Errors (300-399) ===

    /// Non-positive interface count or physically disallowed negative load
    INVALID_LOAD_CASE = 300,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::INVALID_MATERIAL: return "INVALID_MATERIAL";
        case ErrorCode::INVALID_FRICTION: return "INVALID_FRICTION";
        case ErrorCode::INVALID_LOAD_FACTOR: return "INVALID_LOAD_FACTOR";
        case ErrorCode::INVALID_LOAD_CASE: return "INVALID_LOAD_CASE";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for a joint calculation.
 *
 * Contains machine-readable error code, the stage and input field
 * responsible, a human-readable message and optional diagnostics.
 */
struct JointError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Pipeline stage that raised the error
    CalculationStage stage;

    /// Name of the offending input field (e.g. "d3", "dh", "n_interfaces")
    std::string field;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    JointError()
        : code(ErrorCode::OK), message("OK"), stage(CalculationStage::Geometry) {}

    /**
     * @brief Construct error with code, stage, field and message.
     */
    JointError(ErrorCode code, CalculationStage stage, const std::string& field,
               const std::string& message)
        : code(code), message(message), stage(stage), field(field) {}

    /**
     * @brief Check if this represents a successful state.
     */
    bool is_ok() const { return code == ErrorCode::OK; }

    /**
     * @brief Check if this represents an error state.
     */
    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get string representation of the failing stage.
     */
    std::string stage_string() const { return stage_to_string(stage); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + stage_string() + " stage, field '"
                           + field + "': " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for invalid dimensions.
     */
    static JointError invalid_geometry(CalculationStage stage, const std::string& field,
                                       const std::string& reason) {
        JointError err(ErrorCode::INVALID_GEOMETRY, stage, field,
            "Invalid geometry: " + reason);
        err.suggestion = "Check the joint dimensions and their units [mm].";
        return err;
    }

    /**
     * @brief Create error for invalid material strength.
     */
    static JointError invalid_material(CalculationStage stage, const std::string& field,
                                       const std::string& reason) {
        JointError err(ErrorCode::INVALID_MATERIAL, stage, field,
            "Invalid material: " + reason);
        err.suggestion = "Strength values must be positive and given in N/mm².";
        return err;
    }

    /**
     * @brief Create error for friction coefficient outside (0, 1).
     */
    static JointError invalid_friction(CalculationStage stage, const std::string& field,
                                       double value) {
        JointError err(ErrorCode::INVALID_FRICTION, stage, field,
            "Friction coefficient must lie in (0, 1)");
        err.details["value"] = std::to_string(value);
        err.suggestion = "Typical values are 0.08 to 0.20 for lubricated or dry steel.";
        return err;
    }

    /**
     * @brief Create error for a load factor outside (0, 1).
     */
    static JointError invalid_load_factor(CalculationStage stage, const std::string& field,
                                          const std::string& reason) {
        JointError err(ErrorCode::INVALID_LOAD_FACTOR, stage, field,
            "Invalid load factor: " + reason);
        err.suggestion = "A load factor of 1 means the clamped parts carry no load; "
                         "check the clamped-parts resilience.";
        return err;
    }

    /**
     * @brief Create error for an invalid load case.
     */
    static JointError invalid_load_case(CalculationStage stage, const std::string& field,
                                        const std::string& reason) {
        JointError err(ErrorCode::INVALID_LOAD_CASE, stage, field,
            "Invalid load case: " + reason);
        return err;
    }
};

/**
 * @brief Exception carrying a JointError out of a pipeline primitive.
 *
 * Stage primitives throw this; evaluate_joint() and JointAnalysis::analyze()
 * catch it and return the contained error in the result.
 */
class JointCalculationError : public std::invalid_argument {
public:
    explicit JointCalculationError(JointError error)
        : std::invalid_argument(error.to_string()), error_(std::move(error)) {}

    /**
     * @brief Get the structured error.
     */
    const JointError& error() const { return error_; }

private:
    JointError error_;
};

}  // namespace boltjoint

#endif  // BOLTJOINT_ERRORS_HPP
