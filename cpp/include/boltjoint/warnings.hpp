/**
 * @file warnings.hpp
 * @brief Warning system for non-fatal joint calculation findings.
 *
 * Warnings indicate conditions that don't stop the calculation but mean
 * the joint design fails a check (clamp loss, overload) or uses unusual
 * inputs. The full derived state is still returned alongside them.
 */

#ifndef BOLTJOINT_WARNINGS_HPP
#define BOLTJOINT_WARNINGS_HPP

#include "boltjoint/errors.hpp"

#include <string>
#include <vector>
#include <map>

namespace boltjoint {

/**
 * @brief Warning codes for non-fatal findings.
 */
enum class WarningCode {
    // === Preload Warnings (100-199) ===

    /// Friction coefficient outside the conventional 0.08-0.20 range
    FRICTION_OUTSIDE_CONVENTIONAL_RANGE = 100,

    /// Preload after embedding loss is below the required minimum preload
    PRELOAD_BELOW_MINIMUM = 101,

    // === Working Load Warnings (200-299) ===

    /// Clamp force under working load is zero or negative (joint opens)
    CLAMP_LOSS = 200,

    // === Safety Warnings (300-399) ===

    /// Utilization in the marginal band below the overload limit
    MARGINAL_UTILIZATION = 300,

    /// Utilization at or above the overload limit
    UTILIZATION_OVERLOAD = 301,

    /// Combined tensile and shear surface criterion exceeds 1
    SURFACE_CRITERION_EXCEEDED = 302
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Design fails a check
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::FRICTION_OUTSIDE_CONVENTIONAL_RANGE: return "FRICTION_OUTSIDE_CONVENTIONAL_RANGE";
        case WarningCode::PRELOAD_BELOW_MINIMUM: return "PRELOAD_BELOW_MINIMUM";
        case WarningCode::CLAMP_LOSS: return "CLAMP_LOSS";
        case WarningCode::MARGINAL_UTILIZATION: return "MARGINAL_UTILIZATION";
        case WarningCode::UTILIZATION_OVERLOAD: return "UTILIZATION_OVERLOAD";
        case WarningCode::SURFACE_CRITERION_EXCEEDED: return "SURFACE_CRITERION_EXCEEDED";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for a joint calculation.
 */
struct JointWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Stage that produced the warning
    CalculationStage stage;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    JointWarning(WarningCode code, WarningSeverity severity, CalculationStage stage,
                 const std::string& message)
        : code(code), severity(severity), stage(stage), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] "
                           + stage_to_string(stage) + ": " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    static JointWarning friction_outside_range(const std::string& field, double value,
                                               double min_value, double max_value) {
        JointWarning warn(WarningCode::FRICTION_OUTSIDE_CONVENTIONAL_RANGE, WarningSeverity::Low,
            CalculationStage::Preload, "Friction coefficient outside the conventional range");
        warn.details["field"] = field;
        warn.details["value"] = std::to_string(value);
        warn.details["range"] = std::to_string(min_value) + " - " + std::to_string(max_value);
        warn.suggestion = "Confirm the lubrication state; tightening torque scales with friction";
        return warn;
    }

    static JointWarning preload_below_minimum(double FV_residual, double FV_min) {
        JointWarning warn(WarningCode::PRELOAD_BELOW_MINIMUM, WarningSeverity::Medium,
            CalculationStage::Preload, "Residual preload after embedding is below the minimum preload");
        warn.details["FV_residual"] = std::to_string(FV_residual) + " N";
        warn.details["FV_min"] = std::to_string(FV_min) + " N";
        warn.suggestion = "Increase the assembly preload or reduce the number of interfaces";
        return warn;
    }

    /**
     * @brief Create warning for clamp loss under working load.
     */
    static JointWarning clamp_loss(double FKB) {
        JointWarning warn(WarningCode::CLAMP_LOSS, WarningSeverity::High,
            CalculationStage::WorkingLoad, "Joint loses clamp load under operating conditions");
        warn.details["FKB"] = std::to_string(FKB) + " N";
        warn.suggestion = "Increase preload or reduce the axial working load";
        return warn;
    }

    static JointWarning marginal_utilization(double utilization) {
        JointWarning warn(WarningCode::MARGINAL_UTILIZATION, WarningSeverity::Medium,
            CalculationStage::Safety, "Bolt utilization is marginal");
        warn.details["utilization"] = std::to_string(utilization);
        return warn;
    }

    static JointWarning utilization_overload(double utilization) {
        JointWarning warn(WarningCode::UTILIZATION_OVERLOAD, WarningSeverity::High,
            CalculationStage::Safety, "Bolt stress reaches or exceeds the yield strength");
        warn.details["utilization"] = std::to_string(utilization);
        warn.suggestion = "Use a larger bolt diameter or a higher strength class";
        return warn;
    }

    static JointWarning surface_criterion_exceeded(double combined) {
        JointWarning warn(WarningCode::SURFACE_CRITERION_EXCEEDED, WarningSeverity::High,
            CalculationStage::Safety, "Combined tensile and shear surface criterion exceeds 1");
        warn.details["combined"] = std::to_string(combined);
        warn.suggestion = "Reduce transverse load or increase bolt diameter";
        return warn;
    }
};

/**
 * @brief Collection of warnings from a joint calculation.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<JointWarning> warnings;

    void add(const JointWarning& warning) {
        warnings.push_back(warning);
    }

    void add(JointWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append all warnings of another list.
     */
    void extend(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Check if a warning with the given code is present.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace boltjoint

#endif  // BOLTJOINT_WARNINGS_HPP
