/**
 * @file test_errors_warnings.cpp
 * @brief Tests for structured errors and warnings
 */

#include <catch2/catch_test_macros.hpp>

#include "boltjoint/errors.hpp"
#include "boltjoint/warnings.hpp"

#include <string>

using namespace boltjoint;

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("JointError: default is OK", "[Errors]") {
    JointError err;
    CHECK(err.is_ok());
    CHECK_FALSE(err.is_error());
    CHECK(err.to_string() == "OK");
}

TEST_CASE("JointError: string conversions", "[Errors]") {
    CHECK(error_code_to_string(ErrorCode::INVALID_GEOMETRY) == "INVALID_GEOMETRY");
    CHECK(error_code_to_string(ErrorCode::INVALID_LOAD_FACTOR) == "INVALID_LOAD_FACTOR");
    CHECK(stage_to_string(CalculationStage::Resilience) == "Resilience");
    CHECK(stage_to_string(CalculationStage::Safety) == "Safety");
}

TEST_CASE("JointError: factories set code, stage and field", "[Errors]") {
    JointError err = JointError::invalid_geometry(CalculationStage::Resilience, "dh", "too large");

    CHECK(err.is_error());
    CHECK(err.code == ErrorCode::INVALID_GEOMETRY);
    CHECK(err.stage == CalculationStage::Resilience);
    CHECK(err.field == "dh");
    CHECK_FALSE(err.suggestion.empty());

    std::string text = err.to_string();
    CHECK(text.find("INVALID_GEOMETRY") != std::string::npos);
    CHECK(text.find("Resilience") != std::string::npos);
    CHECK(text.find("'dh'") != std::string::npos);
}

TEST_CASE("JointError: friction factory records the value", "[Errors]") {
    JointError err = JointError::invalid_friction(CalculationStage::Preload, "muG", 1.5);
    CHECK(err.code == ErrorCode::INVALID_FRICTION);
    CHECK(err.details.count("value") == 1);
}

TEST_CASE("JointCalculationError: carries the structured error", "[Errors]") {
    try {
        throw JointCalculationError(
            JointError::invalid_load_case(CalculationStage::Preload, "FA", "negative"));
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find("INVALID_LOAD_CASE") != std::string::npos);
        const auto* joint_error = dynamic_cast<const JointCalculationError*>(&e);
        REQUIRE(joint_error != nullptr);
        CHECK(joint_error->error().field == "FA");
    }
}

// =============================================================================
// Warnings
// =============================================================================

TEST_CASE("WarningList: empty list", "[Warnings]") {
    WarningList list;
    CHECK_FALSE(list.has_warnings());
    CHECK(list.count() == 0);
    CHECK(list.summary() == "No warnings");
}

TEST_CASE("WarningList: counts by severity", "[Warnings]") {
    WarningList list;
    list.add(JointWarning::clamp_loss(-100.0));
    list.add(JointWarning::marginal_utilization(0.93));
    list.add(JointWarning::friction_outside_range("muG", 0.25, 0.08, 0.20));

    CHECK(list.count() == 3);
    CHECK(list.count_by_severity(WarningSeverity::High) == 1);
    CHECK(list.count_by_severity(WarningSeverity::Medium) == 1);
    CHECK(list.count_by_severity(WarningSeverity::Low) == 1);
    CHECK(list.contains(WarningCode::CLAMP_LOSS));
    CHECK_FALSE(list.contains(WarningCode::UTILIZATION_OVERLOAD));
    CHECK(list.summary() == "3 warning(s): 1 high, 1 medium, 1 low");
}

TEST_CASE("WarningList: extend and clear", "[Warnings]") {
    WarningList a;
    a.add(JointWarning::clamp_loss(-1.0));
    WarningList b;
    b.add(JointWarning::surface_criterion_exceeded(1.2));

    a.extend(b);
    CHECK(a.count() == 2);

    a.clear();
    CHECK_FALSE(a.has_warnings());
}

TEST_CASE("JointWarning: formatted string names stage and code", "[Warnings]") {
    JointWarning warn = JointWarning::clamp_loss(-250.0);
    std::string text = warn.to_string();

    CHECK(warn.stage == CalculationStage::WorkingLoad);
    CHECK(text.find("CLAMP_LOSS") != std::string::npos);
    CHECK(text.find("WorkingLoad") != std::string::npos);
    CHECK(text.find("FKB") != std::string::npos);
}
