// Tests for argument validation: presence first, then declared types.

#include "mcp/mcp_validate.hpp"

#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_validate {

static bool report(bool success, const std::string &description) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return success;
}

static mcp_tools::ToolResults no_results(const json &arguments) {
    (void)arguments;
    return {};
}

static std::vector<mcp_tools::Parameter> add_parameters() {
    return mcp_tools::ToolBuilder("add")
        .parameter("a", mcp_tools::ParameterType::Number)
        .parameter("b", mcp_tools::ParameterType::Number)
        .handler(no_results)
        .build()
        .parameters;
}

static std::vector<mcp_tools::Parameter> note_parameters() {
    return mcp_tools::ToolBuilder("note")
        .parameter("title", mcp_tools::ParameterType::String)
        .optional_parameter("body", mcp_tools::ParameterType::Text, "Body text.", "")
        .optional_parameter("priority", mcp_tools::ParameterType::Number, "Priority.", 1)
        .handler(no_results)
        .build()
        .parameters;
}

// Test: All required arguments present with the right types.
static bool test_valid_arguments() {
    mcp_validate::ValidationOutcome outcome = mcp_validate::validate_arguments(add_parameters(), {{"a", 1}, {"b", 2.5}});
    return report(outcome.valid() && outcome.missing_names.empty() && outcome.type_errors.empty(),
                  "add {a:1, b:2.5} is valid");
}

// Test: Missing required arguments are reported by name.
static bool test_missing_arguments() {
    mcp_validate::ValidationOutcome outcome = mcp_validate::validate_arguments(add_parameters(), {{"a", 1}});
    bool success = outcome.status == mcp_validate::ValidationStatus::MissingParameters &&
                   outcome.missing_names == std::vector<std::string>{"b"};
    return report(success, "add {a:1} is missing b");
}

// Test: Missing check short-circuits before the type check.
static bool test_missing_short_circuits_types() {
    mcp_validate::ValidationOutcome outcome = mcp_validate::validate_arguments(add_parameters(), {{"a", "x"}});
    bool success = outcome.status == mcp_validate::ValidationStatus::MissingParameters &&
                   outcome.type_errors.empty();
    return report(success, "Type errors are not reported while arguments are missing");
}

// Test: Type mismatch on a numeric parameter.
static bool test_type_mismatch() {
    mcp_validate::ValidationOutcome outcome =
        mcp_validate::validate_arguments(add_parameters(), {{"a", "x"}, {"b", 2}});
    bool success = outcome.status == mcp_validate::ValidationStatus::TypeErrors && outcome.type_errors.size() == 1 &&
                   outcome.type_errors[0].parameter == "a" && outcome.type_errors[0].expected == "number" &&
                   outcome.type_errors[0].got == "string";
    return report(success, "add {a:\"x\", b:2} gives one {a, number, string} mismatch");
}

// Test: Mismatches accumulate instead of failing fast.
static bool test_type_mismatches_accumulate() {
    mcp_validate::ValidationOutcome outcome =
        mcp_validate::validate_arguments(note_parameters(), {{"title", 3}, {"body", json::array()}, {"priority", "high"}});
    bool success = outcome.type_errors.size() == 3 &&
                   outcome.type_errors[0].parameter == "title" && outcome.type_errors[0].got == "number" &&
                   outcome.type_errors[1].parameter == "body" && outcome.type_errors[1].expected == "text" &&
                   outcome.type_errors[1].got == "array" &&
                   outcome.type_errors[2].parameter == "priority" && outcome.type_errors[2].got == "string";
    return report(success, "Every mismatch is collected, in declaration order");
}

// Test: Booleans are not numbers.
static bool test_boolean_is_not_number() {
    mcp_validate::ValidationOutcome outcome =
        mcp_validate::validate_arguments(add_parameters(), {{"a", true}, {"b", 1}});
    bool success = outcome.type_errors.size() == 1 && outcome.type_errors[0].got == "boolean";
    return report(success, "true is rejected for a number parameter");
}

// Test: Absent optional parameters are skipped and no default is injected.
static bool test_absent_optional_skipped() {
    json arguments = {{"title", "hello"}};
    mcp_validate::ValidationOutcome outcome = mcp_validate::validate_arguments(note_parameters(), arguments);
    bool success = outcome.valid() && !arguments.contains("body") && !arguments.contains("priority");
    return report(success, "Absent optional parameters pass without defaults");
}

// Test: Undeclared arguments are ignored.
static bool test_extra_arguments_ignored() {
    mcp_validate::ValidationOutcome outcome =
        mcp_validate::validate_arguments(add_parameters(), {{"a", 1}, {"b", 2}, {"c", "anything"}});
    return report(outcome.valid(), "Undeclared arguments are ignored");
}

// Test: An explicit null satisfies presence and is not type checked.
static bool test_null_argument() {
    mcp_validate::ValidationOutcome outcome =
        mcp_validate::validate_arguments(add_parameters(), {{"a", nullptr}, {"b", 2}});
    return report(outcome.valid(), "Explicit null counts as present and skips the type check");
}

// Test: Type mismatch records serialise as {parameter, expected, got}.
static bool test_mismatch_to_json() {
    json entry = mcp_validate::to_json({"a", "number", "string"});
    bool success = entry == json({{"parameter", "a"}, {"expected", "number"}, {"got", "string"}});
    return report(success, "TypeMismatch to_json");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_arguments();
    all_passed &= test_missing_arguments();
    all_passed &= test_missing_short_circuits_types();
    all_passed &= test_type_mismatch();
    all_passed &= test_type_mismatches_accumulate();
    all_passed &= test_boolean_is_not_number();
    all_passed &= test_absent_optional_skipped();
    all_passed &= test_extra_arguments_ignored();
    all_passed &= test_null_argument();
    all_passed &= test_mismatch_to_json();
    return all_passed;
}

} // namespace test_validate
