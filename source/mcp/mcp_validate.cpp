#include "mcp/mcp_validate.hpp"

namespace mcp_validate {

namespace {

bool value_matches(mcp_tools::ParameterType type, const json &value) {
    switch (type) {
    case mcp_tools::ParameterType::Number:
        // nlohmann::json keeps booleans apart from numbers, so true/false never pass here.
        return value.is_number();
    case mcp_tools::ParameterType::String:
    case mcp_tools::ParameterType::Text:
        return value.is_string();
    }
    return false;
}

} // namespace

json to_json(const TypeMismatch &mismatch) {
    json entry;
    entry["parameter"] = mismatch.parameter;
    entry["expected"] = mismatch.expected;
    entry["got"] = mismatch.got;
    return entry;
}

std::vector<std::string> find_missing_parameters(const std::vector<mcp_tools::Parameter> &parameters,
                                                 const json &arguments) {
    std::vector<std::string> missing_names;
    for (const auto &parameter : parameters) {
        if (!parameter.required) {
            continue;
        }
        if (!arguments.is_object() || !arguments.contains(parameter.name)) {
            missing_names.push_back(parameter.name);
        }
    }
    return missing_names;
}

std::vector<TypeMismatch> check_argument_types(const std::vector<mcp_tools::Parameter> &parameters,
                                               const json &arguments) {
    std::vector<TypeMismatch> mismatches;
    if (!arguments.is_object()) {
        return mismatches;
    }

    for (const auto &parameter : parameters) {
        auto found = arguments.find(parameter.name);
        // An explicit null counts as present for the missing check but is not type checked.
        if (found == arguments.end() || found->is_null()) {
            continue;
        }
        if (!value_matches(parameter.type, *found)) {
            mismatches.push_back({parameter.name, mcp_tools::to_string(parameter.type), found->type_name()});
        }
    }
    return mismatches;
}

ValidationOutcome validate_arguments(const std::vector<mcp_tools::Parameter> &parameters, const json &arguments) {
    ValidationOutcome outcome;

    outcome.missing_names = find_missing_parameters(parameters, arguments);
    if (!outcome.missing_names.empty()) {
        outcome.status = ValidationStatus::MissingParameters;
        return outcome;
    }

    outcome.type_errors = check_argument_types(parameters, arguments);
    if (!outcome.type_errors.empty()) {
        outcome.status = ValidationStatus::TypeErrors;
    }
    return outcome;
}

} // namespace mcp_validate
