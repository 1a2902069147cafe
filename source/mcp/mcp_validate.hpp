#ifndef TOOLWIRE_MCP_VALIDATE_HPP
#define TOOLWIRE_MCP_VALIDATE_HPP

// Argument validation against a tool's parameter contract.
// Two phases: presence of required arguments, then declared types.
// Type checking only runs when nothing is missing.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"

namespace mcp_validate {

using json = nlohmann::json;

struct TypeMismatch {
    std::string parameter;
    std::string expected; // declared type: "string", "number" or "text"
    std::string got;      // JSON type name of the supplied value
};

// {parameter, expected, got}
json to_json(const TypeMismatch &mismatch);

enum class ValidationStatus {
    Valid,
    MissingParameters,
    TypeErrors
};

struct ValidationOutcome {
    ValidationStatus status = ValidationStatus::Valid;
    std::vector<std::string> missing_names;   // set when MissingParameters
    std::vector<TypeMismatch> type_errors;     // set when TypeErrors

    bool valid() const { return status == ValidationStatus::Valid; }
};

// Required parameter names absent from arguments, in declaration order.
std::vector<std::string> find_missing_parameters(const std::vector<mcp_tools::Parameter> &parameters,
                                                 const json &arguments);

// Type mismatches for every declared parameter present in arguments.
// Absent optional parameters are skipped; defaults are not applied here.
std::vector<TypeMismatch> check_argument_types(const std::vector<mcp_tools::Parameter> &parameters,
                                               const json &arguments);

ValidationOutcome validate_arguments(const std::vector<mcp_tools::Parameter> &parameters, const json &arguments);

} // namespace mcp_validate

#endif // TOOLWIRE_MCP_VALIDATE_HPP
