#include "mcp/mcp_invoke.hpp"
#include "mcp/mcp_validate.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/mcp_log.hpp"

namespace mcp_invoke {

namespace {

std::string join_names(const std::vector<std::string> &names) {
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

json provided_argument_names(const json &arguments) {
    json names = json::array();
    if (arguments.is_object()) {
        for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
            names.push_back(iterator.key());
        }
    }
    return names;
}

} // namespace

HandlerFailure::HandlerFailure(const std::string &message) : std::runtime_error(message) {}

mcp_tools::ToolResults invoke_handler(const mcp_tools::ToolDefinition &tool, const json &arguments) {
    try {
        return tool.handler(arguments);
    } catch (const std::exception &error) {
        mcp_log::error("Tool handler exception in " + tool.name + ": " + error.what());
        throw HandlerFailure(error.what());
    } catch (...) {
        mcp_log::error("Tool handler exception in " + tool.name + ": unknown exception");
        throw HandlerFailure("Unknown exception in tool handler");
    }
}

InvocationResult invoke_tool(const mcp_tools::ToolDefinition &tool, const json &arguments) {
    mcp_validate::ValidationOutcome outcome = mcp_validate::validate_arguments(tool.parameters, arguments);

    if (outcome.status == mcp_validate::ValidationStatus::MissingParameters) {
        json error_data;
        error_data["cause"] = "missing-parameters";
        error_data["tool"] = tool.name;
        error_data["provided-args"] = provided_argument_names(arguments);
        error_data["required-args"] = mcp_tools::required_parameter_names(tool);
        error_data["missing-args"] = outcome.missing_names;
        throw json_rpc::ProtocolError(json_rpc::INVALID_PARAMS,
                                      "Missing tool parameters: " + join_names(outcome.missing_names),
                                      error_data);
    }

    InvocationResult result;

    if (outcome.status == mcp_validate::ValidationStatus::TypeErrors) {
        for (const auto &mismatch : outcome.type_errors) {
            result.errors.push_back(mcp_validate::to_json(mismatch));
        }
        mcp_log::debug("Type validation failed for " + tool.name + ": " + json(result.errors).dump());
        return result;
    }

    try {
        result.results = invoke_handler(tool, arguments);
        result.success = true;
    } catch (const HandlerFailure &failure) {
        mcp_log::error("Exception during tool handler invocation for " + tool.name + ": " + failure.what());
        result.errors.push_back(failure.what());
    }
    return result;
}

} // namespace mcp_invoke
