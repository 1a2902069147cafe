#ifndef TOOLWIRE_MCP_INVOKE_HPP
#define TOOLWIRE_MCP_INVOKE_HPP

// Tool invocation pipeline: validate arguments, run the handler, collect results.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"

namespace mcp_invoke {

using json = nlohmann::json;

// Raised by invoke_handler() when a tool handler throws.
class HandlerFailure : public std::runtime_error {
public:
    explicit HandlerFailure(const std::string &message);

    // Always "handler-exception".
    const char *cause() const { return "handler-exception"; }
};

// Outcome of a tool call. results is filled on success, errors otherwise.
struct InvocationResult {
    bool success = false;
    std::vector<json> results;
    std::vector<json> errors;
};

// Runs the tool's handler. Any exception it throws is logged and rethrown as HandlerFailure.
mcp_tools::ToolResults invoke_handler(const mcp_tools::ToolDefinition &tool, const json &arguments);

// 1. Missing required arguments: throws json_rpc::ProtocolError (INVALID_PARAMS) with
//    data {cause: "missing-parameters", tool, provided-args, required-args, missing-args}.
// 2. Type mismatches: returns success=false with one {parameter, expected, got} per mismatch.
// 3. Otherwise runs the handler; a HandlerFailure becomes success=false with its message.
InvocationResult invoke_tool(const mcp_tools::ToolDefinition &tool, const json &arguments);

} // namespace mcp_invoke

#endif // TOOLWIRE_MCP_INVOKE_HPP
