#ifndef TOOLWIRE_MCP_SERVER_HPP
#define TOOLWIRE_MCP_SERVER_HPP

// Description of one MCP server deployment: identity, tools, static collections
// and the callbacks the dispatcher and server loop invoke.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

#include "mcp/mcp_invoke.hpp"
#include "mcp/mcp_tools.hpp"

namespace mcp_server {

using json = nlohmann::json;

extern const char *const LATEST_PROTOCOL_VERSION;

// Every callback is optional. Callbacks may run on worker threads.
struct ServerConfig {
    std::string protocol_version = LATEST_PROTOCOL_VERSION;
    std::string name;
    std::string version;

    mcp_tools::ToolRegistry tools;
    json resources = json::array();
    json prompts = json::array();

    // Runs after the initialize response has been written. Throwing suppresses
    // notifications/initialized; the failure is logged only.
    std::function<void(const json &init_params)> initialize;

    // Observability hooks: every message read, every message about to be written,
    // and every notification queued for later delivery.
    std::function<void(const json &message)> on_receive;
    std::function<void(const json &message)> on_send;
    std::function<void(const json &notification)> enqueue_notification;
};

// {tools, resources, prompts} each {listChanged: <any configured>}.
json capabilities(const ServerConfig &config);

// {protocolVersion, capabilities, serverInfo: {name, version}}.
json build_initialize_result(const ServerConfig &config);

json list_tools(const ServerConfig &config);
json list_resources(const ServerConfig &config);
json list_prompts(const ServerConfig &config);

// Looks the tool up and runs the invocation pipeline.
// Throws json_rpc::ProtocolError (INVALID_PARAMS, cause "missing-tool") when the name is unknown,
// and for missing arguments (see mcp_invoke::invoke_tool).
mcp_invoke::InvocationResult call_tool(const ServerConfig &config, const std::string &tool_name,
                                       const json &arguments);

} // namespace mcp_server

#endif // TOOLWIRE_MCP_SERVER_HPP
