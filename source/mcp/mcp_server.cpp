#include "mcp/mcp_server.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_server {

const char *const LATEST_PROTOCOL_VERSION = "2024-11-05";

json capabilities(const ServerConfig &config) {
    json result;
    result["tools"]["listChanged"] = !config.tools.empty();
    result["resources"]["listChanged"] = !config.resources.empty();
    result["prompts"]["listChanged"] = !config.prompts.empty();
    return result;
}

json build_initialize_result(const ServerConfig &config) {
    json server_info;
    server_info["name"] = config.name;
    server_info["version"] = config.version;

    json result;
    result["protocolVersion"] = config.protocol_version;
    result["capabilities"] = capabilities(config);
    result["serverInfo"] = server_info;
    return result;
}

json list_tools(const ServerConfig &config) {
    return config.tools.list_tools();
}

json list_resources(const ServerConfig &config) {
    return config.resources.is_array() ? config.resources : json::array();
}

json list_prompts(const ServerConfig &config) {
    return config.prompts.is_array() ? config.prompts : json::array();
}

mcp_invoke::InvocationResult call_tool(const ServerConfig &config, const std::string &tool_name,
                                       const json &arguments) {
    const mcp_tools::ToolDefinition *tool = config.tools.find(tool_name);
    if (tool == nullptr) {
        json error_data;
        error_data["cause"] = "missing-tool";
        error_data["tool-name"] = tool_name;
        throw json_rpc::ProtocolError(json_rpc::INVALID_PARAMS, "Unknown tool: " + tool_name, error_data);
    }
    return mcp_invoke::invoke_tool(*tool, arguments);
}

} // namespace mcp_server
