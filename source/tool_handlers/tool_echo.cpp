#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static mcp_tools::ToolResults handle_echo(const json &arguments) {
    return {arguments["text"]};
}

namespace tool_echo {

mcp_tools::ToolDefinition make_tool() {
    return mcp_tools::ToolBuilder("echo", "Returns the given text unchanged.")
        .parameter("text", mcp_tools::ParameterType::Text, "Text to echo back.")
        .handler(handle_echo)
        .build();
}

} // namespace tool_echo
