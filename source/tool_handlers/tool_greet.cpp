#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

static const char *const DEFAULT_GREETING = "Hello";

// Defaults are not merged into the arguments by the pipeline; the handler applies its own.
static mcp_tools::ToolResults handle_greet(const json &arguments) {
    std::string name = arguments["name"].get<std::string>();
    std::string greeting = DEFAULT_GREETING;
    if (arguments.contains("greeting") && arguments["greeting"].is_string()) {
        greeting = arguments["greeting"].get<std::string>();
    }
    return {greeting + ", " + name + "!"};
}

namespace tool_greet {

mcp_tools::ToolDefinition make_tool() {
    return mcp_tools::ToolBuilder("greet", "Greets someone by name.")
        .parameter("name", mcp_tools::ParameterType::String, "Who to greet.")
        .optional_parameter("greeting", mcp_tools::ParameterType::String, "Greeting word to use.",
                            DEFAULT_GREETING)
        .handler(handle_greet)
        .build();
}

} // namespace tool_greet
