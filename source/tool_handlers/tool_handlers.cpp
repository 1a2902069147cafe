#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool factories.
// Each tool_*.cpp defines its own namespace with a make_tool() function.

namespace tool_add { mcp_tools::ToolDefinition make_tool(); }
namespace tool_divide { mcp_tools::ToolDefinition make_tool(); }
namespace tool_greet { mcp_tools::ToolDefinition make_tool(); }
namespace tool_echo { mcp_tools::ToolDefinition make_tool(); }
namespace tool_word_count { mcp_tools::ToolDefinition make_tool(); }

namespace tool_handlers {

std::vector<mcp_tools::ToolDefinition> all_tools() {
    return {
        tool_add::make_tool(),
        tool_divide::make_tool(),
        tool_greet::make_tool(),
        tool_echo::make_tool(),
        tool_word_count::make_tool(),
    };
}

mcp_tools::ToolRegistry build_registry() {
    return mcp_tools::ToolRegistry(all_tools());
}

} // namespace tool_handlers
