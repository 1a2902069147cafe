#ifndef TOOLWIRE_TOOL_HANDLERS_HPP
#define TOOLWIRE_TOOL_HANDLERS_HPP

// Example tool set served by toolwire_server.
// Each tool_*.cpp file provides a make_tool() function that is called during startup.

#include "mcp/mcp_tools.hpp"

#include <vector>

namespace tool_handlers {

// Definitions of every bundled tool, in listing order.
std::vector<mcp_tools::ToolDefinition> all_tools();

// Registry of every bundled tool.
mcp_tools::ToolRegistry build_registry();

} // namespace tool_handlers

#endif // TOOLWIRE_TOOL_HANDLERS_HPP
