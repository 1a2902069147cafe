#ifndef TOOLWIRE_MCP_LOG_HPP
#define TOOLWIRE_MCP_LOG_HPP

// Diagnostic logging to stderr as "[LEVEL] message" lines.
// stdout carries protocol traffic only, so nothing here ever writes to it.

#include <string>

namespace mcp_log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
// Returns fallback for anything else.
Level parse_level(const std::string &text, Level fallback);

// Level derived from TOOLWIRE_LOG_LEVEL, forced to Debug when TOOLWIRE_DEBUG is truthy (1, true, yes).
Level level_from_environment();

// Current threshold. Initialised from the environment on first use.
Level current_level();
void set_level(Level level);

bool is_debug_enabled();

void debug(const std::string &message);
void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

} // namespace mcp_log

#endif // TOOLWIRE_MCP_LOG_HPP
