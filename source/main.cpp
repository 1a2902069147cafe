// toolwire server – MCP tool server over stdio
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin (one per line), dispatches each on its own worker,
// writes responses to stdout. Logs go to stderr; stdout carries protocol traffic only.

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "mcp/mcp_loop.hpp"
#include "mcp/mcp_server.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/mcp_log.hpp"

static const char *const SERVER_NAME = "toolwire";
static const char *const SERVER_VERSION = "0.1.0";

// Global flag for graceful shutdown. Checked between messages.
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = true;
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    mcp_server::ServerConfig config;
    config.name = SERVER_NAME;
    config.version = SERVER_VERSION;

    const char *name_override = std::getenv("TOOLWIRE_SERVER_NAME");
    if (name_override != nullptr && name_override[0] != '\0') {
        config.name = name_override;
    }

    try {
        config.tools = tool_handlers::build_registry();
    } catch (const std::exception &error) {
        mcp_log::error(std::string("Failed to build tool registry: ") + error.what());
        return 1;
    }

    config.initialize = [](const mcp_server::json &init_params) {
        std::string client_name = "unknown client";
        if (init_params.contains("clientInfo") && init_params["clientInfo"].contains("name") &&
            init_params["clientInfo"]["name"].is_string()) {
            client_name = init_params["clientInfo"]["name"].get<std::string>();
        }
        mcp_log::info("Initialized for " + client_name);
    };

    mcp_log::info(config.name + " " + config.version + " started with " + std::to_string(config.tools.size()) +
                  " tools. Waiting for MCP messages on stdin.");

    int exit_code = mcp_loop::run(config, std::cin, std::cout, &shutdown_requested);

    mcp_log::info(config.name + " shut down.");
    return exit_code;
}
