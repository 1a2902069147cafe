#ifndef TOOLWIRE_MCP_DISPATCH_HPP
#define TOOLWIRE_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler and builds the response envelope.

#include <nlohmann/json.hpp>
#include <functional>
#include <vector>

#include "mcp/mcp_server.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Delivers an outbound notification (written by the server loop under the output lock).
using NotificationSender = std::function<void(const json &notification)>;

struct DispatchResult {
    // Message to write, or null when nothing is answered (notifications, unrecognized shapes).
    json response;

    // Work to run once response has been written, e.g. the initialize callback.
    // It holds a pointer to the ServerConfig given to handle_message, so that config must
    // outlive the call. mcp_loop::run waits for every worker before returning.
    std::function<void()> after_response;
};

// {content: [{type: "text", text}...], isError}
json format_tool_results(const std::vector<json> &results);
json format_tool_errors(const std::vector<json> &errors);

// Routes a request by method. Never throws: failures become error responses.
DispatchResult handle_request(const mcp_server::ServerConfig &config, const json &request,
                              const NotificationSender &send_notification);

// Incoming notifications are logged and never answered.
void handle_notification(const json &notification);

// Answers a line the transport could not read or parse with -32700 and id null.
// failure is the json_rpc::make_parse_failure() record; its error.data is echoed back.
DispatchResult handle_parse_failure(const json &failure);

// Classifies any parsed message read from the transport and handles it.
// Parse failures are never recognised here; see handle_parse_failure().
DispatchResult handle_message(const mcp_server::ServerConfig &config, const json &message,
                              const NotificationSender &send_notification);

} // namespace mcp_dispatch

#endif // TOOLWIRE_MCP_DISPATCH_HPP
