#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/mcp_log.hpp"

#include <string>

namespace mcp_dispatch {

namespace {

// Strings are shown as-is; every other value as compact JSON.
std::string to_text(const json &value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

json build_content(const std::vector<json> &values, bool is_error) {
    json content = json::array();
    for (const auto &value : values) {
        json text_content;
        text_content["type"] = "text";
        text_content["text"] = to_text(value);
        content.push_back(text_content);
    }

    json result;
    result["content"] = content;
    result["isError"] = is_error;
    return result;
}

// Handle the "initialize" request.
DispatchResult handle_initialize(const mcp_server::ServerConfig &config, const json &request_id,
                                 const json &params, const NotificationSender &send_notification) {
    DispatchResult dispatched;
    dispatched.response = json_rpc::build_response(request_id, mcp_server::build_initialize_result(config));

    json initialized_notification = json_rpc::build_notification("notifications/initialized");
    if (config.enqueue_notification) {
        config.enqueue_notification(initialized_notification);
    }

    const mcp_server::ServerConfig *server = &config;
    NotificationSender sender = send_notification;
    dispatched.after_response = [server, params, initialized_notification, sender]() {
        mcp_log::debug("Running server initialize callback");
        try {
            if (server->initialize) {
                server->initialize(params);
            }
            if (sender) {
                sender(initialized_notification);
            }
        } catch (const std::exception &error) {
            mcp_log::error(std::string("MCP server initialize failed: ") + error.what());
        } catch (...) {
            mcp_log::error("MCP server initialize failed: unknown exception");
        }
    };
    return dispatched;
}

// Handle the "tools/call" request.
json handle_tools_call(const mcp_server::ServerConfig &config, const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    }

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
        if (!arguments.is_object()) {
            throw json_rpc::ProtocolError(json_rpc::INVALID_PARAMS,
                                          "Invalid 'arguments' in tools/call: expected an object");
        }
    }

    mcp_log::debug("Handling tools/call request (id " + request_id.dump() + ") for tool '" + tool_name +
                   "' with arguments " + arguments.dump(-1, ' ', false, json::error_handler_t::replace));

    mcp_invoke::InvocationResult invocation = mcp_server::call_tool(config, tool_name, arguments);
    if (invocation.success) {
        return json_rpc::build_response(request_id, format_tool_results(invocation.results));
    }

    mcp_log::debug("Tool error: " + json(invocation.errors).dump(-1, ' ', false, json::error_handler_t::replace));
    return json_rpc::build_response(request_id, format_tool_errors(invocation.errors));
}

DispatchResult route_request(const mcp_server::ServerConfig &config, const json &request,
                             const NotificationSender &send_notification) {
    std::string method = json_rpc::get_method(request);
    json request_id = json_rpc::get_id(request);
    json params = json_rpc::get_params(request);

    DispatchResult dispatched;

    if (method == "ping") {
        mcp_log::debug("Handling ping request with id: " + request_id.dump());
        dispatched.response = json_rpc::build_response(request_id, json::object());
        return dispatched;
    }
    if (method == "initialize") {
        return handle_initialize(config, request_id, params, send_notification);
    }
    if (method == "tools/list") {
        json result;
        result["tools"] = mcp_server::list_tools(config);
        dispatched.response = json_rpc::build_response(request_id, result);
        return dispatched;
    }
    if (method == "tools/call") {
        dispatched.response = handle_tools_call(config, request_id, params);
        return dispatched;
    }
    if (method == "prompts/list") {
        mcp_log::debug("Handling prompts/list request with id: " + request_id.dump());
        json result;
        result["prompts"] = mcp_server::list_prompts(config);
        dispatched.response = json_rpc::build_response(request_id, result);
        return dispatched;
    }
    if (method == "resources/list") {
        mcp_log::debug("Handling resources/list request with id: " + request_id.dump());
        json result;
        result["resources"] = mcp_server::list_resources(config);
        dispatched.response = json_rpc::build_response(request_id, result);
        return dispatched;
    }

    mcp_log::debug("Unknown method: " + method);
    dispatched.response = json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                                         "Method not found: " + method);
    return dispatched;
}

} // namespace

json format_tool_results(const std::vector<json> &results) {
    return build_content(results, false);
}

json format_tool_errors(const std::vector<json> &errors) {
    return build_content(errors, true);
}

DispatchResult handle_request(const mcp_server::ServerConfig &config, const json &request,
                              const NotificationSender &send_notification) {
    json request_id = json_rpc::get_id(request);
    try {
        return route_request(config, request, send_notification);
    } catch (const json_rpc::ProtocolError &error) {
        mcp_log::debug(std::string("Protocol error: ") + error.what());
        DispatchResult dispatched;
        dispatched.response = json_rpc::build_error_response(request_id, error.code(), error.what(), error.data());
        return dispatched;
    } catch (const std::exception &error) {
        mcp_log::error(std::string("Error handling request: ") + error.what());
        DispatchResult dispatched;
        dispatched.response = json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                                             std::string("Internal error: ") + error.what());
        return dispatched;
    } catch (...) {
        mcp_log::error("Error handling request: unknown exception");
        DispatchResult dispatched;
        dispatched.response = json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                                             "Internal error: unknown exception");
        return dispatched;
    }
}

void handle_notification(const json &notification) {
    mcp_log::debug("Received notification: " + json_rpc::get_method(notification));
}

DispatchResult handle_parse_failure(const json &failure) {
    mcp_log::debug("Parse failure: " + failure.dump(-1, ' ', false, json::error_handler_t::replace));
    json error_data;
    if (failure.is_object() && failure.contains("error") && failure["error"].is_object() &&
        failure["error"].contains("data")) {
        error_data = failure["error"]["data"];
    }
    DispatchResult dispatched;
    dispatched.response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error", error_data);
    return dispatched;
}

DispatchResult handle_message(const mcp_server::ServerConfig &config, const json &message,
                              const NotificationSender &send_notification) {
    DispatchResult dispatched;

    switch (json_rpc::classify_message(message)) {
    case json_rpc::MessageKind::Request:
        return handle_request(config, message, send_notification);

    case json_rpc::MessageKind::Notification:
        handle_notification(message);
        return dispatched;

    case json_rpc::MessageKind::InvalidRequest: {
        mcp_log::warn("Invalid request: " + message.dump(-1, ' ', false, json::error_handler_t::replace));
        json request_id = json_rpc::get_id(message);
        if (!request_id.is_string() && !request_id.is_number()) {
            request_id = nullptr;
        }
        dispatched.response = json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid Request");
        return dispatched;
    }

    case json_rpc::MessageKind::Unrecognized:
        mcp_log::warn("Unknown message type: " + message.dump(-1, ' ', false, json::error_handler_t::replace));
        return dispatched;
    }

    return dispatched;
}

} // namespace mcp_dispatch
