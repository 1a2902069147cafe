#include "protocol/json_rpc.hpp"

#include <utility>

namespace json_rpc {

const char *const JSONRPC_VERSION = "2.0";

ProtocolError::ProtocolError(int error_code, const std::string &error_message, json error_data)
    : std::runtime_error(error_message), error_code_(error_code), error_data_(std::move(error_data)) {}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

json build_request(const json &request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = JSONRPC_VERSION;
    request["id"] = request_id;
    request["method"] = method;
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = JSONRPC_VERSION;
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json make_parse_failure(const std::string &detail) {
    json record;
    record["error"]["code"] = PARSE_ERROR;
    record["error"]["message"] = "Parse error";
    record["error"]["data"]["detail"] = detail;
    return record;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return get_id(message).is_null();
}

MessageKind classify_message(const json &message) {
    if (!message.is_object()) {
        return MessageKind::Unrecognized;
    }

    if (!message.contains("method")) {
        return MessageKind::Unrecognized;
    }

    const json &method = message["method"];
    json request_id = get_id(message);
    if (!method.is_string()) {
        return MessageKind::InvalidRequest;
    }
    if (!request_id.is_null() && !request_id.is_string() && !request_id.is_number()) {
        return MessageKind::InvalidRequest;
    }
    return request_id.is_null() ? MessageKind::Notification : MessageKind::Request;
}

const char *to_string(MessageKind kind) {
    switch (kind) {
    case MessageKind::Request:
        return "request";
    case MessageKind::Notification:
        return "notification";
    case MessageKind::InvalidRequest:
        return "invalid-request";
    default:
        return "unrecognized";
    }
}

} // namespace json_rpc
