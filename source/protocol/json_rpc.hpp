#ifndef TOOLWIRE_JSON_RPC_HPP
#define TOOLWIRE_JSON_RPC_HPP

// JSON-RPC 2.0 envelopes for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

extern const char *const JSONRPC_VERSION;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// A failure that must surface as a JSON-RPC error response rather than a result.
// data() is attached to the response as error.data when it is not null.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int error_code, const std::string &error_message, json error_data = nullptr);

    int code() const { return error_code_; }
    const json &data() const { return error_data_; }

private:
    int error_code_;
    json error_data_;
};

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Build a JSON-RPC 2.0 request / notification. params is omitted when null.
json build_request(const json &request_id, const std::string &method, const json &params = nullptr);
json build_notification(const std::string &method, const json &params = nullptr);

// Record describing a line that could not be read or parsed. It is carried beside the
// message (see mcp_stdio::ReadResult::parse_failed), never recognised by its shape.
json make_parse_failure(const std::string &detail);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id, or a null id).
bool is_notification(const json &message);

enum class MessageKind {
    Request,        // method + id
    Notification,   // method, no id
    InvalidRequest, // method or id of the wrong JSON type
    Unrecognized    // anything else (responses, scalars, arrays)
};

MessageKind classify_message(const json &message);

const char *to_string(MessageKind kind);

} // namespace json_rpc

#endif // TOOLWIRE_JSON_RPC_HPP
