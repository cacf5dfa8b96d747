#ifndef MCPBRIDGE_JSON_RPC_HPP
#define MCPBRIDGE_JSON_RPC_HPP

// JSON-RPC 2.0 line codec for MCP communication over stdio.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

enum class MessageKind {
    Request,
    Response,
    Notification,
};

// One JSON-RPC message.
// Request: id, method, params (null when absent).
// Response: id plus exactly one of result / error (error is {code, message[, data]}).
// Notification: method, params.
// Members other than jsonrpc/id/method/params/result/error are kept in
// extra_fields and written back by encode().
struct RpcMessage {
    MessageKind kind = MessageKind::Notification;
    json id;
    std::string method;
    json params;
    bool has_error = false;
    json result;
    json error;
    json extra_fields = json::object();

    bool operator==(const RpcMessage &other) const;
    bool operator!=(const RpcMessage &other) const { return !(*this == other); }
};

RpcMessage make_request(const json &id, const std::string &method, const json &params);
RpcMessage make_notification(const std::string &method, const json &params);
RpcMessage make_result(const json &id, const json &result);
RpcMessage make_error(const json &id, int error_code, const std::string &error_message);

// Serialize to a single line of JSON (no trailing newline, never embedded ones).
std::string encode(const RpcMessage &message);

// Outcome of decoding one inbound line. On failure, error_message says why
// the line is malformed.
struct DecodeResult {
    bool success = false;
    RpcMessage message;
    std::string error_message;
};

DecodeResult decode(const std::string &line);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Human-readable description of an id for logs ("5", "\"abc\"").
std::string describe_id(const json &id);

} // namespace json_rpc

#endif // MCPBRIDGE_JSON_RPC_HPP
