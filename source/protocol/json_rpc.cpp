#include "protocol/json_rpc.hpp"

#include <cstdint>
#include <limits>

namespace json_rpc {

static bool is_valid_id(const json &id) {
    return id.is_number_integer() || id.is_string();
}

static bool is_reserved_member(const std::string &key) {
    return key == "jsonrpc" || key == "id" || key == "method" || key == "params" ||
           key == "result" || key == "error";
}

static DecodeResult malformed(const std::string &reason) {
    DecodeResult result;
    result.success = false;
    result.error_message = reason;
    return result;
}

bool RpcMessage::operator==(const RpcMessage &other) const {
    return kind == other.kind && id == other.id && method == other.method &&
           params == other.params && has_error == other.has_error &&
           result == other.result && error == other.error &&
           extra_fields == other.extra_fields;
}

RpcMessage make_request(const json &id, const std::string &method, const json &params) {
    RpcMessage message;
    message.kind = MessageKind::Request;
    message.id = id;
    message.method = method;
    message.params = params;
    return message;
}

RpcMessage make_notification(const std::string &method, const json &params) {
    RpcMessage message;
    message.kind = MessageKind::Notification;
    message.method = method;
    message.params = params;
    return message;
}

RpcMessage make_result(const json &id, const json &result) {
    RpcMessage message;
    message.kind = MessageKind::Response;
    message.id = id;
    message.result = result;
    return message;
}

RpcMessage make_error(const json &id, int error_code, const std::string &error_message) {
    RpcMessage message;
    message.kind = MessageKind::Response;
    message.id = id;
    message.has_error = true;
    message.error["code"] = error_code;
    message.error["message"] = error_message;
    return message;
}

std::string encode(const RpcMessage &message) {
    json document = json::object();
    if (message.extra_fields.is_object()) {
        for (auto item = message.extra_fields.begin(); item != message.extra_fields.end(); ++item) {
            if (!is_reserved_member(item.key())) {
                document[item.key()] = item.value();
            }
        }
    }

    document["jsonrpc"] = "2.0";
    switch (message.kind) {
    case MessageKind::Request:
        document["id"] = message.id;
        document["method"] = message.method;
        if (!message.params.is_null()) {
            document["params"] = message.params;
        }
        break;
    case MessageKind::Notification:
        document["method"] = message.method;
        if (!message.params.is_null()) {
            document["params"] = message.params;
        }
        break;
    case MessageKind::Response:
        document["id"] = message.id;
        if (message.has_error) {
            document["error"] = message.error;
        } else {
            document["result"] = message.result;
        }
        break;
    }

    // Compact dump escapes control characters, so the line never contains '\n'.
    return document.dump(-1, ' ', false, json::error_handler_t::replace);
}

DecodeResult decode(const std::string &line) {
    json document;
    try {
        document = json::parse(line);
    } catch (const json::parse_error &error) {
        return malformed("invalid JSON: " + std::string(error.what()));
    }

    if (!document.is_object()) {
        return malformed("message is not a JSON object");
    }

    if (document.contains("jsonrpc")) {
        const json &version = document["jsonrpc"];
        if (!version.is_string() || version.get<std::string>() != "2.0") {
            return malformed("unsupported jsonrpc version: " + version.dump());
        }
    }

    DecodeResult result;
    RpcMessage &message = result.message;
    bool has_result = document.contains("result");
    bool has_error = document.contains("error");

    if (document.contains("method")) {
        if (!document["method"].is_string()) {
            return malformed("'method' is not a string");
        }
        if (has_result || has_error) {
            return malformed("message has both 'method' and 'result'/'error'");
        }
        message.method = document["method"].get<std::string>();

        if (document.contains("params")) {
            const json &params = document["params"];
            if (!params.is_object() && !params.is_array()) {
                return malformed("'params' is neither an object nor an array");
            }
            message.params = params;
        }

        if (document.contains("id")) {
            if (!is_valid_id(document["id"])) {
                return malformed("request id is not an integer or string");
            }
            message.kind = MessageKind::Request;
            message.id = document["id"];
        } else {
            message.kind = MessageKind::Notification;
        }
    } else {
        if (!document.contains("id")) {
            return malformed("message has neither 'method' nor 'id'");
        }
        if (has_result == has_error) {
            return malformed("response must carry exactly one of 'result' or 'error'");
        }

        const json &id = document["id"];
        // A server that could not read our id answers with a null id and an error.
        if (!is_valid_id(id) && !(id.is_null() && has_error)) {
            return malformed("response id is not an integer or string");
        }

        message.kind = MessageKind::Response;
        message.id = id;
        if (has_error) {
            const json &error = document["error"];
            if (!error.is_object() ||
                !error.contains("code") || !error["code"].is_number_integer() ||
                !error.contains("message") || !error["message"].is_string()) {
                return malformed("'error' must be an object with integer 'code' and string 'message'");
            }
            if (error["code"].is_number_unsigned() &&
                error["code"].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return malformed("error code " + error["code"].dump() + " is out of range");
            }
            message.has_error = true;
            message.error = error;
        } else {
            message.result = document["result"];
        }
    }

    for (auto item = document.begin(); item != document.end(); ++item) {
        if (!is_reserved_member(item.key())) {
            message.extra_fields[item.key()] = item.value();
        }
    }

    result.success = true;
    return result;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

std::string describe_id(const json &id) {
    return id.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace json_rpc
