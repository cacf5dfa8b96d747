#include "bridge/bridge_api.hpp"
#include "utils/debug_log.hpp"

namespace bridge_api {

using session_manager::ErrorKind;
using session_manager::SessionResult;

int status_code_for(ErrorKind error) {
    switch (error) {
    case ErrorKind::RemoteError:
        return 502;
    case ErrorKind::Timeout:
        return 504;
    case ErrorKind::None:
        return 500;
    case ErrorKind::SpawnFailed:
    case ErrorKind::HandshakeFailed:
    case ErrorKind::TransportFailed:
    case ErrorKind::SessionBusy:
    case ErrorKind::NotConnected:
    case ErrorKind::SessionClosed:
        return 503;
    }
    return 500;
}

HttpReply success_reply(const json &result) {
    HttpReply reply;
    reply.status_code = 200;
    reply.body["success"] = true;
    reply.body["result"] = result;
    reply.body["error"] = nullptr;
    return reply;
}

HttpReply error_reply(int status_code, const std::string &message) {
    HttpReply reply;
    reply.status_code = status_code;
    reply.body["success"] = false;
    reply.body["result"] = nullptr;
    reply.body["error"] = message;
    return reply;
}

BridgeApi::BridgeApi(session_manager::SessionManager &session, bool config_loaded)
    : session_(session), config_loaded_(config_loaded) {}

HttpReply BridgeApi::reply_from(const SessionResult &outcome) const {
    if (outcome.success) {
        return success_reply(outcome.result.is_null() ? json::object() : outcome.result);
    }

    if (outcome.error == ErrorKind::RemoteError) {
        HttpReply reply = error_reply(status_code_for(outcome.error),
                                      "Remote error " + std::to_string(outcome.remote_error_code) +
                                          ": " + outcome.error_message);
        reply.body["remote_error"]["code"] = outcome.remote_error_code;
        reply.body["remote_error"]["message"] = outcome.error_message;
        if (!outcome.remote_error_data.is_null()) {
            reply.body["remote_error"]["data"] = outcome.remote_error_data;
        }
        return reply;
    }

    return error_reply(status_code_for(outcome.error),
                       std::string(session_manager::to_string(outcome.error)) + ": " + outcome.error_message);
}

HttpReply BridgeApi::root() const {
    HttpReply reply;
    reply.body["message"] = "MCP Bridge API is running";
    reply.body["connected"] = session_.is_connected();
    return reply;
}

HttpReply BridgeApi::health() const {
    HttpReply reply;
    reply.body["status"] = "healthy";
    reply.body["mcp_connected"] = session_.is_connected();
    reply.body["config_loaded"] = config_loaded_;
    reply.body["session_state"] = session_manager::to_string(session_.state());
    return reply;
}

HttpReply BridgeApi::list_tools() {
    return reply_from(session_.call("tools/list", json::object()));
}

HttpReply BridgeApi::call_tool(const std::string &tool_name, const json &arguments) {
    json params;
    params["name"] = tool_name;
    params["arguments"] = arguments;
    return reply_from(session_.call("tools/call", params));
}

HttpReply BridgeApi::raw_request(const std::string &method, const json &params) {
    return reply_from(session_.call(method, params));
}

HttpReply BridgeApi::reconnect() {
    return reply_from(session_.connect());
}

static bool parse_body(const std::string &body_text, json &body, HttpReply &rejection) {
    try {
        body = json::parse(body_text);
    } catch (const json::parse_error &error) {
        rejection = error_reply(400, "Request body is not valid JSON: " + std::string(error.what()));
        return false;
    }
    if (!body.is_object()) {
        rejection = error_reply(400, "Request body must be a JSON object");
        return false;
    }
    return true;
}

HttpReply BridgeApi::handle(const std::string &http_method, const std::string &path, const std::string &body_text) {
    std::string route = path.substr(0, path.find('?'));
    debug_log::log("HTTP " + http_method + " " + route);

    if (route == "/" || route == "/health" || route == "/tools") {
        if (http_method != "GET") {
            return error_reply(405, "Method not allowed");
        }
        if (route == "/") {
            return root();
        }
        if (route == "/health") {
            return health();
        }
        return list_tools();
    }

    if (route == "/tools/call" || route == "/mcp/request" || route == "/connect") {
        if (http_method != "POST") {
            return error_reply(405, "Method not allowed");
        }
        if (route == "/connect") {
            return reconnect();
        }

        json body;
        HttpReply rejection;
        if (!parse_body(body_text, body, rejection)) {
            return rejection;
        }

        if (route == "/tools/call") {
            if (!body.contains("tool_name") || !body["tool_name"].is_string()) {
                return error_reply(400, "Missing or invalid 'tool_name' (string)");
            }
            if (!body.contains("parameters") || !body["parameters"].is_object()) {
                return error_reply(400, "Missing or invalid 'parameters' (object)");
            }
            return call_tool(body["tool_name"].get<std::string>(), body["parameters"]);
        }

        if (!body.contains("method") || !body["method"].is_string()) {
            return error_reply(400, "Missing or invalid 'method' (string)");
        }
        json params = json::object();
        if (body.contains("params") && !body["params"].is_null()) {
            if (!body["params"].is_object()) {
                return error_reply(400, "Invalid 'params' (object or null)");
            }
            params = body["params"];
        }
        return raw_request(body["method"].get<std::string>(), params);
    }

    return error_reply(404, "Not found: " + route);
}

} // namespace bridge_api
