#ifndef MCPBRIDGE_BRIDGE_API_HPP
#define MCPBRIDGE_BRIDGE_API_HPP

// HTTP-facing operations of the bridge, independent of the HTTP server.
// Each operation maps to one Session Manager call (or a state read) and
// produces a status code plus a JSON payload:
//   {"success": bool, "result": ..., "error": string|null}

#include <nlohmann/json.hpp>
#include <string>

#include "session/session_manager.hpp"

namespace bridge_api {

using json = nlohmann::json;

struct HttpReply {
    int status_code = 200;
    json body;
};

class BridgeApi {
public:
    BridgeApi(session_manager::SessionManager &session, bool config_loaded);

    HttpReply root() const;
    HttpReply health() const;
    HttpReply list_tools();
    HttpReply call_tool(const std::string &tool_name, const json &arguments);
    HttpReply raw_request(const std::string &method, const json &params);
    HttpReply reconnect();

    // Route an HTTP request (method "GET"/"POST"/..., path, raw body text).
    HttpReply handle(const std::string &http_method, const std::string &path, const std::string &body_text);

private:
    HttpReply reply_from(const session_manager::SessionResult &outcome) const;

    session_manager::SessionManager &session_;
    bool config_loaded_;
};

// HTTP status for a failed session operation.
int status_code_for(session_manager::ErrorKind error);

HttpReply success_reply(const json &result);
HttpReply error_reply(int status_code, const std::string &message);

} // namespace bridge_api

#endif // MCPBRIDGE_BRIDGE_API_HPP
