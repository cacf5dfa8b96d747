// Tests for the Bridge API routing and payload mapping, against the fake MCP server.

#include "bridge/bridge_api.hpp"

#include <iostream>
#include <string>

#ifndef MCPBRIDGE_FAKE_SERVER_PATH
#error "MCPBRIDGE_FAKE_SERVER_PATH must point at the fake_mcp_server executable"
#endif

using json = nlohmann::json;

namespace test_bridge_api {

using bridge_api::BridgeApi;
using bridge_api::HttpReply;
using session_manager::SessionManager;

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static bridge_config::ServerSpec fake_server(const std::string &mode) {
    bridge_config::ServerSpec server_spec;
    server_spec.name = "fake";
    server_spec.command = MCPBRIDGE_FAKE_SERVER_PATH;
    server_spec.arguments = {mode};
    return server_spec;
}

static bool is_failure_payload(const HttpReply &reply) {
    return reply.body["success"] == false && reply.body["result"].is_null() && reply.body["error"].is_string();
}

// Test: root and health answer without touching the child.
static bool test_root_and_health_without_session() {
    SessionManager session(fake_server("normal"));
    BridgeApi api(session, false);

    HttpReply root = api.handle("GET", "/", "");
    HttpReply health = api.handle("GET", "/health?verbose=1", "");

    bool all_passed = check(root.status_code == 200 && root.body["message"] == "MCP Bridge API is running" &&
                                root.body["connected"] == false,
                            "GET / reports the bridge is running");
    all_passed &= check(health.status_code == 200 && health.body["status"] == "healthy" &&
                            health.body["mcp_connected"] == false && health.body["config_loaded"] == false &&
                            health.body["session_state"] == "disconnected",
                        "GET /health reports state without connecting");
    all_passed &= check(session.state() == session_manager::SessionState::Disconnected,
                        "Health check does not start the session");
    return all_passed;
}

// Test: routing and body validation errors.
static bool test_routing_errors() {
    SessionManager session(fake_server("normal"));
    BridgeApi api(session, true);

    HttpReply unknown = api.handle("GET", "/nope", "");
    HttpReply wrong_method = api.handle("POST", "/tools", "{}");
    HttpReply wrong_method_post_route = api.handle("GET", "/tools/call", "");
    HttpReply bad_json = api.handle("POST", "/tools/call", "{not json");
    HttpReply not_object = api.handle("POST", "/mcp/request", "[1]");
    HttpReply missing_tool = api.handle("POST", "/tools/call", R"({"parameters":{}})");
    HttpReply bad_parameters = api.handle("POST", "/tools/call", R"({"tool_name":"echo","parameters":[]})");
    HttpReply missing_method = api.handle("POST", "/mcp/request", R"({"params":{}})");
    HttpReply bad_params = api.handle("POST", "/mcp/request", R"({"method":"x","params":"scalar"})");

    bool all_passed = check(unknown.status_code == 404 && is_failure_payload(unknown), "Unknown route -> 404");
    all_passed &= check(wrong_method.status_code == 405 && wrong_method_post_route.status_code == 405,
                        "Wrong HTTP method -> 405");
    all_passed &= check(bad_json.status_code == 400 && not_object.status_code == 400 &&
                            missing_tool.status_code == 400 && bad_parameters.status_code == 400 &&
                            missing_method.status_code == 400 && bad_params.status_code == 400 &&
                            is_failure_payload(bad_json),
                        "Invalid request bodies -> 400 failure payloads");
    all_passed &= check(session.state() == session_manager::SessionState::Disconnected,
                        "Rejected requests never reach the session");
    return all_passed;
}

// Test: operations before connect report the session error as 503.
static bool test_not_connected() {
    SessionManager session(fake_server("normal"));
    BridgeApi api(session, true);
    HttpReply reply = api.handle("GET", "/tools", "");
    return check(reply.status_code == 503 && is_failure_payload(reply) &&
                     reply.body["error"].get<std::string>().find("not connected") != std::string::npos,
                 "GET /tools before connect -> 503 not connected");
}

// Test: connected bridge forwards list, call and raw requests.
static bool test_forwarding_to_session() {
    SessionManager session(fake_server("normal"));
    BridgeApi api(session, true);

    HttpReply connected = api.handle("POST", "/connect", "");
    if (!check(connected.status_code == 200 && connected.body["success"] == true,
               "POST /connect performs the handshake")) {
        return false;
    }

    HttpReply tools = api.handle("GET", "/tools", "");
    bool all_passed = check(tools.status_code == 200 &&
                                tools.body == json::parse(R"({"success":true,"result":{"tools":[]},"error":null})"),
                            "GET /tools wraps the tools/list result");

    HttpReply called = api.handle("POST", "/tools/call",
                                  R"({"tool_name":"echo","parameters":{"message":"hi"}})");
    all_passed &= check(called.status_code == 200 &&
                            called.body["result"]["content"][0]["text"] == R"({"message":"hi"})",
                        "POST /tools/call forwards name and arguments");

    HttpReply raw = api.handle("POST", "/mcp/request", R"({"method":"debug/echo_request"})");
    all_passed &= check(raw.status_code == 200 && raw.body["result"]["request"]["method"] == "debug/echo_request" &&
                            !raw.body["result"]["request"].contains("params"),
                        "POST /mcp/request without params sends no params");

    HttpReply remote = api.handle("POST", "/mcp/request", R"({"method":"nonexistent/method","params":null})");
    all_passed &= check(remote.status_code == 502 && is_failure_payload(remote) &&
                            remote.body["remote_error"]["code"] == -32601 &&
                            remote.body["remote_error"]["message"] == "Method not found" &&
                            remote.body["error"] == "Remote error -32601: Method not found",
                        "Remote errors -> 502 with remote_error details");

    HttpReply health = api.health();
    all_passed &= check(health.body["mcp_connected"] == true && health.body["session_state"] == "ready",
                        "Health reflects the ready session");
    return all_passed;
}

// Test: a handshake failure surfaces through POST /connect.
static bool test_connect_failure() {
    SessionManager session(fake_server("init-error"));
    BridgeApi api(session, true);
    HttpReply reply = api.reconnect();
    return check(reply.status_code == 503 && is_failure_payload(reply) &&
                     reply.body["error"].get<std::string>().find("handshake failed") != std::string::npos,
                 "Handshake failure -> 503 handshake failed");
}

// Test: status mapping for session errors.
static bool test_status_mapping() {
    using session_manager::ErrorKind;
    return check(bridge_api::status_code_for(ErrorKind::RemoteError) == 502 &&
                     bridge_api::status_code_for(ErrorKind::Timeout) == 504 &&
                     bridge_api::status_code_for(ErrorKind::SessionBusy) == 503 &&
                     bridge_api::status_code_for(ErrorKind::SessionClosed) == 503 &&
                     bridge_api::status_code_for(ErrorKind::SpawnFailed) == 503,
                 "Error kinds map to 502/503/504");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_root_and_health_without_session();
    all_passed &= test_routing_errors();
    all_passed &= test_not_connected();
    all_passed &= test_forwarding_to_session();
    all_passed &= test_connect_failure();
    all_passed &= test_status_mapping();
    return all_passed;
}

} // namespace test_bridge_api
