// Scripted stdio MCP server used by the session and bridge tests.
// Usage: fake_mcp_server <mode>
//
// Modes:
//   normal             - answers initialize, tools/list, tools/call ("echo") and debug/* methods
//   exit-immediately   - exits before reading anything
//   init-error         - answers initialize with an error
//   mismatched-id      - answers every request after initialize with id 99
//   hang-after-init    - never answers requests after initialize
//   garbage-after-init - answers requests after initialize with a non-JSON line
//   exit-after-init    - exits on the first request after initialize
//   stop-reading-after-init - answers initialize, then never reads stdin again

#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

static void send(const json &message) {
    std::cout << message.dump() << "\n";
    std::cout.flush();
}

static json initialize_result() {
    json result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = json::object();
    result["serverInfo"]["name"] = "fake-mcp-server";
    result["serverInfo"]["version"] = "0.0.1";
    return result;
}

// Server-initiated ping, then wait for the client's answer on stdin.
static json ping_client() {
    json ping;
    ping["jsonrpc"] = "2.0";
    ping["id"] = "srv-1";
    ping["method"] = "ping";
    send(ping);

    std::string reply_line;
    if (!std::getline(std::cin, reply_line)) {
        return json();
    }
    try {
        return json::parse(reply_line);
    } catch (const json::parse_error &) {
        return json(reply_line);
    }
}

static void handle_normal_request(const json_rpc::RpcMessage &request, const json &raw_request,
                                  bool initialized_received) {
    const std::string &method = request.method;
    const json &request_id = request.id;

    if (method == "tools/list") {
        json result;
        result["tools"] = json::array();
        send(json_rpc::build_response(request_id, result));
        return;
    }

    if (method == "tools/call") {
        if (!request.params.is_object()) {
            send(json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Missing params"));
            return;
        }
        std::string tool_name = request.params.value("name", "");
        if (tool_name != "echo") {
            send(json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                "Unknown tool: " + tool_name));
            return;
        }
        json text_content;
        text_content["type"] = "text";
        text_content["text"] = request.params.value("arguments", json::object()).dump();
        json result;
        result["content"] = json::array({text_content});
        result["isError"] = false;
        send(json_rpc::build_response(request_id, result));
        return;
    }

    if (method == "debug/echo_request") {
        json result;
        result["request"] = raw_request;
        send(json_rpc::build_response(request_id, result));
        return;
    }

    if (method == "debug/initialized") {
        json result;
        result["initialized"] = initialized_received;
        send(json_rpc::build_response(request_id, result));
        return;
    }

    if (method == "debug/stderr") {
        std::cerr << "fake-mcp-server diagnostic line" << std::endl;
        send(json_rpc::build_response(request_id, json::object()));
        return;
    }

    if (method == "debug/chatty") {
        json progress;
        progress["jsonrpc"] = "2.0";
        progress["method"] = "notifications/progress";
        progress["params"]["progress"] = 50;
        send(progress);

        json result;
        result["ping_reply"] = ping_client();
        send(json_rpc::build_response(request_id, result));
        return;
    }

    if (method == "debug/fail_with_data") {
        send(json_rpc::build_error_response(request_id, -32000, "Tool exploded", {{"detail", "kaboom"}}));
        return;
    }

    if (method == "debug/fail_with_large_code") {
        json error_response;
        error_response["jsonrpc"] = "2.0";
        error_response["id"] = request_id;
        error_response["error"]["code"] = 5000000000LL;
        error_response["error"]["message"] = "Code beyond 32 bits";
        send(error_response);
        return;
    }

    // No "jsonrpc" member, as some servers do.
    json error_response;
    error_response["id"] = request_id;
    error_response["error"]["code"] = json_rpc::METHOD_NOT_FOUND;
    error_response["error"]["message"] = "Method not found";
    send(error_response);
}

int main(int argc, char **argv) {
    std::string mode = argc > 1 ? argv[1] : "normal";
    std::cerr << "fake-mcp-server starting (mode=" << mode << ")" << std::endl;

    if (mode == "exit-immediately") {
        return 0;
    }

    bool initialize_answered = false;
    bool initialized_received = false;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }

        json_rpc::DecodeResult decoded = json_rpc::decode(line);
        if (!decoded.success) {
            send(json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error"));
            continue;
        }
        const json_rpc::RpcMessage &message = decoded.message;

        if (message.kind == json_rpc::MessageKind::Notification) {
            if (message.method == "notifications/initialized") {
                initialized_received = true;
            }
            continue;
        }
        if (message.kind != json_rpc::MessageKind::Request) {
            continue;
        }

        if (message.method == "initialize") {
            if (mode == "init-error") {
                send(json_rpc::build_error_response(message.id, json_rpc::INTERNAL_ERROR,
                                                    "initialization refused"));
            } else {
                send(json_rpc::build_response(message.id, initialize_result()));
                initialize_answered = true;
                if (mode == "stop-reading-after-init") {
                    // Leave our stdin pipe to fill up; only a signal ends us.
                    while (true) {
                        std::this_thread::sleep_for(std::chrono::seconds(60));
                    }
                }
            }
            continue;
        }

        if (!initialize_answered) {
            send(json_rpc::build_error_response(message.id, json_rpc::INVALID_REQUEST, "not initialized"));
            continue;
        }

        if (mode == "mismatched-id") {
            send(json_rpc::build_response(99, json::object()));
        } else if (mode == "hang-after-init") {
            // Swallow the request.
        } else if (mode == "garbage-after-init") {
            std::cout << "this is not json" << std::endl;
        } else if (mode == "exit-after-init") {
            return 3;
        } else {
            handle_normal_request(message, json::parse(line), initialized_received);
        }
    }

    return 0;
}
