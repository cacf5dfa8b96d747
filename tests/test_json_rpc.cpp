// Tests for the JSON-RPC line codec: what decode() accepts and rejects,
// what encode() puts on the wire, and that messages survive a round trip.

#include "protocol/json_rpc.hpp"

#include <cstdint>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace test_json_rpc {

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

// Test: a request line decodes into id/method/params.
static bool test_decode_request() {
    json_rpc::DecodeResult decoded =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo"}})");
    return check(decoded.success &&
                     decoded.message.kind == json_rpc::MessageKind::Request &&
                     decoded.message.id == 7 &&
                     decoded.message.method == "tools/call" &&
                     decoded.message.params["name"] == "echo",
                 "Request decodes with id, method and params");
}

// Test: a message without id but with method is a notification.
static bool test_decode_notification() {
    json_rpc::DecodeResult decoded =
        json_rpc::decode(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"progress":1}})");
    return check(decoded.success &&
                     decoded.message.kind == json_rpc::MessageKind::Notification &&
                     decoded.message.method == "notifications/progress" &&
                     decoded.message.id.is_null(),
                 "Notification decodes without id");
}

// Test: success and error responses decode, including a missing jsonrpc member.
static bool test_decode_responses() {
    json_rpc::DecodeResult success =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":2,"result":{"tools":[]}})");
    bool all_passed = check(success.success &&
                                success.message.kind == json_rpc::MessageKind::Response &&
                                !success.message.has_error &&
                                success.message.result == json::parse(R"({"tools":[]})"),
                            "Result response decodes");

    json_rpc::DecodeResult failure =
        json_rpc::decode(R"({"id":3,"error":{"code":-32601,"message":"Method not found"}})");
    all_passed &= check(failure.success &&
                            failure.message.has_error &&
                            failure.message.id == 3 &&
                            failure.message.error["code"] == -32601 &&
                            failure.message.error["message"] == "Method not found",
                        "Error response without jsonrpc member decodes");

    json_rpc::DecodeResult wide_code =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":5,"error":{"code":5000000000,"message":"wide"}})");
    all_passed &= check(wide_code.success && wide_code.message.error["code"].get<int64_t>() == 5000000000LL,
                        "Error code beyond 32 bits decodes unchanged");

    json_rpc::DecodeResult string_id =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":"abc","result":null})");
    all_passed &= check(string_id.success && string_id.message.id == "abc" &&
                            string_id.message.result.is_null(),
                        "Response with string id and null result decodes");

    json_rpc::DecodeResult null_id =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    all_passed &= check(null_id.success && null_id.message.id.is_null(),
                        "Error response with null id decodes");
    return all_passed;
}

// Test: malformed lines are rejected with a reason.
static bool test_decode_rejects_malformed() {
    const char *malformed_lines[] = {
        "not json at all",
        "[1,2,3]",
        R"({"jsonrpc":"1.0","id":1,"result":{}})",
        R"({"jsonrpc":"2.0","id":1})",
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})",
        R"({"jsonrpc":"2.0","result":{}})",
        R"({"jsonrpc":"2.0","id":1.5,"result":{}})",
        R"({"jsonrpc":"2.0","id":null,"result":{}})",
        R"({"jsonrpc":"2.0","id":1,"error":"boom"})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":"x","message":"m"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":18446744073709551615,"message":"m"}})",
        R"({"jsonrpc":"2.0","id":1,"method":42})",
        R"({"jsonrpc":"2.0","id":1,"method":"m","params":"scalar"})",
        R"({"jsonrpc":"2.0","id":{"nested":true},"method":"m"})",
        "",
    };

    bool all_passed = true;
    for (const char *line : malformed_lines) {
        json_rpc::DecodeResult decoded = json_rpc::decode(line);
        if (decoded.success || decoded.error_message.empty()) {
            std::cout << "  FAIL: Accepted malformed line: " << line << std::endl;
            all_passed = false;
        }
    }
    return check(all_passed, "Malformed lines are rejected with a reason");
}

// Test: unknown members survive decode and are written back by encode.
static bool test_extra_fields_preserved() {
    json_rpc::DecodeResult decoded =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":4,"result":{},"_meta":{"trace":"t-1"}})");
    if (!check(decoded.success && decoded.message.extra_fields["_meta"]["trace"] == "t-1",
               "Unknown member kept in extra_fields")) {
        return false;
    }
    json written = json::parse(json_rpc::encode(decoded.message));
    return check(written["_meta"]["trace"] == "t-1", "Unknown member written back on encode");
}

// Test: encoded requests carry jsonrpc, id, method; params only when present.
static bool test_encode_request_shape() {
    json with_params = json::parse(json_rpc::encode(
        json_rpc::make_request(5, "tools/call", {{"name", "echo"}, {"arguments", json::object()}})));
    bool all_passed = check(with_params["jsonrpc"] == "2.0" && with_params["id"] == 5 &&
                                with_params["method"] == "tools/call" &&
                                with_params["params"]["name"] == "echo",
                            "Request encodes jsonrpc, id, method and params");

    json without_params = json::parse(json_rpc::encode(json_rpc::make_request(2, "tools/list", json())));
    all_passed &= check(without_params == json::parse(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"),
                        "Request without params encodes as {jsonrpc,id,method}");

    json error = json::parse(json_rpc::encode(json_rpc::make_error(9, -32601, "Method not found")));
    all_passed &= check(error.contains("error") && !error.contains("result") &&
                            error["error"]["code"] == -32601,
                        "Error response encodes error and no result");
    return all_passed;
}

// Test: encoded output is a single line even when strings contain newlines.
static bool test_encode_single_line() {
    json params;
    params["text"] = "line one\nline two\r\n\ttabbed";
    params["invalid_utf8"] = std::string("bad \xff byte");
    std::string encoded = json_rpc::encode(json_rpc::make_request(1, "tools/call", params));
    bool single_line = encoded.find('\n') == std::string::npos && encoded.find('\r') == std::string::npos;
    json_rpc::DecodeResult decoded = json_rpc::decode(encoded);
    return check(single_line && decoded.success &&
                     decoded.message.params["text"] == "line one\nline two\r\n\ttabbed",
                 "Encoding never produces embedded newlines");
}

// Test: decode(encode(m)) == m for each message kind with nested payloads.
static bool test_round_trip() {
    json nested = json::parse(R"({"a":[1,2,{"b":null}],"c":{"d":"e","f":1.5,"g":true},"h":-3})");

    json_rpc::RpcMessage with_extras = json_rpc::make_result("req-9", nested);
    with_extras.extra_fields["_meta"] = json::parse(R"({"k":"v"})");

    json_rpc::RpcMessage error_with_data = json_rpc::make_error(12, -32000, "boom");
    error_with_data.error["data"] = nested;

    json_rpc::RpcMessage messages[] = {
        json_rpc::make_request(1, "initialize", nested),
        json_rpc::make_request("string-id", "tools/list", json()),
        json_rpc::make_request(3, "batch", json::array({1, "two", nested})),
        json_rpc::make_notification("notifications/initialized", json()),
        json_rpc::make_notification("notifications/progress", nested),
        json_rpc::make_result(2, json::object()),
        with_extras,
        error_with_data,
    };

    bool all_passed = true;
    for (const auto &message : messages) {
        std::string encoded = json_rpc::encode(message);
        json_rpc::DecodeResult decoded = json_rpc::decode(encoded);
        if (!decoded.success || decoded.message != message) {
            std::cout << "  FAIL: Round trip changed message: " << encoded << std::endl;
            all_passed = false;
        }
    }
    return check(all_passed, "decode(encode(m)) == m for requests, notifications and responses");
}

// Test: response builders used to answer server-initiated requests.
static bool test_response_builders() {
    json response = json_rpc::build_response("srv-1", json::object());
    json error = json_rpc::build_error_response(4, json_rpc::METHOD_NOT_FOUND, "nope", {{"x", 1}});
    return check(response["jsonrpc"] == "2.0" && response["id"] == "srv-1" && response["result"].is_object() &&
                     error["error"]["code"] == -32601 && error["error"]["data"]["x"] == 1,
                 "build_response / build_error_response produce JSON-RPC 2.0 responses");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_decode_request();
    all_passed &= test_decode_notification();
    all_passed &= test_decode_responses();
    all_passed &= test_decode_rejects_malformed();
    all_passed &= test_extra_fields_preserved();
    all_passed &= test_encode_request_shape();
    all_passed &= test_encode_single_line();
    all_passed &= test_round_trip();
    all_passed &= test_response_builders();
    return all_passed;
}

} // namespace test_json_rpc
