#include "bridge/http_server.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <map>
#include <vector>

namespace http_server {

// One HTTP transaction between LWS_CALLBACK_HTTP and the final body write.
struct PendingRequest {
    std::string http_method;
    std::string path;
    std::string body;
    bool body_too_large = false;
    std::string response_body;
};

// Module-level server state; only touched from the service thread.
struct ServerState {
    bridge_api::BridgeApi *api = nullptr;
    std::string cors_allowed_origin;
    std::map<struct lws *, PendingRequest> requests;
};

static ServerState server_state;
static std::atomic<bool> stop_requested(false);
static std::atomic<struct lws_context *> active_context(nullptr);

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_callback,
        0, // per-session data size
        0  // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static std::string request_method(struct lws *connection) {
    if (lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0) {
        return "GET";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0) {
        return "POST";
    }
#if defined(LWS_WITH_HTTP_UNCOMMON_HEADERS) || defined(LWS_HTTP_HEADERS_ALL)
    if (lws_hdr_total_length(connection, WSI_TOKEN_OPTIONS_URI) > 0) {
        return "OPTIONS";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_PUT_URI) > 0) {
        return "PUT";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_DELETE_URI) > 0) {
        return "DELETE";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_PATCH_URI) > 0) {
        return "PATCH";
    }
#endif
    return "UNKNOWN";
}

static bool request_has_body(struct lws *connection) {
    char content_length[32];
    int copied = lws_hdr_copy(connection, content_length, sizeof(content_length),
                              WSI_TOKEN_HTTP_CONTENT_LENGTH);
    if (copied <= 0) {
        return false;
    }
    return std::strtoll(content_length, nullptr, 10) > 0;
}

static bool add_header(struct lws *connection, const char *name, const std::string &value,
                       unsigned char **position, unsigned char *end) {
    return lws_add_http_header_by_name(connection,
                                       reinterpret_cast<const unsigned char *>(name),
                                       reinterpret_cast<const unsigned char *>(value.c_str()),
                                       static_cast<int>(value.size()), position, end) == 0;
}

// Build the reply, send headers, and schedule the body write.
// Returns the value the callback should return.
static int respond(struct lws *connection, PendingRequest &request) {
    bridge_api::HttpReply reply;
    if (request.http_method == "OPTIONS") {
        reply.status_code = 204;
    } else if (request.body_too_large) {
        reply = bridge_api::error_reply(413, "Request body too large");
    } else {
        reply = server_state.api->handle(request.http_method, request.path, request.body);
    }

    if (reply.status_code != 204) {
        request.response_body = reply.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    debug_log::log("HTTP " + request.http_method + " " + request.path + " -> " +
                   std::to_string(reply.status_code));

    unsigned char header_buffer[LWS_PRE + 1024];
    unsigned char *start = &header_buffer[LWS_PRE];
    unsigned char *position = start;
    unsigned char *end = &header_buffer[sizeof(header_buffer) - 1];

    if (lws_add_http_common_headers(connection, static_cast<unsigned int>(reply.status_code),
                                    "application/json", request.response_body.size(),
                                    &position, end) != 0 ||
        !add_header(connection, "access-control-allow-origin:", server_state.cors_allowed_origin, &position, end) ||
        !add_header(connection, "access-control-allow-methods:", "GET, POST, OPTIONS", &position, end) ||
        !add_header(connection, "access-control-allow-headers:", "content-type", &position, end)) {
        debug_log::error("Failed to build HTTP response headers");
        return 1;
    }
    if (lws_finalize_write_http_header(connection, start, &position, end) != 0) {
        return 1;
    }

    if (request.response_body.empty()) {
        server_state.requests.erase(connection);
        return lws_http_transaction_completed(connection) ? -1 : 0;
    }

    lws_callback_on_writable(connection);
    return 0;
}

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    switch (reason) {
    case LWS_CALLBACK_HTTP: {
        PendingRequest &request = server_state.requests[connection];
        request = PendingRequest();
        request.path = incoming_data ? static_cast<const char *>(incoming_data) : "/";
        request.http_method = request_method(connection);

        if (request.http_method == "POST" && request_has_body(connection)) {
            return 0; // Body arrives through LWS_CALLBACK_HTTP_BODY.
        }
        return respond(connection, request);
    }

    case LWS_CALLBACK_HTTP_BODY: {
        auto iterator = server_state.requests.find(connection);
        if (iterator == server_state.requests.end()) {
            return -1;
        }
        PendingRequest &request = iterator->second;
        if (request.body.size() + incoming_length > kMaximumBodySize) {
            request.body_too_large = true;
            request.body.clear();
        } else if (!request.body_too_large) {
            request.body.append(static_cast<const char *>(incoming_data), incoming_length);
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
        auto iterator = server_state.requests.find(connection);
        if (iterator == server_state.requests.end()) {
            return -1;
        }
        return respond(connection, iterator->second);
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        auto iterator = server_state.requests.find(connection);
        if (iterator == server_state.requests.end()) {
            break;
        }

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        const std::string &body = iterator->second.response_body;
        std::vector<unsigned char> send_buffer(LWS_PRE + body.size());
        memcpy(send_buffer.data() + LWS_PRE, body.data(), body.size());

        int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, body.size(),
                                      LWS_WRITE_HTTP_FINAL);
        size_t expected_size = body.size();
        server_state.requests.erase(iterator);
        if (bytes_written < 0 || static_cast<size_t>(bytes_written) < expected_size) {
            return -1;
        }
        return lws_http_transaction_completed(connection) ? -1 : 0;
    }

    case LWS_CALLBACK_CLOSED_HTTP:
        server_state.requests.erase(connection);
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

bool run(bridge_api::BridgeApi &api, const HttpServerOptions &options) {
    server_state.api = &api;
    server_state.cors_allowed_origin = options.cors_allowed_origin;
    server_state.requests.clear();

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = options.port;
    // A null interface listens on all addresses.
    context_info.iface = (options.host.empty() || options.host == "0.0.0.0") ? nullptr : options.host.c_str();
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        debug_log::error("Failed to create HTTP listener on " + options.host + ":" + std::to_string(options.port));
        return false;
    }
    active_context.store(context);

    debug_log::info("MCP Bridge API listening on " + options.host + ":" + std::to_string(options.port));

    while (!stop_requested.load()) {
        if (lws_service(context, 100) < 0) {
            debug_log::error("HTTP service loop failed");
            break;
        }
    }

    active_context.store(nullptr);
    lws_context_destroy(context);
    server_state.requests.clear();
    server_state.api = nullptr;
    debug_log::info("MCP Bridge API stopped.");
    return true;
}

void request_stop() {
    stop_requested.store(true);
    struct lws_context *context = active_context.load();
    if (context != nullptr) {
        lws_cancel_service(context);
    }
}

} // namespace http_server
