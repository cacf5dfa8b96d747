#ifndef MCPBRIDGE_HTTP_SERVER_HPP
#define MCPBRIDGE_HTTP_SERVER_HPP

// HTTP/1.1 listener (libwebsockets) that feeds requests to the Bridge API.
// Requests are served one at a time on the calling thread.

#include <string>

#include "bridge/bridge_api.hpp"

namespace http_server {

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string cors_allowed_origin = "*";
};

// Largest request body accepted; bigger bodies get 413.
static constexpr size_t kMaximumBodySize = 1024 * 1024;

// Serve until request_stop() is called. Returns false if the listener
// could not be created.
bool run(bridge_api::BridgeApi &api, const HttpServerOptions &options);

// Make run() return. Async-signal-safe.
void request_stop();

} // namespace http_server

#endif // MCPBRIDGE_HTTP_SERVER_HPP
