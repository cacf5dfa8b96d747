// MCP Bridge – HTTP bridge to a stdio MCP server.
// Entry point: load config, start the MCP server session, serve HTTP.
//
// The session is owned by main() for the lifetime of the HTTP loop and is
// disconnected (server process terminated) on the way out.

#include <iostream>
#include <string>
#include <csignal>

#include "bridge/bridge_api.hpp"
#include "bridge/http_server.hpp"
#include "config/bridge_config.hpp"
#include "session/session_manager.hpp"
#include "utils/debug_log.hpp"

static void signal_handler(int signal_number) {
    (void)signal_number;
    http_server::request_stop();
}

int main(int argc, char **argv) {
    std::cerr << "[mcpbridge] mcpbridge – MCP Bridge API, build " << __DATE__ << " " << __TIME__ << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = bridge_config::resolve_config_path(argc, argv);
    bridge_config::BridgeConfig config = bridge_config::load_config(config_path);
    bridge_config::apply_environment_overrides(config);

    // Without a usable server entry the command stays empty; connect() then reports it.
    bridge_config::ServerSpec server_spec;
    std::string resolve_error;
    if (!bridge_config::resolve_server_spec(config, server_spec, resolve_error)) {
        debug_log::error(resolve_error);
    }

    session_manager::SessionOptions session_options;
    session_options.client_name = config.client_name;
    session_options.client_version = config.client_version;
    session_options.request_timeout_milliseconds = config.request_timeout_milliseconds;
    session_options.handshake_timeout_milliseconds = config.handshake_timeout_milliseconds;
    session_options.terminate_grace_milliseconds = config.terminate_grace_milliseconds;

    bool served = false;
    {
        session_manager::SessionManager session(server_spec, session_options);

        // Startup connect failure is not fatal: /health reports it and POST /connect retries.
        session_manager::SessionResult connected = session.connect();
        if (!connected.success) {
            debug_log::error("Failed to start MCP connection: " + connected.error_message);
        }

        bridge_api::BridgeApi api(session, config.config_loaded);

        http_server::HttpServerOptions server_options;
        server_options.host = config.listen_host;
        server_options.port = config.listen_port;
        server_options.cors_allowed_origin = config.cors_allowed_origin;
        served = http_server::run(api, server_options);

        session.disconnect();
    }

    debug_log::info("MCP Bridge shut down.");
    return served ? 0 : 1;
}
