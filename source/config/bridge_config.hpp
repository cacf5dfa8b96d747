#ifndef MCPBRIDGE_BRIDGE_CONFIG_HPP
#define MCPBRIDGE_BRIDGE_CONFIG_HPP

// Bridge configuration: the "mcpServers" map (MCP client config format) plus
// an optional "bridge" section with listener and timeout settings.

#include <string>
#include <vector>

#include "config/server_spec.hpp"

namespace bridge_config {

static const char DEFAULT_CONFIG_PATH[] = "mcp_config.json";

struct BridgeConfig {
    std::string config_path;
    bool config_loaded = false;
    std::string load_error;

    // In the order they appear in the file.
    std::vector<ServerSpec> servers;

    std::string listen_host = "0.0.0.0";
    int listen_port = 8000;
    std::string cors_allowed_origin = "*";

    // 0 disables the timeout.
    int request_timeout_milliseconds = 30000;
    int handshake_timeout_milliseconds = 10000;
    int terminate_grace_milliseconds = 2000;

    std::string client_name = "mcpbridge";
    std::string client_version = "1.0.0";
};

// Parse configuration text. On failure config_loaded is false, load_error says
// why, and every setting keeps its default.
BridgeConfig parse_config(const std::string &config_text);

// Load configuration from a file. A missing or invalid file is not fatal:
// the returned config has config_loaded == false.
BridgeConfig load_config(const std::string &config_path);

// Apply MCPBRIDGE_HOST / MCPBRIDGE_PORT overrides.
void apply_environment_overrides(BridgeConfig &config);

// Config path from argv[1], else MCPBRIDGE_CONFIG, else DEFAULT_CONFIG_PATH.
std::string resolve_config_path(int argument_count, char **arguments);

// Pick the server to launch: the first configured entry.
// Returns false with error_message set when none is usable.
bool resolve_server_spec(const BridgeConfig &config, ServerSpec &server_spec, std::string &error_message);

} // namespace bridge_config

#endif // MCPBRIDGE_BRIDGE_CONFIG_HPP
