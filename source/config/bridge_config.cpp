#include "config/bridge_config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace bridge_config {

// ordered_json keeps "mcpServers" in file order, which decides the server we launch.
using ordered_json = nlohmann::ordered_json;

static std::string read_string(const ordered_json &section, const char *key, const std::string &fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    if (!section[key].is_string()) {
        throw std::runtime_error(std::string("'") + key + "' must be a string");
    }
    return section[key].get<std::string>();
}

static int read_integer(const ordered_json &section, const char *key, int fallback,
                        int minimum, int maximum) {
    if (!section.contains(key)) {
        return fallback;
    }
    if (!section[key].is_number_integer()) {
        throw std::runtime_error(std::string("'") + key + "' must be an integer");
    }
    long long value = section[key].get<long long>();
    if (value < minimum || value > maximum) {
        throw std::runtime_error(std::string("'") + key + "' must be between " +
                                 std::to_string(minimum) + " and " + std::to_string(maximum));
    }
    return static_cast<int>(value);
}

static ServerSpec parse_server_entry(const std::string &name, const ordered_json &entry) {
    if (!entry.is_object()) {
        throw std::runtime_error("server '" + name + "' must be an object");
    }

    ServerSpec server_spec;
    server_spec.name = name;
    server_spec.command = read_string(entry, "command", "");

    if (entry.contains("args")) {
        const ordered_json &arguments = entry["args"];
        if (!arguments.is_array()) {
            throw std::runtime_error("'args' of server '" + name + "' must be an array");
        }
        for (const auto &argument : arguments) {
            if (!argument.is_string()) {
                throw std::runtime_error("'args' of server '" + name + "' must contain only strings");
            }
            server_spec.arguments.push_back(argument.get<std::string>());
        }
    }
    return server_spec;
}

static void parse_bridge_section(const ordered_json &section, BridgeConfig &config) {
    if (!section.is_object()) {
        throw std::runtime_error("'bridge' must be an object");
    }
    config.listen_host = read_string(section, "host", config.listen_host);
    config.listen_port = read_integer(section, "port", config.listen_port, 1, 65535);
    config.cors_allowed_origin = read_string(section, "corsAllowedOrigin", config.cors_allowed_origin);
    config.request_timeout_milliseconds =
        read_integer(section, "requestTimeoutMs", config.request_timeout_milliseconds, 0, 86400000);
    config.handshake_timeout_milliseconds =
        read_integer(section, "handshakeTimeoutMs", config.handshake_timeout_milliseconds, 0, 86400000);
    config.terminate_grace_milliseconds =
        read_integer(section, "terminateGraceMs", config.terminate_grace_milliseconds, 0, 600000);
    config.client_name = read_string(section, "clientName", config.client_name);
    config.client_version = read_string(section, "clientVersion", config.client_version);
}

BridgeConfig parse_config(const std::string &config_text) {
    BridgeConfig config;

    try {
        ordered_json document = ordered_json::parse(config_text);
        if (!document.is_object()) {
            throw std::runtime_error("top-level value must be an object");
        }

        BridgeConfig parsed;
        if (document.contains("mcpServers")) {
            const ordered_json &servers = document["mcpServers"];
            if (!servers.is_object()) {
                throw std::runtime_error("'mcpServers' must be an object");
            }
            for (auto entry = servers.begin(); entry != servers.end(); ++entry) {
                parsed.servers.push_back(parse_server_entry(entry.key(), entry.value()));
            }
        }
        if (document.contains("bridge")) {
            parse_bridge_section(document["bridge"], parsed);
        }

        parsed.config_loaded = true;
        config = parsed;
    } catch (const nlohmann::json::exception &error) {
        config.load_error = "invalid JSON: " + std::string(error.what());
    } catch (const std::runtime_error &error) {
        config.load_error = error.what();
    }

    return config;
}

BridgeConfig load_config(const std::string &config_path) {
    std::string contents;
    if (!platform::read_file_contents(config_path, contents)) {
        BridgeConfig config;
        config.config_path = config_path;
        config.load_error = "cannot read " + config_path;
        debug_log::error("Failed to load MCP config: " + config.load_error);
        return config;
    }

    BridgeConfig config = parse_config(contents);
    config.config_path = config_path;
    if (config.config_loaded) {
        debug_log::log("Loaded " + config_path + " with " + std::to_string(config.servers.size()) +
                       " server definition(s).");
    } else {
        debug_log::error("Failed to load MCP config " + config_path + ": " + config.load_error);
    }
    return config;
}

void apply_environment_overrides(BridgeConfig &config) {
    const char *host = std::getenv("MCPBRIDGE_HOST");
    if (host != nullptr && host[0] != '\0') {
        config.listen_host = host;
    }

    const char *port = std::getenv("MCPBRIDGE_PORT");
    if (port != nullptr && port[0] != '\0') {
        try {
            int parsed_port = std::stoi(port);
            if (parsed_port > 0 && parsed_port <= 65535) {
                config.listen_port = parsed_port;
            } else {
                debug_log::error("Ignoring MCPBRIDGE_PORT out of range: " + std::string(port));
            }
        } catch (const std::exception &error) {
            debug_log::error("Ignoring invalid MCPBRIDGE_PORT '" + std::string(port) + "': " + error.what());
        }
    }
}

std::string resolve_config_path(int argument_count, char **arguments) {
    if (argument_count > 1 && arguments[1] != nullptr && arguments[1][0] != '\0') {
        return arguments[1];
    }
    const char *from_environment = std::getenv("MCPBRIDGE_CONFIG");
    if (from_environment != nullptr && from_environment[0] != '\0') {
        return from_environment;
    }
    return DEFAULT_CONFIG_PATH;
}

bool resolve_server_spec(const BridgeConfig &config, ServerSpec &server_spec, std::string &error_message) {
    if (config.servers.empty()) {
        error_message = "No MCP server configuration found";
        return false;
    }

    // Only the first server is used; the rest are ignored.
    const ServerSpec &first = config.servers.front();
    if (first.command.empty()) {
        error_message = "No command specified in MCP config for server '" + first.name + "'";
        return false;
    }
    if (config.servers.size() > 1) {
        debug_log::info("Multiple MCP servers configured; using the first one ('" + first.name + "').");
    }

    server_spec = first;
    return true;
}

} // namespace bridge_config
