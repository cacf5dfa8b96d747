#ifndef MCPBRIDGE_SESSION_MANAGER_HPP
#define MCPBRIDGE_SESSION_MANAGER_HPP

// MCP session over a child process's stdio.
// One instance drives one child server: handshake, request id sequencing and
// single-flight request/response correlation.
//
// Single-flight contract: a call() or connect() issued while another exchange
// is outstanding fails immediately with ErrorKind::SessionBusy.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/server_spec.hpp"

namespace process_supervisor {
class Supervisor;
}

namespace session_manager {

using json = nlohmann::json;

enum class SessionState {
    Disconnected,
    Connecting,
    Ready,
    Closed,
};

enum class ErrorKind {
    None,
    SpawnFailed,
    HandshakeFailed,
    TransportFailed,
    RemoteError,
    SessionBusy,
    Timeout,
    NotConnected,
    SessionClosed,
};

const char *to_string(SessionState state);
const char *to_string(ErrorKind error);

// Handshake constants.
static const char PROTOCOL_VERSION[] = "2024-11-05";
static const char INITIALIZED_NOTIFICATION[] = "notifications/initialized";

struct SessionOptions {
    std::string client_name = "mcpbridge";
    std::string client_version = "1.0.0";
    // 0 waits forever.
    int request_timeout_milliseconds = 30000;
    int handshake_timeout_milliseconds = 10000;
    int terminate_grace_milliseconds = 2000;
};

// Outcome of connect() or call(). On success, result holds the response
// result (the initialize result for connect()). For RemoteError the remote
// code/message/data are copied verbatim.
struct SessionResult {
    bool success = false;
    json result;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    int64_t remote_error_code = 0;
    json remote_error_data;
};

// The request currently awaiting its response.
struct PendingCall {
    int64_t id = 0;
    std::string method_name;
};

class SessionManager {
public:
    explicit SessionManager(bridge_config::ServerSpec server_spec, SessionOptions options = {});
    ~SessionManager();

    SessionManager(const SessionManager &) = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    // Spawn the server and perform the initialize handshake.
    // Disconnected -> Connecting -> Ready, or back to Disconnected on failure.
    SessionResult connect();

    // Send one request and wait for its response. Requires Ready.
    SessionResult call(const std::string &method, const json &params);

    // Terminate the server and close the session for good. Unblocks a call
    // waiting on a response. Safe from any thread, idempotent.
    void disconnect();

    SessionState state() const;
    bool is_connected() const { return state() == SessionState::Ready; }

    // Copy of the pending call, if any. Returns false when idle.
    bool pending_call(PendingCall &pending) const;

    // Result of the last successful initialize (serverInfo, capabilities, ...).
    json server_info() const;

    const bridge_config::ServerSpec &server_spec() const { return server_spec_; }

    // Last lines the server wrote to stderr (empty when not running).
    std::vector<std::string> recent_server_stderr() const;

private:
    // Write one request and read until its response. Caller holds exchange_mutex_.
    SessionResult exchange(const std::string &method, const json &params, int timeout_milliseconds);

    // Send a notification. Caller holds exchange_mutex_.
    SessionResult notify(const std::string &method, const json &params, int timeout_milliseconds);

    // Reply to a request the server sent us while we wait for our response.
    SessionResult answer_server_request(const json &request_id, const std::string &method,
                                        int timeout_milliseconds);

    // End the current process after a transport failure: Disconnected unless
    // disconnect() already closed the session. Caller holds exchange_mutex_.
    void drop_transport(const std::string &reason);

    json build_initialize_params() const;

    const bridge_config::ServerSpec server_spec_;
    const SessionOptions options_;

    // Held for the duration of a connect()/call() exchange.
    std::mutex exchange_mutex_;

    // Guards everything below. Lock order: exchange_mutex_, then state_mutex_.
    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::Disconnected;
    std::unique_ptr<process_supervisor::Supervisor> supervisor_;
    bool has_pending_call_ = false;
    PendingCall pending_call_;
    int64_t next_request_id_ = 1;
    json server_info_;
};

} // namespace session_manager

#endif // MCPBRIDGE_SESSION_MANAGER_HPP
