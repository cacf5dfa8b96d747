#include "session/session_manager.hpp"
#include "protocol/json_rpc.hpp"
#include "transport/process_supervisor.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <utility>

namespace session_manager {

using process_supervisor::IoStatus;
using process_supervisor::Supervisor;

const char *to_string(SessionState state) {
    switch (state) {
    case SessionState::Disconnected:
        return "disconnected";
    case SessionState::Connecting:
        return "connecting";
    case SessionState::Ready:
        return "ready";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

const char *to_string(ErrorKind error) {
    switch (error) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::SpawnFailed:
        return "spawn failed";
    case ErrorKind::HandshakeFailed:
        return "handshake failed";
    case ErrorKind::TransportFailed:
        return "transport failed";
    case ErrorKind::RemoteError:
        return "remote error";
    case ErrorKind::SessionBusy:
        return "session busy";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::NotConnected:
        return "not connected";
    case ErrorKind::SessionClosed:
        return "session closed";
    }
    return "unknown";
}

static SessionResult failure(ErrorKind error, const std::string &message) {
    SessionResult result;
    result.success = false;
    result.error = error;
    result.error_message = message;
    return result;
}

// Milliseconds left until deadline for the supervisor's I/O calls, where <= 0
// means "forever": 0 without a timeout, at least 1 once one is set.
static int remaining_milliseconds(std::chrono::steady_clock::time_point deadline, int timeout_milliseconds) {
    if (timeout_milliseconds <= 0) {
        return 0;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return remaining > 0 ? static_cast<int>(remaining) : 1;
}

// Session error for a failed read or write on the server's pipes.
static SessionResult io_failure(IoStatus status, const std::string &activity, const std::string &detail,
                                int timeout_milliseconds) {
    if (status == IoStatus::TimedOut) {
        return failure(ErrorKind::Timeout, activity + " did not finish within " +
                                               std::to_string(timeout_milliseconds) + " ms");
    }
    if (status == IoStatus::Cancelled) {
        return failure(ErrorKind::TransportFailed, "session disconnected while " + activity);
    }
    return failure(ErrorKind::TransportFailed,
                   activity + " failed (" + process_supervisor::to_string(status) + "): " + detail);
}

SessionManager::SessionManager(bridge_config::ServerSpec server_spec, SessionOptions options)
    : server_spec_(std::move(server_spec)), options_(std::move(options)) {}

SessionManager::~SessionManager() {
    disconnect();
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool SessionManager::pending_call(PendingCall &pending) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!has_pending_call_) {
        return false;
    }
    pending = pending_call_;
    return true;
}

json SessionManager::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

std::vector<std::string> SessionManager::recent_server_stderr() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!supervisor_) {
        return {};
    }
    return supervisor_->recent_stderr_lines();
}

json SessionManager::build_initialize_params() const {
    json params;
    params["protocolVersion"] = PROTOCOL_VERSION;
    params["capabilities"]["roots"]["listChanged"] = true;
    params["capabilities"]["sampling"] = json::object();
    params["clientInfo"]["name"] = options_.client_name;
    params["clientInfo"]["version"] = options_.client_version;
    return params;
}

SessionResult SessionManager::connect() {
    std::unique_lock<std::mutex> exchange_lock(exchange_mutex_, std::try_to_lock);
    if (!exchange_lock.owns_lock()) {
        return failure(ErrorKind::SessionBusy, "another request is in flight");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) {
            return failure(ErrorKind::SessionClosed, "session has been closed");
        }
        if (state_ == SessionState::Ready) {
            SessionResult result;
            result.success = true;
            result.result = server_info_;
            return result;
        }
        state_ = SessionState::Connecting;
    }

    debug_log::info("Connecting to MCP server '" + server_spec_.name + "' (" + server_spec_.command + ")");

    auto supervisor = std::make_unique<Supervisor>();
    process_supervisor::SpawnResult spawned = supervisor->spawn(server_spec_);
    if (!spawned.success) {
        std::string message = server_spec_.command.empty()
                                  ? std::string("No MCP server configuration found")
                                  : "failed to start '" + server_spec_.command + "': " + spawned.error_message;
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) {
            return failure(ErrorKind::SessionClosed, "session was closed while connecting");
        }
        state_ = SessionState::Disconnected;
        debug_log::error("Failed to connect to MCP server: " + message);
        return failure(ErrorKind::SpawnFailed, message);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Closed) {
            supervisor_ = std::move(supervisor);
        }
    }
    if (supervisor) {
        supervisor->terminate(options_.terminate_grace_milliseconds);
        return failure(ErrorKind::SessionClosed, "session was closed while connecting");
    }

    SessionResult handshake = exchange("initialize", build_initialize_params(),
                                       options_.handshake_timeout_milliseconds);
    if (handshake.success) {
        SessionResult notified = notify(INITIALIZED_NOTIFICATION, json(), options_.handshake_timeout_milliseconds);
        if (!notified.success) {
            handshake = notified;
        }
    } else if (handshake.error == ErrorKind::RemoteError) {
        // The process is healthy but refused us; do not keep it around.
        drop_transport("initialize rejected: " + handshake.error_message);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::Closed) {
        return failure(ErrorKind::SessionClosed, "session was closed while connecting");
    }
    if (!handshake.success) {
        state_ = SessionState::Disconnected;
        std::string message = "initialize failed (" + std::string(to_string(handshake.error)) +
                              "): " + handshake.error_message;
        debug_log::error("Failed to connect to MCP server: " + message);
        return failure(ErrorKind::HandshakeFailed, message);
    }

    state_ = SessionState::Ready;
    server_info_ = handshake.result;
    debug_log::info("Connected to MCP server '" + server_spec_.name + "'");
    return handshake;
}

SessionResult SessionManager::call(const std::string &method, const json &params) {
    std::unique_lock<std::mutex> exchange_lock(exchange_mutex_, std::try_to_lock);
    if (!exchange_lock.owns_lock()) {
        return failure(ErrorKind::SessionBusy, "another request is in flight");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) {
            return failure(ErrorKind::SessionClosed, "session has been closed");
        }
        if (state_ != SessionState::Ready) {
            return failure(ErrorKind::NotConnected,
                           "MCP server not connected (session is " + std::string(to_string(state_)) + ")");
        }
    }

    // An empty params object is omitted on the wire.
    json wire_params = (params.is_object() && params.empty()) ? json() : params;
    return exchange(method, wire_params, options_.request_timeout_milliseconds);
}

SessionResult SessionManager::exchange(const std::string &method, const json &params,
                                       int timeout_milliseconds) {
    Supervisor *supervisor = nullptr;
    int64_t request_id = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) {
            return failure(ErrorKind::SessionClosed, "session has been closed");
        }
        if (!supervisor_) {
            return failure(ErrorKind::NotConnected, "MCP server not connected");
        }
        // supervisor_ is only replaced while exchange_mutex_ is held, which our caller holds.
        supervisor = supervisor_.get();
        request_id = next_request_id_++;
        has_pending_call_ = true;
        pending_call_.id = request_id;
        pending_call_.method_name = method;
    }

    SessionResult result;
    auto finish = [this, &result]() -> SessionResult {
        std::lock_guard<std::mutex> lock(state_mutex_);
        has_pending_call_ = false;
        return result;
    };

    // The deadline covers sending the request as well as waiting for the reply.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    json_rpc::RpcMessage request = json_rpc::make_request(request_id, method, params);
    process_supervisor::IoResult written =
        supervisor->write_line(json_rpc::encode(request), remaining_milliseconds(deadline, timeout_milliseconds));
    if (written.status != IoStatus::Ok) {
        drop_transport("sending " + method + ": " + written.error_message);
        result = io_failure(written.status, "sending " + method, written.error_message, timeout_milliseconds);
        return finish();
    }

    while (true) {
        process_supervisor::LineResult line =
            supervisor->read_line(remaining_milliseconds(deadline, timeout_milliseconds));
        if (line.status != IoStatus::Ok) {
            drop_transport("waiting for " + method + ": " + line.error_message);
            result = io_failure(line.status, "waiting for " + method, line.error_message, timeout_milliseconds);
            return finish();
        }
        if (line.line.empty()) {
            continue;
        }

        json_rpc::DecodeResult decoded = json_rpc::decode(line.line);
        if (!decoded.success) {
            drop_transport("malformed message: " + decoded.error_message);
            result = failure(ErrorKind::TransportFailed, "malformed message from server: " + decoded.error_message);
            return finish();
        }

        const json_rpc::RpcMessage &message = decoded.message;
        if (message.kind == json_rpc::MessageKind::Notification) {
            debug_log::log("Ignoring server notification " + message.method + " while waiting for " + method);
            continue;
        }
        if (message.kind == json_rpc::MessageKind::Request) {
            SessionResult answered = answer_server_request(message.id, message.method,
                                                           remaining_milliseconds(deadline, timeout_milliseconds));
            if (!answered.success) {
                result = answered;
                return finish();
            }
            continue;
        }

        // Single-flight: any response not for the pending id means the stream is out of step.
        if (message.id != json(request_id)) {
            std::string reason = "response id " + json_rpc::describe_id(message.id) +
                                 " does not match pending request id " + std::to_string(request_id);
            drop_transport(reason);
            result = failure(ErrorKind::TransportFailed, reason);
            return finish();
        }

        if (message.has_error) {
            result = failure(ErrorKind::RemoteError, message.error["message"].get<std::string>());
            result.remote_error_code = message.error["code"].get<int64_t>();
            if (message.error.contains("data")) {
                result.remote_error_data = message.error["data"];
            }
            return finish();
        }

        result.success = true;
        result.result = message.result;
        return finish();
    }
}

SessionResult SessionManager::notify(const std::string &method, const json &params,
                                     int timeout_milliseconds) {
    Supervisor *supervisor = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!supervisor_) {
            return failure(ErrorKind::NotConnected, "MCP server not connected");
        }
        supervisor = supervisor_.get();
    }

    process_supervisor::IoResult written =
        supervisor->write_line(json_rpc::encode(json_rpc::make_notification(method, params)), timeout_milliseconds);
    if (written.status != IoStatus::Ok) {
        drop_transport("sending " + method + ": " + written.error_message);
        return io_failure(written.status, "sending " + method, written.error_message, timeout_milliseconds);
    }

    SessionResult result;
    result.success = true;
    return result;
}

SessionResult SessionManager::answer_server_request(const json &request_id, const std::string &method,
                                                   int timeout_milliseconds) {
    json reply;
    if (method == "ping") {
        reply = json_rpc::build_response(request_id, json::object());
    } else if (method == "roots/list") {
        json roots;
        roots["roots"] = json::array();
        reply = json_rpc::build_response(request_id, roots);
    } else {
        debug_log::log("Rejecting server request " + method);
        reply = json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                               "Method not found: " + method);
    }

    Supervisor *supervisor = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        supervisor = supervisor_.get();
    }
    if (supervisor == nullptr) {
        return failure(ErrorKind::TransportFailed, "MCP server not connected");
    }

    process_supervisor::IoResult written =
        supervisor->write_line(reply.dump(-1, ' ', false, json::error_handler_t::replace), timeout_milliseconds);
    if (written.status != IoStatus::Ok) {
        drop_transport("answering " + method + ": " + written.error_message);
        return io_failure(written.status, "answering server request " + method, written.error_message,
                          timeout_milliseconds);
    }

    SessionResult result;
    result.success = true;
    return result;
}

void SessionManager::drop_transport(const std::string &reason) {
    std::unique_ptr<Supervisor> finished;
    bool closing = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished = std::move(supervisor_);
        closing = (state_ == SessionState::Closed);
        if (!closing) {
            state_ = SessionState::Disconnected;
        }
    }

    if (!closing) {
        debug_log::error("Lost MCP server '" + server_spec_.name + "': " + reason);
    }
    if (finished) {
        for (const auto &line : finished->recent_stderr_lines()) {
            debug_log::log("[" + server_spec_.name + " stderr] " + line);
        }
        finished->terminate(options_.terminate_grace_milliseconds);
    }
}

void SessionManager::disconnect() {
    bool had_server = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed && !supervisor_) {
            return;
        }
        state_ = SessionState::Closed;
        if (supervisor_) {
            had_server = true;
            supervisor_->cancel();
        }
    }

    // Wait for an in-flight exchange to notice the cancellation.
    std::unique_ptr<Supervisor> finished;
    {
        std::lock_guard<std::mutex> exchange_lock(exchange_mutex_);
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished = std::move(supervisor_);
    }

    if (finished) {
        had_server = true;
        finished->terminate(options_.terminate_grace_milliseconds);
    }
    if (had_server) {
        debug_log::info("Disconnected from MCP server '" + server_spec_.name + "'");
    }
}

} // namespace session_manager
