#ifndef MCPBRIDGE_PROCESS_SUPERVISOR_HPP
#define MCPBRIDGE_PROCESS_SUPERVISOR_HPP

// Child process supervisor for a stdio MCP server.
// Owns the process, its three pipes and a stderr drain thread; exposes
// line-oriented I/O on the child's stdin/stdout.

#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config/server_spec.hpp"

namespace process_supervisor {

enum class IoStatus {
    Ok,
    EndOfStream,
    ReadFailed,
    WriteFailed,
    TimedOut,
    Cancelled,
};

const char *to_string(IoStatus status);

struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

struct IoResult {
    IoStatus status = IoStatus::Ok;
    std::string error_message;
};

struct LineResult {
    IoStatus status = IoStatus::Ok;
    std::string line;
    std::string error_message;
};

class Supervisor {
public:
    static constexpr size_t kRecentStderrLinesMax = 50;
    static constexpr int kDefaultTerminateGraceMilliseconds = 2000;

    Supervisor() = default;
    ~Supervisor();

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    // Launch the server. Fails if a child is already running or the OS refuses.
    SpawnResult spawn(const bridge_config::ServerSpec &server_spec);

    // Write bytes followed by '\n' to the child's stdin. Waits while the pipe
    // is full until the child drains it, cancel() is called (Cancelled), or
    // timeout_milliseconds elapse (TimedOut; <= 0 waits forever).
    IoResult write_line(const std::string &bytes, int timeout_milliseconds = 0);

    // Block until one '\n'-terminated line arrives on the child's stdout
    // (without the terminator), the stream ends, cancel() is called, or
    // timeout_milliseconds elapse (<= 0 waits forever).
    LineResult read_line(int timeout_milliseconds);

    // Wake a blocked read_line() or write_line(); every later read or write
    // returns Cancelled. Safe to call from another thread while either is blocked.
    void cancel();

    // SIGTERM, bounded wait, then SIGKILL. Releases all descriptors. Idempotent.
    void terminate(int grace_milliseconds = kDefaultTerminateGraceMilliseconds);

    bool is_running();
    int process_id() const { return process_id_; }
    int exit_status() const { return exit_status_; }

    std::vector<std::string> recent_stderr_lines() const;

private:
    void drain_stderr();

    std::string server_name_;
    int process_id_ = -1;
    int exit_status_ = -1;
    bool reaped_ = false;

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};

    std::string read_buffer_;

    std::thread stderr_thread_;
    mutable std::mutex stderr_mutex_;
    std::deque<std::string> recent_stderr_;
};

} // namespace process_supervisor

#endif // MCPBRIDGE_PROCESS_SUPERVISOR_HPP
