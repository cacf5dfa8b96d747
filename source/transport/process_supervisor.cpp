#include "transport/process_supervisor.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace process_supervisor {

static constexpr size_t kReadChunkSize = 4096;

const char *to_string(IoStatus status) {
    switch (status) {
    case IoStatus::Ok:
        return "ok";
    case IoStatus::EndOfStream:
        return "end of stream";
    case IoStatus::ReadFailed:
        return "read failed";
    case IoStatus::WriteFailed:
        return "write failed";
    case IoStatus::TimedOut:
        return "timed out";
    case IoStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

Supervisor::~Supervisor() {
    terminate();
}

SpawnResult Supervisor::spawn(const bridge_config::ServerSpec &server_spec) {
    SpawnResult result;

    if (process_id_ > 0 || stdout_fd_ >= 0) {
        result.error_message = "a server process is already running (pid=" + std::to_string(process_id_) + ")";
        return result;
    }
    if (server_spec.command.empty()) {
        result.error_message = "no command specified";
        return result;
    }

    platform::ignore_broken_pipe_signal();

    if (!platform::create_pipe(wake_pipe_, result.error_message)) {
        return result;
    }

    platform::SpawnResult spawn_result =
        platform::spawn_process_with_pipes(server_spec.command, server_spec.arguments);
    if (!spawn_result.success) {
        platform::close_descriptor(wake_pipe_[0]);
        platform::close_descriptor(wake_pipe_[1]);
        result.error_message = spawn_result.error_message;
        return result;
    }

    server_name_ = server_spec.name.empty() ? server_spec.command : server_spec.name;
    process_id_ = spawn_result.process_id;
    exit_status_ = -1;
    reaped_ = false;
    stdin_fd_ = spawn_result.stdin_fd;
    stdout_fd_ = spawn_result.stdout_fd;
    stderr_fd_ = spawn_result.stderr_fd;
    read_buffer_.clear();
    {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        recent_stderr_.clear();
    }

    stderr_thread_ = std::thread(&Supervisor::drain_stderr, this);

    debug_log::log("Spawned '" + server_name_ + "' (pid=" + std::to_string(process_id_) + ")");
    result.success = true;
    result.process_id = process_id_;
    return result;
}

IoResult Supervisor::write_line(const std::string &bytes, int timeout_milliseconds) {
    IoResult result;
    if (stdin_fd_ < 0) {
        result.status = IoStatus::WriteFailed;
        result.error_message = "server process is not running";
        return result;
    }

    std::string wake_error;
    if (platform::wait_readable(wake_pipe_[0], -1, 0, wake_error) == platform::WaitStatus::Ready) {
        result.status = IoStatus::Cancelled;
        result.error_message = "write cancelled";
        return result;
    }

    platform::WriteStatus write_status =
        platform::write_all(stdin_fd_, bytes + "\n", wake_pipe_[0],
                            timeout_milliseconds > 0 ? timeout_milliseconds : -1, result.error_message);
    switch (write_status) {
    case platform::WriteStatus::Written:
        debug_log::log("--> " + bytes);
        break;
    case platform::WriteStatus::WakeSignalled:
        result.status = IoStatus::Cancelled;
        break;
    case platform::WriteStatus::TimedOut:
        result.status = IoStatus::TimedOut;
        break;
    case platform::WriteStatus::Failed:
        result.status = IoStatus::WriteFailed;
        break;
    }
    return result;
}

LineResult Supervisor::read_line(int timeout_milliseconds) {
    LineResult result;
    if (stdout_fd_ < 0) {
        result.status = IoStatus::ReadFailed;
        result.error_message = "server process is not running";
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        size_t newline_position = read_buffer_.find('\n');
        if (newline_position != std::string::npos) {
            result.line = read_buffer_.substr(0, newline_position);
            read_buffer_.erase(0, newline_position + 1);
            if (!result.line.empty() && result.line.back() == '\r') {
                result.line.pop_back();
            }
            debug_log::log("<-- " + result.line);
            return result;
        }

        int wait_milliseconds = -1;
        if (timeout_milliseconds > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.status = IoStatus::TimedOut;
                result.error_message = "no response within " + std::to_string(timeout_milliseconds) + " ms";
                return result;
            }
            wait_milliseconds = static_cast<int>(remaining);
        }

        platform::WaitStatus wait_status =
            platform::wait_readable(stdout_fd_, wake_pipe_[0], wait_milliseconds, result.error_message);
        if (wait_status == platform::WaitStatus::WakeSignalled) {
            result.status = IoStatus::Cancelled;
            result.error_message = "read cancelled";
            return result;
        }
        if (wait_status == platform::WaitStatus::TimedOut) {
            continue; // Deadline check above reports it.
        }
        if (wait_status == platform::WaitStatus::Failed) {
            result.status = IoStatus::ReadFailed;
            return result;
        }

        char chunk[kReadChunkSize];
        ssize_t bytes_read = read(stdout_fd_, chunk, sizeof(chunk));
        if (bytes_read > 0) {
            read_buffer_.append(chunk, static_cast<size_t>(bytes_read));
            continue;
        }
        if (bytes_read == 0) {
            if (!read_buffer_.empty()) {
                debug_log::log("Discarding unterminated output at end of stream: " + read_buffer_);
                read_buffer_.clear();
            }
            result.status = IoStatus::EndOfStream;
            result.error_message = "server closed its stdout";
            return result;
        }
        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }
        result.status = IoStatus::ReadFailed;
        result.error_message = "read failed: " + std::string(strerror(errno));
        return result;
    }
}

void Supervisor::cancel() {
    if (wake_pipe_[1] < 0) {
        return;
    }
    const char wake_byte = 1;
    ssize_t written = write(wake_pipe_[1], &wake_byte, 1);
    if (written != 1 && errno != EAGAIN) {
        debug_log::error("Failed to signal wake pipe: " + std::string(strerror(errno)));
    }
}

void Supervisor::terminate(int grace_milliseconds) {
    if (process_id_ > 0 && !reaped_) {
        // Closing stdin first lets well-behaved servers exit on EOF.
        platform::close_descriptor(stdin_fd_);

        if (!platform::try_reap_process(process_id_, exit_status_)) {
            platform::kill_process(process_id_);
            if (!platform::wait_for_exit(process_id_, grace_milliseconds, exit_status_)) {
                debug_log::log("'" + server_name_ + "' ignored SIGTERM, sending SIGKILL (pid=" +
                               std::to_string(process_id_) + ")");
                platform::force_kill_and_reap(process_id_, exit_status_);
            }
        }
        reaped_ = true;
        debug_log::log("'" + server_name_ + "' exited with status " + std::to_string(exit_status_));
    }

    if (stderr_thread_.joinable()) {
        cancel();
        stderr_thread_.join();
    }

    platform::close_descriptor(stdin_fd_);
    platform::close_descriptor(stdout_fd_);
    platform::close_descriptor(stderr_fd_);
    platform::close_descriptor(wake_pipe_[0]);
    platform::close_descriptor(wake_pipe_[1]);
    read_buffer_.clear();
    process_id_ = -1;
}

bool Supervisor::is_running() {
    if (process_id_ <= 0 || reaped_) {
        return false;
    }
    if (platform::try_reap_process(process_id_, exit_status_)) {
        reaped_ = true;
        return false;
    }
    return true;
}

std::vector<std::string> Supervisor::recent_stderr_lines() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return std::vector<std::string>(recent_stderr_.begin(), recent_stderr_.end());
}

void Supervisor::drain_stderr() {
    std::string pending;
    auto record_line = [this](const std::string &line) {
        debug_log::log("[" + server_name_ + "] " + line);
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        recent_stderr_.push_back(line);
        while (recent_stderr_.size() > kRecentStderrLinesMax) {
            recent_stderr_.pop_front();
        }
    };

    while (true) {
        std::string error_message;
        platform::WaitStatus wait_status =
            platform::wait_readable(stderr_fd_, wake_pipe_[0], -1, error_message);
        if (wait_status != platform::WaitStatus::Ready) {
            break;
        }

        char chunk[kReadChunkSize];
        ssize_t bytes_read = read(stderr_fd_, chunk, sizeof(chunk));
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            break;
        }

        pending.append(chunk, static_cast<size_t>(bytes_read));
        size_t newline_position;
        while ((newline_position = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline_position);
            pending.erase(0, newline_position + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            record_line(line);
        }
    }

    if (!pending.empty()) {
        record_line(pending);
    }
}

} // namespace process_supervisor
