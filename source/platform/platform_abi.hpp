#ifndef MCPBRIDGE_PLATFORM_ABI_HPP
#define MCPBRIDGE_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process with its standard streams piped to us.
// The descriptors are the parent's ends: write to stdin_fd, read from the others.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    std::string error_message;
};

// Spawn a child process, searching PATH for the executable when it has no slash.
// All three standard streams of the child are connected to close-on-exec pipes;
// the parent's stdin_fd is non-blocking.
SpawnResult spawn_process_with_pipes(const std::string &executable,
                                     const std::vector<std::string> &arguments);

// Create a close-on-exec pipe. Returns false (with error_message set) on failure.
bool create_pipe(int (&descriptors)[2], std::string &error_message);

// Close a descriptor if valid and reset it to -1.
void close_descriptor(int &descriptor);

// Outcome of waiting on a descriptor.
enum class WaitStatus {
    Ready,
    WakeSignalled,
    TimedOut,
    Failed,
};

// Wait until descriptor is readable, wake_descriptor is readable (if >= 0),
// or timeout_milliseconds elapse (< 0 waits forever).
WaitStatus wait_readable(int descriptor, int wake_descriptor, int timeout_milliseconds,
                         std::string &error_message);

// Outcome of write_all().
enum class WriteStatus {
    Written,
    WakeSignalled,
    TimedOut,
    Failed,
};

// Write the whole buffer to a non-blocking descriptor, waiting for POLLOUT
// between partial writes. Gives up when wake_descriptor (if >= 0) becomes
// readable or timeout_milliseconds elapse (< 0 waits forever).
WriteStatus write_all(int descriptor, const std::string &data, int wake_descriptor,
                      int timeout_milliseconds, std::string &error_message);

// Put a descriptor in O_NONBLOCK mode.
bool set_non_blocking(int descriptor, std::string &error_message);

// Ignore SIGPIPE so writes to a dead child fail with EPIPE instead of killing us.
void ignore_broken_pipe_signal();

// Send a signal to a process. Returns false if the process does not exist.
bool signal_process(int process_id, int signal_number);

// Send SIGTERM to a process.
bool kill_process(int process_id);

// Non-blocking reap. Returns true if the process has exited (and is now reaped).
bool try_reap_process(int process_id, int &exit_status);

// Wait up to timeout_milliseconds for the process to exit. Returns true if reaped.
bool wait_for_exit(int process_id, int timeout_milliseconds, int &exit_status);

// SIGKILL the process and block until it is reaped.
void force_kill_and_reap(int process_id, int &exit_status);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

} // namespace platform

#endif // MCPBRIDGE_PLATFORM_ABI_HPP
