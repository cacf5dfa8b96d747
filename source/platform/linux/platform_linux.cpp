#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <cstring>
#include <mutex>

extern char **environ;

namespace platform {

bool create_pipe(int (&descriptors)[2], std::string &error_message) {
    if (pipe2(descriptors, O_CLOEXEC) == -1) {
        error_message = "pipe2 failed: " + std::string(strerror(errno));
        descriptors[0] = descriptors[1] = -1;
        return false;
    }
    return true;
}

void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

SpawnResult spawn_process_with_pipes(const std::string &executable,
                                     const std::vector<std::string> &arguments) {
    SpawnResult result;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        close_descriptor(stdin_pipe[0]);
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stdout_pipe[1]);
        close_descriptor(stderr_pipe[0]);
        close_descriptor(stderr_pipe[1]);
    };

    if (!create_pipe(stdin_pipe, result.error_message) ||
        !create_pipe(stdout_pipe, result.error_message) ||
        !create_pipe(stderr_pipe, result.error_message)) {
        close_all();
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }

    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    // dup2 clears FD_CLOEXEC on the target, so only 0/1/2 survive the exec.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable.c_str(),
                                    &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.error_message = "posix_spawnp failed for '" + executable + "': " +
                               std::string(strerror(spawn_status));
        close_all();
        return result;
    }

    // Parent keeps the write end of stdin and the read ends of stdout/stderr.
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);
    close_descriptor(stderr_pipe[1]);

    // The child's read end is a separate file description and stays blocking.
    if (!set_non_blocking(stdin_pipe[1], result.error_message)) {
        close_all();
        kill(child_pid, SIGKILL);
        waitpid(child_pid, nullptr, 0);
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = stdin_pipe[1];
    result.stdout_fd = stdout_pipe[0];
    result.stderr_fd = stderr_pipe[0];
    return result;
}

bool set_non_blocking(int descriptor, std::string &error_message) {
    int flags = fcntl(descriptor, F_GETFL);
    if (flags == -1 || fcntl(descriptor, F_SETFL, flags | O_NONBLOCK) == -1) {
        error_message = "fcntl(O_NONBLOCK) failed: " + std::string(strerror(errno));
        return false;
    }
    return true;
}

static int remaining_poll_timeout(std::chrono::steady_clock::time_point deadline, int timeout_milliseconds) {
    if (timeout_milliseconds < 0) {
        return -1;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return remaining > 0 ? static_cast<int>(remaining) : 0;
}

// Poll descriptor for events alongside the wake descriptor.
static WaitStatus wait_for_events(int descriptor, short events, int wake_descriptor,
                                  std::chrono::steady_clock::time_point deadline, int timeout_milliseconds,
                                  std::string &error_message) {
    struct pollfd poll_descriptors[2];
    poll_descriptors[0].fd = descriptor;
    poll_descriptors[0].events = events;
    poll_descriptors[1].fd = wake_descriptor;
    poll_descriptors[1].events = POLLIN;
    nfds_t descriptor_count = (wake_descriptor >= 0) ? 2 : 1;

    while (true) {
        poll_descriptors[0].revents = 0;
        poll_descriptors[1].revents = 0;

        int ready = poll(poll_descriptors, descriptor_count, remaining_poll_timeout(deadline, timeout_milliseconds));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_message = "poll failed: " + std::string(strerror(errno));
            return WaitStatus::Failed;
        }
        if (ready == 0) {
            return WaitStatus::TimedOut;
        }

        if (descriptor_count == 2 && (poll_descriptors[1].revents & (POLLIN | POLLHUP)) != 0) {
            return WaitStatus::WakeSignalled;
        }
        // POLLHUP/POLLERR: the following read() or write() reports what happened.
        if ((poll_descriptors[0].revents & (events | POLLHUP | POLLERR)) != 0) {
            return WaitStatus::Ready;
        }
        if ((poll_descriptors[0].revents & POLLNVAL) != 0) {
            error_message = "poll reported an invalid descriptor";
            return WaitStatus::Failed;
        }
    }
}

WriteStatus write_all(int descriptor, const std::string &data, int wake_descriptor,
                      int timeout_milliseconds, std::string &error_message) {
    if (descriptor < 0) {
        error_message = "descriptor is closed";
        return WriteStatus::Failed;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(descriptor, data.data() + offset, data.size() - offset);
        if (written >= 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            error_message = "write failed: " + std::string(strerror(errno));
            return WriteStatus::Failed;
        }

        // Pipe is full: the reader has to drain it first.
        WaitStatus wait_status =
            wait_for_events(descriptor, POLLOUT, wake_descriptor, deadline, timeout_milliseconds, error_message);
        if (wait_status == WaitStatus::WakeSignalled) {
            error_message = "write cancelled after " + std::to_string(offset) + " of " +
                            std::to_string(data.size()) + " bytes";
            return WriteStatus::WakeSignalled;
        }
        if (wait_status == WaitStatus::TimedOut) {
            error_message = "write timed out after " + std::to_string(offset) + " of " +
                            std::to_string(data.size()) + " bytes";
            return WriteStatus::TimedOut;
        }
        if (wait_status == WaitStatus::Failed) {
            return WriteStatus::Failed;
        }
    }
    return WriteStatus::Written;
}

WaitStatus wait_readable(int descriptor, int wake_descriptor, int timeout_milliseconds,
                         std::string &error_message) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    return wait_for_events(descriptor, POLLIN, wake_descriptor, deadline, timeout_milliseconds, error_message);
}

void ignore_broken_pipe_signal() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

bool signal_process(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), signal_number) == 0;
}

bool kill_process(int process_id) {
    return signal_process(process_id, SIGTERM);
}

bool try_reap_process(int process_id, int &exit_status) {
    if (process_id <= 0) {
        return true;
    }
    int status = 0;
    pid_t reaped = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (reaped == 0) {
        return false;
    }
    if (reaped < 0) {
        // ECHILD: someone else reaped it, nothing left to wait for.
        return errno == ECHILD;
    }
    exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return true;
}

bool wait_for_exit(int process_id, int timeout_milliseconds, int &exit_status) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        if (try_reap_process(process_id, exit_status)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void force_kill_and_reap(int process_id, int &exit_status) {
    if (process_id <= 0) {
        return;
    }
    kill(static_cast<pid_t>(process_id), SIGKILL);
    int status = 0;
    pid_t reaped;
    do {
        reaped = waitpid(static_cast<pid_t>(process_id), &status, 0);
    } while (reaped < 0 && errno == EINTR);
    if (reaped > 0) {
        exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    }
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

} // namespace platform
