#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"

namespace transpiler::tools {

using core::errors::ErrorCategory;
using core::errors::TranspileError;
using protocol::RawOutcome;
using Clock = std::chrono::steady_clock;

namespace {

constexpr int kPollIntervalMs = 50;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

// Reads whatever is available. Bytes past `limit` are consumed and dropped so
// a chatty child can never block on a full pipe or grow our memory.
void drain_pipe(int& fd, std::string& out, const std::size_t limit, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto count = static_cast<std::size_t>(n);
            if (out.size() < limit) {
                const std::size_t room = limit - out.size();
                out.append(buffer, count < room ? count : room);
                if (count > room) {
                    truncated = true;
                }
            } else {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void signal_group(const pid_t pid, const int sig) {
    if (kill(-pid, sig) != 0) {
        static_cast<void>(kill(pid, sig));
    }
}

std::int64_t millis_since(const Clock::time_point from, const Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

}  // namespace

core::errors::Result<RawOutcome> run_process(const ProcessSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return TranspileError{ErrorCategory::Internal, "Empty command line.",
                              "empty_argv"};
    }

    RawOutcome capture;
    if (spec.cancel_token && spec.cancel_token->load()) {
        capture.cancelled = true;
        return capture;
    }

    // Everything the child needs is prepared before fork: after fork only
    // async-signal-safe calls are allowed in a threaded process.
    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    const std::string cwd = spec.working_directory.string();
    const std::string prefix = spec.log_label.empty() ? "" : "[" + spec.log_label + "] ";

    // O_CLOEXEC keeps these descriptors out of children spawned concurrently by
    // other invocations; otherwise their pipes would never see EOF.
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return TranspileError{ErrorCategory::Internal,
                              "Failed to create process pipes.",
                              "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return TranspileError{ErrorCategory::Internal,
                              "Failed to create process pipes.",
                              "pipe_creation_failed"};
    }
    int dev_null = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (dev_null < 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        return TranspileError{ErrorCategory::Internal, "Failed to open /dev/null.",
                              "devnull_open_failed"};
    }

    const auto started = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(dev_null);
        return TranspileError{ErrorCategory::Internal, "Failed to fork process.",
                              "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(dup2(dev_null, STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        execvp(cargv[0], cargv.data());
        static const char kExecFailed[] = "exec failed\n";
        static_cast<void>(write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1));
        _exit(127);
    }

    // Mirror the child's setpgid so the group exists before we ever signal it.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(dev_null);
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    bool child_exited = false;
    bool wait_failed = false;
    bool killed = false;
    int status = 0;
    std::optional<Clock::time_point> term_sent_at;
    std::optional<Clock::time_point> exited_at;

    while (true) {
        const auto now = Clock::now();

        if (!child_exited) {
            if (!term_sent_at && spec.cancel_token && spec.cancel_token->load()) {
                capture.cancelled = true;
                signal_group(pid, SIGTERM);
                term_sent_at = now;
            }
            if (!term_sent_at && spec.timeout_ms > 0 &&
                millis_since(started, now) > static_cast<std::int64_t>(spec.timeout_ms)) {
                capture.timed_out = true;
                signal_group(pid, SIGTERM);
                term_sent_at = now;
            }
            if (term_sent_at && !killed &&
                millis_since(*term_sent_at, now) >= static_cast<std::int64_t>(spec.grace_ms)) {
                LOG_WARN(prefix + "ProcessRunner: pid " + std::to_string(pid) +
                         " ignored SIGTERM, sending SIGKILL");
                signal_group(pid, SIGKILL);
                killed = true;
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) {
            fds[nfds].fd = out_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err_fd >= 0) {
            fds[nfds].fd = err_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, kPollIntervalMs));
        } else {
            static_cast<void>(poll(nullptr, 0, kPollIntervalMs));
        }

        drain_pipe(out_fd, capture.stdout_text, spec.max_stdout_bytes,
                   capture.stdout_truncated);
        drain_pipe(err_fd, capture.stderr_text, spec.max_stderr_bytes,
                   capture.stderr_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                exited_at = Clock::now();
            } else if (waited < 0 && errno != EINTR) {
                LOG_ERROR(prefix + "ProcessRunner: waitpid failed for pid " + std::to_string(pid));
                child_exited = true;
                wait_failed = true;
                exited_at = Clock::now();
            }
        }

        if (child_exited && out_fd < 0 && err_fd < 0) {
            break;
        }

        // A descendant that outlived the child still holds the pipes open.
        if (child_exited && exited_at &&
            millis_since(*exited_at, Clock::now()) >= static_cast<std::int64_t>(spec.grace_ms)) {
            LOG_WARN(prefix + "ProcessRunner: descendants of pid " + std::to_string(pid) +
                     " kept output open, killing group");
            signal_group(pid, SIGKILL);
            drain_pipe(out_fd, capture.stdout_text, spec.max_stdout_bytes,
                       capture.stdout_truncated);
            drain_pipe(err_fd, capture.stderr_text, spec.max_stderr_bytes,
                       capture.stderr_truncated);
            close_fd(out_fd);
            close_fd(err_fd);
            break;
        }
    }

    if (wait_failed) {
        capture.exit_code = -1;
    } else if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms =
        std::chrono::duration<double, std::milli>(Clock::now() - started).count();
    LOG_DEBUG(prefix + "ProcessRunner: pid " + std::to_string(pid) + " finished exit=" +
              std::to_string(capture.exit_code) + " in " +
              std::to_string(static_cast<long long>(capture.duration_ms)) + "ms");
    return capture;
}

}  // namespace transpiler::tools
