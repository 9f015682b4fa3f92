// src/command_executor.cpp
#include "command_executor.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <syslog.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include "utils.h"

namespace TvBridge {

using std::chrono::steady_clock;
using std::chrono::milliseconds;

std::string format_duration(milliseconds d) {
    if (d.count() % 1000 == 0) {
        return std::to_string(d.count() / 1000) + "s";
    }
    return std::to_string(d.count()) + "ms";
}

namespace {

/**
 * Read everything currently available. Returns false once the write end
 * has been closed (EOF) or the descriptor failed.
 */
bool drain_fd(int fd, Bytes& sink) {
    uint8_t buffer[8192];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.insert(sink.end(), buffer, buffer + n);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        syslog(LOG_WARNING, "Read from bridge pipe failed: %s", strerror(errno));
        return false;
    }
}

pid_t wait_blocking(pid_t pid, int* status) {
    pid_t r;
    do {
        r = waitpid(pid, status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

void kill_process_group(pid_t pid) {
    if (kill(-pid, SIGKILL) < 0) {
        // setpgid may have lost the race with exec; fall back to the child alone
        if (kill(pid, SIGKILL) < 0 && errno != ESRCH) {
            syslog(LOG_ERR, "Failed to kill bridge process %d: %s", pid, strerror(errno));
        }
    }
}

void append_preview(std::string& log, const char* label, const std::string& text, int max_lines) {
    auto lines = split_lines(trim(text));
    if (lines.empty()) return;

    log += "\n  ";
    log += label;
    log += " (" + std::to_string(text.size()) + " chars):";
    int shown = 0;
    for (const auto& line : lines) {
        if (shown >= max_lines) break;
        log += "\n    " + line;
        ++shown;
    }
    if (lines.size() > static_cast<size_t>(shown)) {
        log += "\n    ... (" + std::to_string(lines.size() - shown) + " more lines)";
    }
}

} // namespace

CommandResult CommandExecutor::run(const std::vector<std::string>& args,
                                   milliseconds timeout,
                                   OutputMode mode,
                                   const CancelToken* cancel) const {
    if (args.empty()) {
        throw std::invalid_argument("bridge command requires at least one argument");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("bridge command timeout must be positive");
    }

    const auto started = steady_clock::now();
    CommandResult result(mode);

    auto finish = [&]() -> CommandResult {
        result.elapsed = std::chrono::duration_cast<milliseconds>(steady_clock::now() - started);
        log_invocation(args, timeout, result);
        return result;
    };

    auto resolved = resolver_.resolve();
    if (!resolved.ok()) {
        result.error_kind = ErrorKind::RESOLUTION;
        result.error = "bridge unavailable: " + resolved.error().reason;
        return finish();
    }
    const std::string binary = resolved.location().binary.string();

    // Everything the child touches is prepared before fork()
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(binary);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& a : argv_storage) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto spawn_failed = [&](const std::string& why) -> CommandResult {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        result.error_kind = ErrorKind::SPAWN;
        result.error = why;
        return finish();
    };

    if (pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(exec_pipe, O_CLOEXEC) < 0) {
        return spawn_failed(std::string("pipe failed: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        return spawn_failed(std::string("fork failed: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child: own process group so a timeout kills helpers as well
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execv(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    safe_close(out_pipe[1]);
    out_pipe[1] = -1;
    safe_close(err_pipe[1]);
    err_pipe[1] = -1;
    safe_close(exec_pipe[1]);
    exec_pipe[1] = -1;

    // EOF means exec succeeded (CLOEXEC); an int means it failed
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_pipe(exec_pipe);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_blocking(pid, nullptr);
        return spawn_failed("failed to execute " + binary + ": " + strerror(exec_errno));
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    Bytes out_bytes;
    Bytes err_bytes;
    const auto deadline = started + timeout;
    bool out_open = true;
    bool err_open = true;
    bool timed_out = false;
    bool cancelled = false;
    bool supervise_failed = false;
    bool exited = false;
    int status = 0;

    auto slice_until_deadline = [&]() -> int {
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
        auto wait = std::min(remaining, POLL_SLICE);
        return static_cast<int>(std::max<milliseconds::rep>(wait.count(), 1));
    };

    while (out_open || err_open) {
        if (cancel && cancel->is_cancelled()) {
            cancelled = true;
            break;
        }
        if (steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }

        struct pollfd fds[2];
        int nfds = 0;
        int out_idx = -1;
        int err_idx = -1;
        if (out_open) {
            out_idx = nfds;
            fds[nfds++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_open) {
            err_idx = nfds;
            fds[nfds++] = {err_pipe[0], POLLIN, 0};
        }

        int rc = poll(fds, nfds, slice_until_deadline());
        if (rc < 0) {
            if (errno == EINTR) continue;
            syslog(LOG_ERR, "poll on bridge pipes failed: %s", strerror(errno));
            supervise_failed = true;
            break;
        }
        if (rc == 0) continue;

        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            out_open = drain_fd(out_pipe[0], out_bytes);
        }
        if (err_idx >= 0 && fds[err_idx].revents != 0) {
            err_open = drain_fd(err_pipe[0], err_bytes);
        }
    }

    // Streams closed: the child may still be exiting
    while (!timed_out && !cancelled && !supervise_failed) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            syslog(LOG_ERR, "waitpid on bridge process %d failed: %s", pid, strerror(errno));
            supervise_failed = true;
            break;
        }
        if (cancel && cancel->is_cancelled()) {
            cancelled = true;
            break;
        }
        if (steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }

    if (!exited) {
        kill_process_group(pid);
        wait_blocking(pid, nullptr);
    }

    close_pipe(out_pipe);
    close_pipe(err_pipe);

    if (mode == OutputMode::BINARY) {
        result.std_out = std::move(out_bytes);
        result.std_err = std::move(err_bytes);
    } else {
        result.std_out = decode_utf8_lossy(out_bytes);
        result.std_err = decode_utf8_lossy(err_bytes);
    }

    if (timed_out) {
        result.error_kind = ErrorKind::TIMEOUT;
        result.error = "timeout: " + format_duration(timeout);
        return finish();
    }
    if (cancelled) {
        result.error_kind = ErrorKind::CANCELLED;
        result.error = "cancelled";
        return finish();
    }
    if (supervise_failed) {
        result.error_kind = ErrorKind::SPAWN;
        result.error = "lost track of bridge process";
        return finish();
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.error = "terminated by signal " + std::to_string(WTERMSIG(status));
    }

    result.success = result.exit_code && *result.exit_code == 0;
    if (!result.success) {
        result.error_kind = ErrorKind::NON_ZERO_EXIT;
    }
    return finish();
}

bool CommandExecutor::check_available() const {
    auto result = run({"version"}, options_.version_timeout);
    if (!result.success) {
        syslog(LOG_WARNING, "Bridge not available: %s", result.describe().c_str());
    }
    return result.success;
}

void CommandExecutor::log_invocation(const std::vector<std::string>& args,
                                     milliseconds timeout,
                                     const CommandResult& result) const {
    std::string log = "Bridge command: " + join_args(args) +
                      " (timeout " + format_duration(timeout) + ")";

    if (result.exit_code) {
        log += " exit=" + std::to_string(*result.exit_code);
    }
    log += " elapsed=" + std::to_string(result.elapsed.count()) + "ms";

    if (result.mode() == OutputMode::BINARY) {
        if (!result.bytes_out().empty()) {
            log += "\n  stdout (binary, " + std::to_string(result.bytes_out().size()) + " bytes)";
        }
        if (!result.bytes_err().empty()) {
            log += "\n  stderr (binary, " + std::to_string(result.bytes_err().size()) + " bytes)";
        }
    } else {
        append_preview(log, "stdout", result.text_out(), options_.log_stdout_lines);
        append_preview(log, "stderr", result.text_err(), options_.log_stderr_lines);
    }

    syslog(LOG_DEBUG, "%s", log.c_str());

    if (result.error) {
        syslog(result.tool_unavailable() ? LOG_ERR : LOG_WARNING,
               "Bridge command '%s' failed: %s", join_args(args).c_str(), result.error->c_str());
    }
}

} // namespace TvBridge
