// include/command_executor.h
// Runs one bridge invocation to completion, timeout or cancellation

#ifndef COMMAND_EXECUTOR_H
#define COMMAND_EXECUTOR_H

#include <chrono>
#include <string>
#include <vector>
#include "binary_resolver.h"
#include "cancel_token.h"
#include "command_result.h"

namespace TvBridge {

/**
 * Spawns the resolved bridge binary and supervises it.
 *
 * Thread-safe: every run() owns its own child process and pipes. Failures
 * (resolution, spawn, timeout, cancellation, non-zero exit) are reported in
 * the returned CommandResult; only precondition violations throw.
 */
class CommandExecutor {
public:
    // How often a running child is checked for cancellation
    static constexpr std::chrono::milliseconds POLL_SLICE{50};

    struct Options {
        int log_stdout_lines = 10;
        int log_stderr_lines = 5;
        std::chrono::milliseconds version_timeout{10000};
    };

private:
    BinaryResolver& resolver_;
    Options options_;

    void log_invocation(const std::vector<std::string>& args,
                        std::chrono::milliseconds timeout,
                        const CommandResult& result) const;

public:
    explicit CommandExecutor(BinaryResolver& resolver)
        : resolver_(resolver) {}

    CommandExecutor(BinaryResolver& resolver, Options options)
        : resolver_(resolver), options_(options) {}

    /**
     * Run `<bridge> args...`.
     * @throws std::invalid_argument if args is empty or timeout is not positive
     */
    CommandResult run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout,
                      OutputMode mode = OutputMode::TEXT,
                      const CancelToken* cancel = nullptr) const;

    CommandResult run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout,
                      bool binary_mode) const {
        return run(args, timeout, binary_mode ? OutputMode::BINARY : OutputMode::TEXT);
    }

    /**
     * `version` succeeds
     */
    bool check_available() const;

    BinaryResolver& resolver() const { return resolver_; }
};

/**
 * "10s" for whole seconds, "1500ms" otherwise
 */
std::string format_duration(std::chrono::milliseconds d);

} // namespace TvBridge

#endif // COMMAND_EXECUTOR_H
