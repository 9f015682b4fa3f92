// include/command_result.h
// Outcome of one bridge invocation

#ifndef COMMAND_RESULT_H
#define COMMAND_RESULT_H

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include "utils.h"

namespace TvBridge {

enum class OutputMode {
    TEXT,
    BINARY
};

enum class ErrorKind {
    NONE,
    RESOLUTION,     // no bridge binary anywhere in the candidate chain
    SPAWN,          // binary resolved but could not be executed
    TIMEOUT,
    CANCELLED,
    NON_ZERO_EXIT
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::RESOLUTION: return "resolution";
        case ErrorKind::SPAWN: return "spawn";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CANCELLED: return "cancelled";
        case ErrorKind::NON_ZERO_EXIT: return "non_zero_exit";
    }
    return "unknown";
}

/**
 * Captured stream contents. Holds a std::string in TEXT mode and raw
 * Bytes in BINARY mode, never both.
 */
using Output = std::variant<std::string, Bytes>;

struct CommandResult {
    bool success = false;
    std::optional<int> exit_code;
    Output std_out;
    Output std_err;
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::NONE;
    std::chrono::milliseconds elapsed{0};

    explicit CommandResult(OutputMode mode = OutputMode::TEXT) {
        if (mode == OutputMode::BINARY) {
            std_out = Bytes{};
            std_err = Bytes{};
        }
    }

    OutputMode mode() const {
        return std::holds_alternative<Bytes>(std_out) ? OutputMode::BINARY : OutputMode::TEXT;
    }

    // Typed accessors throw std::bad_variant_access on a mode mismatch
    const std::string& text_out() const { return std::get<std::string>(std_out); }
    const std::string& text_err() const { return std::get<std::string>(std_err); }
    const Bytes& bytes_out() const { return std::get<Bytes>(std_out); }
    const Bytes& bytes_err() const { return std::get<Bytes>(std_err); }

    /**
     * True when the failure means the bridge tool itself is unusable
     * (as opposed to a command that ran and failed).
     */
    bool tool_unavailable() const {
        return error_kind == ErrorKind::RESOLUTION || error_kind == ErrorKind::SPAWN;
    }

    std::string describe() const {
        if (error) return *error;
        if (success) return "ok";
        if (exit_code) {
            std::string msg = "exit code " + std::to_string(*exit_code);
            if (mode() == OutputMode::TEXT) {
                std::string detail = trim(text_err());
                if (detail.empty()) detail = trim(text_out());
                if (!detail.empty()) msg += ": " + detail;
            }
            return msg;
        }
        return "failed";
    }
};

} // namespace TvBridge

#endif // COMMAND_RESULT_H
