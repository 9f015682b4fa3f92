// include/utils.h
#ifndef TVBRIDGE_UTILS_H
#define TVBRIDGE_UTILS_H

#include <unistd.h>
#include <fcntl.h>
#include <syslog.h>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace TvBridge {

using Bytes = std::vector<uint8_t>;

/**
 * Safe wrapper for close() that logs on error.
 * Returns true if successfully closed, false on failure.
 */
inline bool safe_close(int fd) {
    if (fd < 0) return false;
    int result = close(fd);
    if (result == -1) {
        syslog(LOG_WARNING, "Close failed (fd=%d): %s", fd, strerror(errno));
        return false;
    }
    return true;
}

/**
 * Closes both ends of a pipe pair and marks them invalid.
 */
inline void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            safe_close(fds[i]);
            fds[i] = -1;
        }
    }
}

inline bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        syslog(LOG_WARNING, "fcntl(O_NONBLOCK) failed (fd=%d): %s", fd, strerror(errno));
        return false;
    }
    return true;
}

/**
 * Decode bytes as UTF-8, replacing every invalid or truncated sequence with
 * U+FFFD. Never fails.
 */
inline std::string decode_utf8_lossy(const Bytes& data) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(data.size());

    size_t i = 0;
    const size_t n = data.size();
    while (i < n) {
        uint8_t c = data[i];
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { len = 3; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { len = 4; min_cp = 0x10000; }

        if (len == 0 || i + len > n) {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        uint32_t cp = c & (0xFF >> (len + 1));
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range code points
        if (!valid || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        out.append(reinterpret_cast<const char*>(&data[i]), len);
        i += len;
    }
    return out;
}

inline std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

/**
 * Whole-string base-10 integer; surrounding whitespace allowed, nothing else.
 */
inline std::optional<int> parse_int(const std::string& text) {
    std::string digits = trim(text);
    if (digits.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long value = strtol(digits.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

inline std::optional<bool> parse_bool(const std::string& text) {
    std::string word = trim(text);
    if (word == "true" || word == "1" || word == "yes" || word == "on") return true;
    if (word == "false" || word == "0" || word == "no" || word == "off") return false;
    return std::nullopt;
}

/**
 * Split on '\n', dropping a trailing '\r' from each line.
 */
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        start = end + 1;
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

inline std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

} // namespace TvBridge

#endif // TVBRIDGE_UTILS_H
