// src/screenshot_task.cpp
#include "screenshot_task.h"

#include <syslog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include "bridge_protocol.h"

namespace TvBridge {

ScreenshotResult ScreenshotTask::execute(const CancelToken& cancel) {
    ScreenshotResult shot;

    auto result = executor_.run(Protocol::screencap(serial_), timeout_,
                                OutputMode::BINARY, &cancel);
    if (!result.success) {
        shot.error = result.describe();
        syslog(LOG_WARNING, "Screen capture on %s failed: %s", serial_.c_str(), shot.error.c_str());
        return shot;
    }

    const Bytes& raw = result.bytes_out();
    auto start = Protocol::find_png_start(raw);
    if (!start) {
        shot.error = "no PNG signature in " + std::to_string(raw.size()) + " bytes of output";
        syslog(LOG_WARNING, "Screen capture on %s: %s", serial_.c_str(), shot.error.c_str());
        return shot;
    }

    shot.skipped_bytes = *start;
    shot.png.assign(raw.begin() + static_cast<std::ptrdiff_t>(*start), raw.end());
    if (shot.skipped_bytes > 0) {
        syslog(LOG_DEBUG, "Skipped %zu bytes before PNG signature", shot.skipped_bytes);
    }

    if (!save_path_.empty()) {
        std::string error;
        if (!write_file(save_path_, shot.png, error)) {
            shot.error = error;
            syslog(LOG_ERR, "Cannot save screenshot: %s", error.c_str());
            return shot;
        }
        shot.saved_path = save_path_;
        syslog(LOG_INFO, "Screenshot saved to %s (%zu bytes)", save_path_.c_str(), shot.png.size());
    }

    shot.success = true;
    return shot;
}

bool write_file(const std::string& path, const Bytes& data, std::string& error) {
    namespace fs = std::filesystem;

    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        error = "cannot open " + path + ": " + strerror(errno);
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        error = "write to " + path + " failed";
        return false;
    }
    return true;
}

std::string default_screenshot_path(const std::string& dir, const std::string& serial) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    std::string safe_serial = serial;
    std::replace(safe_serial.begin(), safe_serial.end(), ':', '_');

    std::string name = "screenshot_" + safe_serial + "_" + stamp + ".png";
    return dir.empty() ? name : (std::filesystem::path(dir) / name).string();
}

} // namespace TvBridge
