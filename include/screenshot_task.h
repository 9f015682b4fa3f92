// include/screenshot_task.h
// Screen capture as PNG bytes

#ifndef SCREENSHOT_TASK_H
#define SCREENSHOT_TASK_H

#include <chrono>
#include <string>
#include "command_executor.h"
#include "utils.h"
#include "worker_task.h"

namespace TvBridge {

struct ScreenshotResult {
    bool success = false;
    Bytes png;
    size_t skipped_bytes = 0;   // noise before the PNG signature
    std::string error;
    std::string saved_path;
};

class ScreenshotTask final : public WorkerTask<ScreenshotResult> {
private:
    const CommandExecutor& executor_;
    std::string serial_;
    std::chrono::milliseconds timeout_;
    std::string save_path_;

protected:
    ScreenshotResult execute(const CancelToken& cancel) override;

public:
    // Empty save_path keeps the image in memory only
    ScreenshotTask(const CommandExecutor& executor, std::string serial,
                   std::chrono::milliseconds timeout, std::string save_path = "")
        : WorkerTask("screenshot"), executor_(executor), serial_(std::move(serial)),
          timeout_(timeout), save_path_(std::move(save_path)) {}

    ~ScreenshotTask() override {
        stop();
    }
};

/**
 * Write bytes to path, creating parent directories
 */
bool write_file(const std::string& path, const Bytes& data, std::string& error);

/**
 * <dir>/screenshot_<serial>_<YYYYmmdd_HHMMSS>.png, with ':' in the serial replaced
 */
std::string default_screenshot_path(const std::string& dir, const std::string& serial);

} // namespace TvBridge

#endif // SCREENSHOT_TASK_H
