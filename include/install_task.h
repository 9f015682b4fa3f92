// include/install_task.h
// Batch package installation onto one device

#ifndef INSTALL_TASK_H
#define INSTALL_TASK_H

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge_protocol.h"
#include "command_executor.h"
#include "worker_task.h"

namespace TvBridge {

struct InstallItem {
    std::string path;
    bool success = false;
    std::string sha256;
    std::string message;
    std::chrono::milliseconds elapsed{0};
};

struct InstallReport {
    std::string serial;
    size_t requested = 0;
    std::vector<InstallItem> items;
    bool cancelled = false;

    size_t succeeded() const;
    bool all_succeeded() const { return !cancelled && succeeded() == requested; }

    // "2/3 installed" (plus ", cancelled")
    std::string summary() const;

    nlohmann::json to_json() const;
};

// (files finished, files total, status line)
using InstallProgress = std::function<void(size_t, size_t, const std::string&)>;

class InstallTask final : public WorkerTask<InstallReport> {
private:
    const CommandExecutor& executor_;
    std::string serial_;
    std::vector<std::string> paths_;
    Protocol::InstallOptions options_;
    std::chrono::milliseconds timeout_;
    InstallProgress progress_;

    InstallItem install_one(const std::string& path, const CancelToken& cancel, bool& cancelled);
    void report_progress(size_t done, const std::string& message) const;

protected:
    InstallReport execute(const CancelToken& cancel) override;

public:
    InstallTask(const CommandExecutor& executor, std::string serial,
                std::vector<std::string> paths, Protocol::InstallOptions options,
                std::chrono::milliseconds timeout, InstallProgress progress = nullptr)
        : WorkerTask("install"), executor_(executor), serial_(std::move(serial)),
          paths_(std::move(paths)), options_(options), timeout_(timeout),
          progress_(std::move(progress)) {}

    ~InstallTask() override {
        stop();
    }
};

} // namespace TvBridge

#endif // INSTALL_TASK_H
