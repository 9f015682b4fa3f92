// src/install_task.cpp
#include "install_task.h"

#include <syslog.h>
#include <algorithm>
#include <exception>
#include <filesystem>
#include "file_digest.h"
#include "package_ops.h"

namespace TvBridge {

namespace fs = std::filesystem;

size_t InstallReport::succeeded() const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [](const InstallItem& i) { return i.success; }));
}

std::string InstallReport::summary() const {
    std::string s = std::to_string(succeeded()) + "/" + std::to_string(requested) + " installed";
    if (cancelled) s += ", cancelled";
    return s;
}

nlohmann::json InstallReport::to_json() const {
    nlohmann::json obj;
    obj["serial"] = serial;
    obj["requested"] = requested;
    obj["succeeded"] = succeeded();
    obj["cancelled"] = cancelled;
    obj["items"] = nlohmann::json::array();
    for (const auto& item : items) {
        obj["items"].push_back({
            {"path", item.path},
            {"success", item.success},
            {"sha256", item.sha256},
            {"message", item.message},
            {"elapsed_ms", item.elapsed.count()}
        });
    }
    return obj;
}

InstallReport InstallTask::execute(const CancelToken& cancel) {
    InstallReport report;
    report.serial = serial_;
    report.requested = paths_.size();

    syslog(LOG_INFO, "Installing %zu packages on %s", paths_.size(), serial_.c_str());

    for (size_t i = 0; i < paths_.size(); ++i) {
        if (cancel.is_cancelled()) {
            report.cancelled = true;
            break;
        }

        const std::string& path = paths_[i];
        report_progress(i, "Installing " + std::to_string(i + 1) + "/" +
                           std::to_string(paths_.size()) + ": " +
                           fs::path(path).filename().string());

        bool cancelled = false;
        report.items.push_back(install_one(path, cancel, cancelled));
        if (cancelled) {
            report.cancelled = true;
            break;
        }
    }

    report_progress(report.items.size(), report.summary());
    syslog(report.all_succeeded() ? LOG_INFO : LOG_WARNING, "Install on %s: %s",
           serial_.c_str(), report.summary().c_str());
    return report;
}

InstallItem InstallTask::install_one(const std::string& path, const CancelToken& cancel,
                                     bool& cancelled) {
    InstallItem item;
    item.path = path;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        item.message = "file not found";
        syslog(LOG_WARNING, "Skipping %s: file not found", path.c_str());
        return item;
    }

    item.sha256 = sha256_file(path);
    syslog(LOG_DEBUG, "Package %s sha256=%s", path.c_str(), item.sha256.c_str());

    auto result = executor_.run(Protocol::install(serial_, path, options_), timeout_,
                                OutputMode::TEXT, &cancel);
    item.elapsed = result.elapsed;

    if (result.error_kind == ErrorKind::CANCELLED) {
        cancelled = true;
        item.message = "cancelled";
        return item;
    }

    if (result.success && Protocol::install_succeeded(result.text_out())) {
        item.success = true;
        item.message = Protocol::Markers::INSTALL_SUCCESS;
        syslog(LOG_INFO, "Installed %s on %s", path.c_str(), serial_.c_str());
    } else {
        item.message = failure_message(result);
        syslog(LOG_WARNING, "Install of %s on %s failed: %s", path.c_str(),
               serial_.c_str(), item.message.c_str());
    }
    return item;
}

void InstallTask::report_progress(size_t done, const std::string& message) const {
    if (!progress_) return;
    try {
        progress_(done, paths_.size(), message);
    } catch (const std::exception& e) {
        syslog(LOG_ERR, "Install progress callback failed: %s", e.what());
    }
}

} // namespace TvBridge
