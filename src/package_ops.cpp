// src/package_ops.cpp
#include "package_ops.h"

#include <syslog.h>
#include <algorithm>
#include "bridge_protocol.h"

namespace TvBridge {

std::optional<std::string> read_property(const CommandExecutor& executor,
                                         const std::string& serial,
                                         const std::string& prop,
                                         std::chrono::milliseconds timeout,
                                         const CancelToken* cancel) {
    auto result = executor.run(Protocol::getprop(serial, prop), timeout, OutputMode::TEXT, cancel);
    if (!result.success) {
        return std::nullopt;
    }
    std::string value = trim(result.text_out());
    if (value.empty()) return std::nullopt;
    return value;
}

void read_identity(const CommandExecutor& executor, DeviceInfo& device,
                   std::chrono::milliseconds timeout,
                   const CancelToken* cancel) {
    auto model = read_property(executor, device.serial, Protocol::Props::MODEL, timeout, cancel);
    auto brand = read_property(executor, device.serial, Protocol::Props::BRAND, timeout, cancel);

    device.model = model;
    if (brand && model) {
        device.name = *brand + " " + *model;
    } else {
        device.name = model ? model : brand;
    }
}

std::optional<std::vector<std::string>> list_packages(const CommandExecutor& executor,
                                                      const std::string& serial,
                                                      std::chrono::milliseconds timeout,
                                                      const CancelToken* cancel) {
    auto result = executor.run(Protocol::list_third_party_packages(serial), timeout,
                               OutputMode::TEXT, cancel);
    if (!result.success) {
        syslog(LOG_WARNING, "Cannot list packages on %s: %s",
               serial.c_str(), result.describe().c_str());
        return std::nullopt;
    }

    auto packages = Protocol::parse_packages(result.text_out());
    std::sort(packages.begin(), packages.end());
    syslog(LOG_INFO, "%zu third-party packages on %s", packages.size(), serial.c_str());
    return packages;
}

std::optional<std::string> package_version(const CommandExecutor& executor,
                                           const std::string& serial,
                                           const std::string& package,
                                           std::chrono::milliseconds timeout,
                                           const CancelToken* cancel) {
    auto result = executor.run(Protocol::dump_package(serial, package), timeout,
                               OutputMode::TEXT, cancel);
    if (!result.success) {
        syslog(LOG_WARNING, "Cannot query %s on %s: %s", package.c_str(),
               serial.c_str(), result.describe().c_str());
        return std::nullopt;
    }

    auto version = Protocol::parse_version_name(result.text_out());
    if (!version) {
        syslog(LOG_INFO, "No versionName for %s on %s", package.c_str(), serial.c_str());
    }
    return version;
}

PackageOpResult uninstall_package(const CommandExecutor& executor,
                                  const std::string& serial,
                                  const std::string& package,
                                  std::chrono::milliseconds timeout,
                                  const CancelToken* cancel) {
    PackageOpResult op;
    auto result = executor.run(Protocol::uninstall(serial, package), timeout,
                               OutputMode::TEXT, cancel);

    if (result.success && Protocol::install_succeeded(result.text_out())) {
        op.success = true;
        op.message = "Uninstalled " + package;
        syslog(LOG_INFO, "Uninstalled %s from %s", package.c_str(), serial.c_str());
        return op;
    }

    op.message = failure_message(result);
    syslog(LOG_WARNING, "Uninstall of %s from %s failed: %s",
           package.c_str(), serial.c_str(), op.message.c_str());
    return op;
}

std::string failure_message(const CommandResult& result) {
    if (auto failure = find_failure_line(result)) {
        return *failure;
    }
    if (result.success) {
        // Exit 0 without the success marker
        std::string out = trim(result.text_out());
        return out.empty() ? "no confirmation from package manager" : "unexpected output: " + out;
    }
    return result.describe();
}

std::optional<std::string> find_failure_line(const CommandResult& result) {
    if (result.mode() != OutputMode::TEXT) return std::nullopt;

    for (const auto* text : {&result.text_out(), &result.text_err()}) {
        for (const auto& line : split_lines(*text)) {
            std::string trimmed = trim(line);
            if (trimmed.compare(0, 7, "Failure") == 0 ||
                trimmed.find("INSTALL_FAILED") != std::string::npos) {
                return trimmed;
            }
        }
    }
    return std::nullopt;
}

} // namespace TvBridge
