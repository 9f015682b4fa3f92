// include/package_ops.h
// Property and package queries against one device

#ifndef PACKAGE_OPS_H
#define PACKAGE_OPS_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "command_executor.h"
#include "device_info.h"

namespace TvBridge {

struct PackageOpResult {
    bool success = false;
    std::string message;
};

/**
 * `getprop <prop>`; nothing when the command fails or the value is empty
 */
std::optional<std::string> read_property(const CommandExecutor& executor,
                                         const std::string& serial,
                                         const std::string& prop,
                                         std::chrono::milliseconds timeout,
                                         const CancelToken* cancel = nullptr);

/**
 * Fill device.model from the model property and device.name with
 * "<brand> <model>" (or whichever of the two could be read)
 */
void read_identity(const CommandExecutor& executor, DeviceInfo& device,
                   std::chrono::milliseconds timeout,
                   const CancelToken* cancel = nullptr);

/**
 * Third-party packages, sorted. Nothing when the listing failed.
 */
std::optional<std::vector<std::string>> list_packages(const CommandExecutor& executor,
                                                      const std::string& serial,
                                                      std::chrono::milliseconds timeout,
                                                      const CancelToken* cancel = nullptr);

std::optional<std::string> package_version(const CommandExecutor& executor,
                                           const std::string& serial,
                                           const std::string& package,
                                           std::chrono::milliseconds timeout,
                                           const CancelToken* cancel = nullptr);

PackageOpResult uninstall_package(const CommandExecutor& executor,
                                  const std::string& serial,
                                  const std::string& package,
                                  std::chrono::milliseconds timeout,
                                  const CancelToken* cancel = nullptr);

/**
 * The "Failure [...]" line the package manager printed, if any
 */
std::optional<std::string> find_failure_line(const CommandResult& result);

/**
 * Best description of a failed install/uninstall: the failure line, the
 * unconfirmed output, or the executor error
 */
std::string failure_message(const CommandResult& result);

} // namespace TvBridge

#endif // PACKAGE_OPS_H
