// include/environment_check.h
// Host requirement checks with fix suggestions

#ifndef ENVIRONMENT_CHECK_H
#define ENVIRONMENT_CHECK_H

#include <sys/stat.h>
#include <syslog.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>
#include "binary_resolver.h"
#include "bridge_protocol.h"
#include "command_executor.h"
#include "usb_probe.h"

namespace TvBridge {

class EnvironmentCheck {
public:
    struct CheckResult {
        bool passed = false;
        std::string message;
        std::string fix_suggestion;
    };

    /**
     * The bridge binary can be found and staged
     */
    static CheckResult check_bridge_resolvable(BinaryResolver& resolver) {
        CheckResult result;

        auto resolved = resolver.resolve();
        if (resolved.ok()) {
            const auto& loc = resolved.location();
            result.passed = true;
            result.message = loc.source.string() + " via " + loc.strategy +
                             " (staged in " + loc.staging_dir.string() + ")";
            return result;
        }

        result.message = resolved.error().reason;
        result.fix_suggestion =
            "Install platform-tools: apt install adb\n"
            "OR place the bridge in ./adb/ next to the executable\n"
            "OR set TVBRIDGE_BUNDLE_DIR / bridge.bundle_dir";
        return result;
    }

    static CheckResult check_bridge_version(const CommandExecutor& executor,
                                            std::chrono::milliseconds timeout) {
        CheckResult result;

        auto run = executor.run(Protocol::version(), timeout);
        if (!run.success) {
            result.message = "version query failed: " + run.describe();
            result.fix_suggestion = "Check that the bridge binary runs on this host (architecture, libraries)";
            return result;
        }

        std::string banner = Protocol::parse_version_banner(run.text_out());
        result.passed = true;
        result.message = banner.empty() ? "version query OK" : banner;
        return result;
    }

    /**
     * `devices` works, which also starts the bridge server if needed
     */
    static CheckResult check_devices(const CommandExecutor& executor,
                                     std::chrono::milliseconds timeout) {
        CheckResult result;

        auto run = executor.run(Protocol::devices(), timeout);
        if (!run.success) {
            result.message = "devices failed: " + run.describe();
            result.fix_suggestion = "Kill a stale server: adb kill-server\n"
                                    "Check that TCP port 5037 is free";
            return result;
        }

        auto entries = Protocol::parse_devices(run.text_out());
        result.passed = true;
        result.message = std::to_string(entries.size()) + " devices listed";
        return result;
    }

    static CheckResult check_libusb(const UsbInterfaceSource& probe) {
        CheckResult result;

        if (!probe.available()) {
            result.message = "libusb init failed: " + probe.init_error();
            result.fix_suggestion = "Install libusb-1.0: apt install libusb-1.0-0";
            return result;
        }

        auto interfaces = probe.scan();
        size_t unreadable = 0;
        for (const auto& iface : interfaces) {
            if (iface.serial.empty()) ++unreadable;
        }

        result.passed = true;
        result.message = "libusb OK, " + std::to_string(interfaces.size()) +
                         " bridge-capable USB interfaces";
        if (unreadable > 0) {
            result.message += " (" + std::to_string(unreadable) + " not accessible)";
            result.fix_suggestion =
                "Setup udev rules: /etc/udev/rules.d/51-android.rules\n"
                "  SUBSYSTEM==\"usb\", ENV{adb_user}==\"yes\", MODE=\"0660\", GROUP=\"plugdev\"";
        }
        return result;
    }

    /**
     * The directory the staging prefix points into accepts new directories
     */
    static CheckResult check_staging_directory(const std::string& staging_prefix) {
        CheckResult result;

        std::string templ = staging_prefix + "check_XXXXXX";
        std::vector<char> buf(templ.begin(), templ.end());
        buf.push_back('\0');

        if (mkdtemp(buf.data()) == nullptr) {
            std::string parent = std::filesystem::path(staging_prefix).parent_path().string();
            result.message = "Cannot create staging directory: " + std::string(strerror(errno));
            result.fix_suggestion = "Ensure " + parent + " is writable or set bridge.staging_prefix";
            return result;
        }

        if (rmdir(buf.data()) < 0) {
            syslog(LOG_WARNING, "Failed to remove probe directory %s: %s",
                   buf.data(), strerror(errno));
        }

        result.passed = true;
        result.message = "Staging location OK";
        return result;
    }

    /**
     * Run all checks and report. libusb problems are warnings only: the
     * bridge still works over the network without it.
     */
    static bool validate_all(BinaryResolver& resolver, const CommandExecutor& executor,
                             const UsbInterfaceSource& probe, const std::string& staging_prefix,
                             std::chrono::milliseconds timeout) {
        bool all_passed = true;

        syslog(LOG_INFO, "=== Environment Check ===");

        auto staging_result = check_staging_directory(staging_prefix);
        log_check_result("Staging Directory", staging_result);
        all_passed &= staging_result.passed;

        auto resolve_result = check_bridge_resolvable(resolver);
        log_check_result("Bridge Binary", resolve_result);
        all_passed &= resolve_result.passed;

        if (resolve_result.passed) {
            auto version_result = check_bridge_version(executor, timeout);
            log_check_result("Bridge Version", version_result);
            all_passed &= version_result.passed;

            auto devices_result = check_devices(executor, timeout);
            log_check_result("Device Listing", devices_result);
            all_passed &= devices_result.passed;
        }

        auto usb_result = check_libusb(probe);
        log_check_result("libusb", usb_result);
        if (!usb_result.passed) {
            syslog(LOG_WARNING, "USB cross-check unavailable - network devices are unaffected");
        }

        syslog(LOG_INFO, "=========================");

        return all_passed;
    }

    static void log_check_result(const char* check_name, const CheckResult& result) {
        if (result.passed) {
            syslog(LOG_INFO, "[OK] %s: %s", check_name, result.message.c_str());
            if (!result.fix_suggestion.empty()) {
                syslog(LOG_INFO, "  Hint: %s", result.fix_suggestion.c_str());
            }
        } else {
            syslog(LOG_ERR, "[FAIL] %s: %s", check_name, result.message.c_str());
            if (!result.fix_suggestion.empty()) {
                syslog(LOG_ERR, "  Fix: %s", result.fix_suggestion.c_str());
            }
        }
    }
};

} // namespace TvBridge

#endif // ENVIRONMENT_CHECK_H
