// src/main.cpp
// tvbridge command-line front end

#include <signal.h>
#include <syslog.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../include/binary_resolver.h"
#include "../include/bridge_config.h"
#include "../include/bridge_protocol.h"
#include "../include/cancel_token.h"
#include "../include/command_executor.h"
#include "../include/device_connector.h"
#include "../include/device_scan_task.h"
#include "../include/environment_check.h"
#include "../include/install_task.h"
#include "../include/package_ops.h"
#include "../include/screenshot_task.h"
#include "../include/session_registry.h"
#include "../include/usb_probe.h"

using namespace TvBridge;
using json = nlohmann::json;

// Global state for signal handling
std::atomic<bool> g_running{true};
// Cancels foreground bridge commands; workers are cancelled by await()
CancelToken g_interrupt;

void signal_handler(int) {
    g_running = false;
    g_interrupt.cancel();
}

namespace {

constexpr int EXIT_USAGE = 2;

void print_usage(const char* prog) {
    fprintf(stderr, "tvbridge - manage Android TV devices through adb\n");
    fprintf(stderr, "Usage: %s [OPTIONS] COMMAND [ARGS]\n\n", prog);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help            Show this help message\n");
    fprintf(stderr, "  -c, --check           Check environment and exit\n");
    fprintf(stderr, "  --config PATH         Config file (default ~/.tvbridge/config)\n");
    fprintf(stderr, "  -v, --verbose         Debug logging to stderr\n");
    fprintf(stderr, "  --json                Machine-readable output\n\n");
    fprintf(stderr, "Commands:\n");
    fprintf(stderr, "  devices                           List devices\n");
    fprintf(stderr, "  connect SERIAL                    Connect (host:port for network devices)\n");
    fprintf(stderr, "  disconnect SERIAL                 Disconnect\n");
    fprintf(stderr, "  shell SERIAL CMD...               Run a shell command\n");
    fprintf(stderr, "  install [-f] [-d] SERIAL APK...   Install packages\n");
    fprintf(stderr, "  screencap SERIAL [FILE]           Save a PNG screenshot\n");
    fprintf(stderr, "  packages SERIAL [--versions]      List third-party packages\n");
    fprintf(stderr, "  uninstall SERIAL PACKAGE          Remove a package\n");
    fprintf(stderr, "  version                           Show bridge version\n\n");
    fprintf(stderr, "Bridge lookup order:\n");
    fprintf(stderr, "  $TVBRIDGE_BUNDLE_DIR/adb, <exe dir>/adb, ./adb, PATH\n");
}

struct CliOptions {
    std::string config_path;
    bool verbose = false;
    bool json_output = false;
    bool show_help = false;
    bool check_only = false;
    std::vector<std::string> command;
};

bool parse_cli(int argc, char* argv[], CliOptions& opts) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--check" || arg == "-c") {
            opts.check_only = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                fprintf(stderr, "--config requires a path\n");
                return false;
            }
            opts.config_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            return false;
        } else {
            break;
        }
    }
    for (; i < argc; ++i) {
        opts.command.push_back(argv[i]);
    }
    return true;
}

void open_log(bool to_stderr, int level) {
    closelog();
    int log_options = LOG_PID;
    if (to_stderr) {
        log_options |= LOG_PERROR;
    }
    openlog("tvbridge", log_options, LOG_USER);
    setlogmask(LOG_UPTO(level));
}

} // namespace

/**
 * One process, one command. The registry still mediates the active device
 * so the connect -> work -> disconnect flow matches long-running front ends.
 */
class TvBridgeCli {
private:
    BridgeConfig config_;
    bool json_output_;
    std::unique_ptr<BinaryResolver> resolver_;
    std::unique_ptr<CommandExecutor> executor_;
    SessionRegistry registry_;
    std::unique_ptr<DeviceConnector> connector_;
    std::shared_ptr<DeviceListener> log_listener_;

public:
    TvBridgeCli(BridgeConfig config, bool json_output)
        : config_(std::move(config)), json_output_(json_output) {
        resolver_ = BinaryResolver::from_config(config_);

        CommandExecutor::Options exec_options;
        exec_options.log_stdout_lines = config_.log_stdout_lines;
        exec_options.log_stderr_lines = config_.log_stderr_lines;
        exec_options.version_timeout = BridgeConfig::ms(config_.version_timeout_ms);
        executor_ = std::make_unique<CommandExecutor>(*resolver_, exec_options);

        DeviceConnector::Timeouts timeouts;
        timeouts.connect = BridgeConfig::ms(config_.connect_timeout_ms);
        timeouts.disconnect = BridgeConfig::ms(config_.disconnect_timeout_ms);
        timeouts.devices = BridgeConfig::ms(config_.devices_timeout_ms);
        timeouts.shell = BridgeConfig::ms(config_.shell_timeout_ms);
        connector_ = std::make_unique<DeviceConnector>(*executor_, registry_, timeouts);

        log_listener_ = std::make_shared<CallbackListener>([](const std::optional<DeviceInfo>& device) {
            syslog(LOG_DEBUG, "Active device -> %s",
                   device ? device->serial.c_str() : "<none>");
        });
        registry_.add_listener(log_listener_);
    }

    ~TvBridgeCli() {
        registry_.remove_listener(log_listener_);
        resolver_->cleanup();
    }

    int check() {
        UsbProbe probe;
        bool passed = EnvironmentCheck::validate_all(*resolver_, *executor_, probe,
                                                     config_.staging_prefix,
                                                     BridgeConfig::ms(config_.version_timeout_ms));
        printf("%s\n", passed ? "Environment OK" : "Environment check failed (see log)");
        return passed ? 0 : 1;
    }

    int run(const std::vector<std::string>& command) {
        const std::string& name = command.front();
        std::vector<std::string> args(command.begin() + 1, command.end());

        if (name == "devices") return cmd_devices();
        if (name == "connect") return cmd_connect(args);
        if (name == "disconnect") return cmd_disconnect(args);
        if (name == "shell") return cmd_shell(args);
        if (name == "install") return cmd_install(args);
        if (name == "screencap") return cmd_screencap(args);
        if (name == "packages") return cmd_packages(args);
        if (name == "uninstall") return cmd_uninstall(args);
        if (name == "version") return cmd_version();

        fprintf(stderr, "Unknown command: %s\n", name.c_str());
        return EXIT_USAGE;
    }

private:
    /**
     * Wait for a worker while honouring SIGINT/SIGTERM
     */
    template <typename Result>
    Result await(WorkerTask<Result>& task) {
        auto future = task.start();
        while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (!g_running && !task.is_cancelled()) {
                syslog(LOG_INFO, "Interrupted, cancelling %s", task.name().c_str());
                task.cancel();
            }
        }
        task.stop();
        return future.get();
    }

    // Connect and make the device active; prints the failure
    bool select_device(const std::string& serial) {
        auto outcome = connector_->connect(serial, &g_interrupt);
        if (!outcome.connected) {
            fprintf(stderr, "%s\n", outcome.message.c_str());
            return false;
        }
        return true;
    }

    std::string active_serial() const {
        auto active = registry_.get();
        return active ? active->serial : std::string();
    }

    void print_json(const json& value) const {
        std::cout << value.dump(2) << std::endl;
    }

    int cmd_devices() {
        UsbProbe probe;
        DeviceScanTask::Options options;
        options.devices_timeout = BridgeConfig::ms(config_.devices_timeout_ms);
        options.shell_timeout = BridgeConfig::ms(config_.shell_timeout_ms);
        DeviceScanTask task(*executor_, registry_, &probe, options);

        ScanReport report = await(task);
        if (!report.success) {
            fprintf(stderr, "Device scan failed: %s\n", report.error.c_str());
            return 1;
        }

        if (json_output_) {
            json out = json::array();
            for (const auto& d : report.devices) out.push_back(d.to_json());
            print_json(out);
        } else if (report.devices.empty()) {
            printf("No devices\n");
        } else {
            for (const auto& d : report.devices) {
                printf("%-24s %-14s %-8s %s\n", d.serial.c_str(), d.bridge_state.c_str(),
                       to_string(d.transport), d.display_name().c_str());
            }
        }
        for (const auto& serial : report.unlisted_usb) {
            fprintf(stderr, "USB device %s is attached but not listed (unauthorized?)\n",
                    serial.c_str());
        }
        return 0;
    }

    int cmd_connect(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            fprintf(stderr, "Usage: connect SERIAL\n");
            return EXIT_USAGE;
        }
        auto outcome = connector_->connect(args[0], &g_interrupt);
        if (json_output_) {
            json out;
            out["connected"] = outcome.connected;
            out["message"] = outcome.message;
            out["device"] = outcome.device ? outcome.device->to_json() : json(nullptr);
            print_json(out);
        } else {
            printf("%s\n", outcome.message.c_str());
        }
        return outcome.connected ? 0 : 1;
    }

    int cmd_disconnect(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            fprintf(stderr, "Usage: disconnect SERIAL\n");
            return EXIT_USAGE;
        }
        // Nothing to validate: a stale or offline device is disconnected all the same
        registry_.set(DeviceInfo(args[0], DeviceStatus::DISCONNECTED));
        connector_->disconnect();
        printf("Disconnected %s\n", args[0].c_str());
        return 0;
    }

    int cmd_shell(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            fprintf(stderr, "Usage: shell SERIAL CMD...\n");
            return EXIT_USAGE;
        }
        if (!select_device(args[0])) return 1;

        std::vector<std::string> cmd(args.begin() + 1, args.end());
        auto result = executor_->run(Protocol::shell(active_serial(), cmd),
                                     BridgeConfig::ms(config_.shell_timeout_ms),
                                     OutputMode::TEXT, &g_interrupt);
        fputs(result.text_out().c_str(), stdout);
        fputs(result.text_err().c_str(), stderr);
        if (result.error) {
            fprintf(stderr, "%s\n", result.error->c_str());
        }
        return result.exit_code.value_or(1);
    }

    int cmd_install(const std::vector<std::string>& args) {
        Protocol::InstallOptions options;
        options.force = config_.install_force;
        options.downgrade = config_.install_downgrade;

        size_t i = 0;
        for (; i < args.size() && !args[i].empty() && args[i][0] == '-'; ++i) {
            if (args[i] == "-f") options.force = true;
            else if (args[i] == "-d") options.downgrade = true;
            else {
                fprintf(stderr, "Unknown install flag: %s\n", args[i].c_str());
                return EXIT_USAGE;
            }
        }
        if (args.size() - i < 2) {
            fprintf(stderr, "Usage: install [-f] [-d] SERIAL APK...\n");
            return EXIT_USAGE;
        }
        if (!select_device(args[i])) return 1;

        std::vector<std::string> paths(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
        auto progress = [this](size_t done, size_t total, const std::string& message) {
            if (!json_output_) printf("[%zu/%zu] %s\n", done, total, message.c_str());
        };
        InstallTask task(*executor_, active_serial(), paths, options,
                         BridgeConfig::ms(config_.install_timeout_ms), progress);

        InstallReport report = await(task);
        if (json_output_) {
            print_json(report.to_json());
        } else {
            for (const auto& item : report.items) {
                printf("%s %s: %s\n", item.success ? "OK  " : "FAIL", item.path.c_str(),
                       item.message.c_str());
            }
        }
        return report.all_succeeded() ? 0 : 1;
    }

    int cmd_screencap(const std::vector<std::string>& args) {
        if (args.empty() || args.size() > 2) {
            fprintf(stderr, "Usage: screencap SERIAL [FILE]\n");
            return EXIT_USAGE;
        }
        if (!select_device(args[0])) return 1;

        std::string serial = active_serial();
        std::string path = args.size() == 2 ? args[1]
                         : default_screenshot_path(config_.screencap_output_dir, serial);
        ScreenshotTask task(*executor_, serial, BridgeConfig::ms(config_.screencap_timeout_ms), path);

        ScreenshotResult shot = await(task);
        if (!shot.success) {
            fprintf(stderr, "Screenshot failed: %s\n", shot.error.c_str());
            return 1;
        }
        printf("%s (%zu bytes)\n", shot.saved_path.c_str(), shot.png.size());
        return 0;
    }

    int cmd_packages(const std::vector<std::string>& args) {
        if (args.empty() || args.size() > 2 || (args.size() == 2 && args[1] != "--versions")) {
            fprintf(stderr, "Usage: packages SERIAL [--versions]\n");
            return EXIT_USAGE;
        }
        if (!select_device(args[0])) return 1;

        const bool with_versions = args.size() == 2;
        const auto timeout = BridgeConfig::ms(config_.shell_timeout_ms);
        std::string serial = active_serial();

        auto packages = list_packages(*executor_, serial, timeout, &g_interrupt);
        if (!packages) {
            fprintf(stderr, "Cannot list packages on %s\n", serial.c_str());
            return 1;
        }

        json out = json::array();
        for (const auto& package : *packages) {
            if (g_interrupt.is_cancelled()) break;
            std::optional<std::string> version;
            if (with_versions) {
                version = package_version(*executor_, serial, package, timeout, &g_interrupt);
            }

            if (json_output_) {
                out.push_back({{"package", package},
                               {"version", version ? json(*version) : json(nullptr)}});
            } else if (with_versions) {
                printf("%s %s\n", package.c_str(), version ? version->c_str() : "?");
            } else {
                printf("%s\n", package.c_str());
            }
        }
        if (json_output_) print_json(out);
        return 0;
    }

    int cmd_uninstall(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            fprintf(stderr, "Usage: uninstall SERIAL PACKAGE\n");
            return EXIT_USAGE;
        }
        if (!select_device(args[0])) return 1;

        auto op = uninstall_package(*executor_, active_serial(), args[1],
                                    BridgeConfig::ms(config_.default_timeout_ms), &g_interrupt);
        printf("%s\n", op.message.c_str());
        return op.success ? 0 : 1;
    }

    int cmd_version() {
        auto result = executor_->run(Protocol::version(), BridgeConfig::ms(config_.version_timeout_ms),
                                     OutputMode::TEXT, &g_interrupt);
        if (!result.success) {
            fprintf(stderr, "%s\n", result.describe().c_str());
            return 1;
        }
        auto location = resolver_->cached();
        if (json_output_) {
            json out;
            out["banner"] = Protocol::parse_version_banner(result.text_out());
            if (location) {
                out["source"] = location->source.string();
                out["strategy"] = location->strategy;
                out["sha256"] = location->sha256;
            }
            print_json(out);
        } else {
            printf("%s\n", Protocol::parse_version_banner(result.text_out()).c_str());
            if (location) {
                printf("from %s (%s)\n", location->source.string().c_str(), location->strategy.c_str());
            }
        }
        return 0;
    }
};

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_cli(argc, argv, opts)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (opts.show_help || (!opts.check_only && opts.command.empty())) {
        print_usage(argv[0]);
        return opts.show_help ? 0 : EXIT_USAGE;
    }

    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);

    open_log(opts.verbose || opts.check_only, opts.verbose ? LOG_DEBUG : LOG_INFO);

    BridgeConfig config;
    std::string config_path = opts.config_path.empty() ? get_config_path() : opts.config_path;
    if (!config_path.empty()) {
        config.load_from_file(config_path);
    } else {
        syslog(LOG_WARNING, "Could not determine config path, using defaults");
    }

    if (opts.verbose) {
        config.log_level = LOG_DEBUG;
        config.log_to_stderr = true;
    }
    open_log(config.log_to_stderr || opts.check_only, config.log_level);
    config.log_config();

    int rc = 1;
    try {
        TvBridgeCli cli(config, opts.json_output);
        rc = opts.check_only ? cli.check() : cli.run(opts.command);
    } catch (const std::exception& e) {
        syslog(LOG_ERR, "Fatal: %s", e.what());
        fprintf(stderr, "Error: %s\n", e.what());
        rc = 1;
    }

    closelog();
    return rc;
}
