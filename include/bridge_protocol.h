// include/bridge_protocol.h
// Argument lists and output parsing for the bridge command-line protocol

#ifndef BRIDGE_PROTOCOL_H
#define BRIDGE_PROTOCOL_H

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include "device_info.h"
#include "utils.h"

namespace TvBridge {
namespace Protocol {

namespace Markers {
    constexpr const char* CONNECTED = "connected";
    constexpr const char* INSTALL_SUCCESS = "Success";
    constexpr const char* PACKAGE_PREFIX = "package:";
    constexpr const char* VERSION_NAME = "versionName=";
}

namespace Props {
    constexpr const char* MODEL = "ro.product.model";
    constexpr const char* BRAND = "ro.product.brand";
}

// 89 50 4E 47 0D 0A 1A 0A
constexpr uint8_t PNG_MAGIC[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

struct InstallOptions {
    bool force = false;       // -f
    bool downgrade = false;   // -d
};

struct DeviceEntry {
    std::string serial;
    std::string state;
};

// ===== ARGUMENT BUILDERS =====

inline std::vector<std::string> devices() {
    return {"devices"};
}

inline std::vector<std::string> version() {
    return {"version"};
}

inline std::vector<std::string> connect(const std::string& host_port) {
    return {"connect", host_port};
}

inline std::vector<std::string> disconnect(const std::string& serial) {
    return {"disconnect", serial};
}

inline std::vector<std::string> shell(const std::string& serial,
                                      const std::vector<std::string>& command) {
    std::vector<std::string> args = {"-s", serial, "shell"};
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

inline std::vector<std::string> getprop(const std::string& serial, const std::string& prop) {
    return shell(serial, {"getprop", prop});
}

inline std::vector<std::string> install(const std::string& serial,
                                        const std::string& package_path,
                                        const InstallOptions& options) {
    // -r: replace an already installed app
    std::vector<std::string> args = {"-s", serial, "install", "-r"};
    if (options.force) args.push_back("-f");
    if (options.downgrade) args.push_back("-d");
    args.push_back(package_path);
    return args;
}

inline std::vector<std::string> uninstall(const std::string& serial, const std::string& package) {
    return {"-s", serial, "uninstall", package};
}

inline std::vector<std::string> screencap(const std::string& serial) {
    return {"-s", serial, "exec-out", "screencap", "-p"};
}

inline std::vector<std::string> list_third_party_packages(const std::string& serial) {
    return shell(serial, {"pm", "list", "packages", "-3"});
}

inline std::vector<std::string> dump_package(const std::string& serial, const std::string& package) {
    return shell(serial, {"dumpsys", "package", package});
}

// ===== OUTPUT PARSERS =====

/**
 * Parse `devices` output: a header line, then "<serial>\t<state>" lines.
 * Daemon notices ("* daemon started ...") and blank lines are skipped.
 */
inline std::vector<DeviceEntry> parse_devices(const std::string& output) {
    std::vector<DeviceEntry> entries;
    auto lines = split_lines(output);
    bool header_seen = false;

    for (const auto& raw : lines) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '*') continue;

        if (!header_seen) {
            header_seen = true;
            continue;
        }

        size_t sep = line.find_first_of("\t ");
        if (sep == std::string::npos) continue;

        DeviceEntry entry;
        entry.serial = line.substr(0, sep);
        std::string rest = trim(line.substr(sep + 1));
        size_t end = rest.find_first_of("\t ");
        entry.state = rest.substr(0, end);
        if (!entry.serial.empty() && !entry.state.empty()) {
            entries.push_back(entry);
        }
    }
    return entries;
}

inline DeviceInfo to_device_info(const DeviceEntry& entry) {
    DeviceInfo info(entry.serial, status_from_bridge_state(entry.state));
    info.bridge_state = entry.state;
    return info;
}

inline bool connect_succeeded(const std::string& output) {
    return output.find(Markers::CONNECTED) != std::string::npos;
}

inline bool install_succeeded(const std::string& output) {
    return output.find(Markers::INSTALL_SUCCESS) != std::string::npos;
}

/**
 * `pm list packages` output -> package names
 */
inline std::vector<std::string> parse_packages(const std::string& output) {
    std::vector<std::string> packages;
    const std::string prefix = Markers::PACKAGE_PREFIX;
    for (const auto& raw : split_lines(output)) {
        std::string line = trim(raw);
        if (line.compare(0, prefix.size(), prefix) == 0) {
            std::string name = trim(line.substr(prefix.size()));
            if (!name.empty()) packages.push_back(name);
        }
    }
    return packages;
}

/**
 * First versionName=<v> token in `dumpsys package` output
 */
inline std::optional<std::string> parse_version_name(const std::string& output) {
    const std::string marker = Markers::VERSION_NAME;
    size_t pos = output.find(marker);
    if (pos == std::string::npos) return std::nullopt;

    pos += marker.size();
    size_t end = output.find_first_of(" \t\r\n", pos);
    std::string version = output.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    if (version.empty()) return std::nullopt;
    return version;
}

/**
 * First line of `version` output ("Android Debug Bridge version 1.0.41")
 */
inline std::string parse_version_banner(const std::string& output) {
    auto lines = split_lines(trim(output));
    return lines.empty() ? std::string() : trim(lines.front());
}

/**
 * Offset of the PNG signature in a screencap payload. Some devices emit
 * warnings or stray bytes before the image.
 */
inline std::optional<size_t> find_png_start(const Bytes& data) {
    auto it = std::search(data.begin(), data.end(),
                          std::begin(PNG_MAGIC), std::end(PNG_MAGIC));
    if (it == data.end()) return std::nullopt;
    return static_cast<size_t>(it - data.begin());
}

/**
 * The payload from the PNG signature onward, or nothing if there is none.
 */
inline std::optional<Bytes> extract_png(const Bytes& data) {
    auto start = find_png_start(data);
    if (!start) return std::nullopt;
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(*start), data.end());
}

} // namespace Protocol
} // namespace TvBridge

#endif // BRIDGE_PROTOCOL_H
