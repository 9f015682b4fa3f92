// include/bridge_config.h
// Runtime configuration: JSON or key=value, read-only

#ifndef BRIDGE_CONFIG_H
#define BRIDGE_CONFIG_H

#include <pwd.h>
#include <syslog.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "utils.h"

namespace TvBridge {

using json = nlohmann::json;

/**
 * key=value reader for the non-JSON config format. Values overwrite their
 * target only when present and well-formed.
 */
class SimpleConfigParser {
private:
    std::map<std::string, std::string> values_;

public:
    void parse(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                syslog(LOG_DEBUG, "Config line without '=' ignored: %s", line.c_str());
                continue;
            }
            values_[trim(line.substr(0, eq_pos))] = trim(line.substr(eq_pos + 1));
        }
    }

    bool empty() const { return values_.empty(); }

    std::optional<std::string> lookup(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    void read(const std::string& key, std::string& out) const {
        if (auto raw = lookup(key)) out = *raw;
    }

    void read(const std::string& key, int& out) const {
        auto raw = lookup(key);
        if (!raw) return;
        if (auto value = parse_int(*raw)) {
            out = *value;
        } else {
            syslog(LOG_WARNING, "Config key %s: '%s' is not an integer", key.c_str(), raw->c_str());
        }
    }

    void read(const std::string& key, bool& out) const {
        auto raw = lookup(key);
        if (!raw) return;
        if (auto value = parse_bool(*raw)) {
            out = *value;
        } else {
            syslog(LOG_WARNING, "Config key %s: '%s' is not a boolean", key.c_str(), raw->c_str());
        }
    }
};

inline int parse_log_level(const std::string& level, int fallback) {
    if (level == "debug") return LOG_DEBUG;
    if (level == "info") return LOG_INFO;
    if (level == "warning") return LOG_WARNING;
    if (level == "error") return LOG_ERR;
    return fallback;
}

/**
 * Bridge configuration - defaults match the values the tool shipped with
 */
class BridgeConfig {
public:
    // Logging
    int log_level = LOG_INFO;
    bool log_to_stderr = false;

    // Bridge binary discovery
    std::string binary_name = "adb";
    std::string bundle_dir;
    std::string bridge_subdir = "adb";
    std::string staging_prefix = "/tmp/tvbridge_";
    int log_stdout_lines = 10;
    int log_stderr_lines = 5;

    // Per-command timeouts
    int default_timeout_ms = 30000;
    int devices_timeout_ms = 10000;
    int connect_timeout_ms = 10000;
    int disconnect_timeout_ms = 5000;
    int shell_timeout_ms = 5000;
    int install_timeout_ms = 60000;
    int screencap_timeout_ms = 10000;
    int version_timeout_ms = 10000;

    // Install
    bool install_force = false;
    bool install_downgrade = false;

    // Screen capture
    std::string screencap_output_dir = "screenshots";

    static std::chrono::milliseconds ms(int value) {
        return std::chrono::milliseconds(value);
    }

    /**
     * Load configuration from file. A missing or unusable file leaves every
     * field untouched; a loaded file replaces the fields it names and is
     * validated before it takes effect.
     */
    bool load_from_file(const std::string& config_path) {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            syslog(LOG_INFO, "Config file not found at %s, using defaults",
                   config_path.c_str());
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        const std::string text = buffer.str();

        syslog(LOG_INFO, "Loading config from %s", config_path.c_str());

        BridgeConfig loaded = *this;
        json parsed = json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            if (!parsed.is_object() || !loaded.apply_json(parsed)) {
                syslog(LOG_WARNING, "Failed to parse config file, using defaults");
                return false;
            }
            syslog(LOG_INFO, "Configuration loaded from JSON");
        } else if (loaded.apply_key_values(text)) {
            syslog(LOG_INFO, "Configuration loaded from key=value format");
        } else {
            syslog(LOG_WARNING, "Failed to parse config file, using defaults");
            return false;
        }

        loaded.validate_config();
        *this = loaded;
        return true;
    }

    /**
     * Validate configuration and repair settings that would break commands
     */
    void validate_config() {
        const BridgeConfig defaults;
        fix_timeout("timeouts.default_ms", default_timeout_ms, defaults.default_timeout_ms);
        fix_timeout("timeouts.devices_ms", devices_timeout_ms, defaults.devices_timeout_ms);
        fix_timeout("timeouts.connect_ms", connect_timeout_ms, defaults.connect_timeout_ms);
        fix_timeout("timeouts.disconnect_ms", disconnect_timeout_ms, defaults.disconnect_timeout_ms);
        fix_timeout("timeouts.shell_ms", shell_timeout_ms, defaults.shell_timeout_ms);
        fix_timeout("timeouts.install_ms", install_timeout_ms, defaults.install_timeout_ms);
        fix_timeout("timeouts.screencap_ms", screencap_timeout_ms, defaults.screencap_timeout_ms);
        fix_timeout("timeouts.version_ms", version_timeout_ms, defaults.version_timeout_ms);

        if (binary_name.empty() || binary_name.find('/') != std::string::npos) {
            syslog(LOG_WARNING, "bridge.binary_name '%s' invalid, using '%s'",
                   binary_name.c_str(), defaults.binary_name.c_str());
            binary_name = defaults.binary_name;
        }

        if (log_stdout_lines < 0) log_stdout_lines = 0;
        if (log_stderr_lines < 0) log_stderr_lines = 0;

        if (install_downgrade) {
            syslog(LOG_WARNING, "install.downgrade=true allows replacing apps with older versions");
        }
    }

    void log_config() const {
        syslog(LOG_INFO, "=== Bridge Configuration ===");
        syslog(LOG_INFO, "Binary: %s (subdir=%s, bundle=%s)",
               binary_name.c_str(), bridge_subdir.c_str(),
               bundle_dir.empty() ? "<none>" : bundle_dir.c_str());
        syslog(LOG_INFO, "Staging prefix: %s", staging_prefix.c_str());
        syslog(LOG_INFO, "Timeouts: default=%dms, devices=%dms, connect=%dms, shell=%dms",
               default_timeout_ms, devices_timeout_ms, connect_timeout_ms, shell_timeout_ms);
        syslog(LOG_INFO, "Timeouts: install=%dms, screencap=%dms, version=%dms",
               install_timeout_ms, screencap_timeout_ms, version_timeout_ms);
        syslog(LOG_INFO, "Install: force=%d, downgrade=%d", install_force, install_downgrade);
        syslog(LOG_INFO, "============================");
    }

private:
    bool apply_json(const json& config) {
        try {
            if (config.contains("logging")) {
                const auto& log = config["logging"];
                if (log.contains("level")) {
                    log_level = parse_log_level(log["level"].get<std::string>(), log_level);
                }
                if (log.contains("stderr")) log_to_stderr = log["stderr"].get<bool>();
            }

            if (config.contains("bridge")) {
                const auto& br = config["bridge"];
                if (br.contains("binary_name")) binary_name = br["binary_name"].get<std::string>();
                if (br.contains("bundle_dir")) bundle_dir = br["bundle_dir"].get<std::string>();
                if (br.contains("subdir")) bridge_subdir = br["subdir"].get<std::string>();
                if (br.contains("staging_prefix")) {
                    staging_prefix = br["staging_prefix"].get<std::string>();
                }
                if (br.contains("log_stdout_lines")) log_stdout_lines = br["log_stdout_lines"].get<int>();
                if (br.contains("log_stderr_lines")) log_stderr_lines = br["log_stderr_lines"].get<int>();
            }

            if (config.contains("timeouts")) {
                const auto& to = config["timeouts"];
                if (to.contains("default_ms")) default_timeout_ms = to["default_ms"].get<int>();
                if (to.contains("devices_ms")) devices_timeout_ms = to["devices_ms"].get<int>();
                if (to.contains("connect_ms")) connect_timeout_ms = to["connect_ms"].get<int>();
                if (to.contains("disconnect_ms")) disconnect_timeout_ms = to["disconnect_ms"].get<int>();
                if (to.contains("shell_ms")) shell_timeout_ms = to["shell_ms"].get<int>();
                if (to.contains("install_ms")) install_timeout_ms = to["install_ms"].get<int>();
                if (to.contains("screencap_ms")) screencap_timeout_ms = to["screencap_ms"].get<int>();
                if (to.contains("version_ms")) version_timeout_ms = to["version_ms"].get<int>();
            }

            if (config.contains("install")) {
                const auto& inst = config["install"];
                if (inst.contains("force")) install_force = inst["force"].get<bool>();
                if (inst.contains("downgrade")) install_downgrade = inst["downgrade"].get<bool>();
            }

            if (config.contains("screencap")) {
                const auto& cap = config["screencap"];
                if (cap.contains("output_dir")) {
                    screencap_output_dir = cap["output_dir"].get<std::string>();
                }
            }

            return true;

        } catch (const json::exception& e) {
            syslog(LOG_WARNING, "JSON config error: %s", e.what());
            return false;
        }
    }

    bool apply_key_values(const std::string& text) {
        std::istringstream in(text);
        SimpleConfigParser parser;
        parser.parse(in);
        if (parser.empty()) {
            return false;
        }

        if (auto level = parser.lookup("logging.level")) {
            log_level = parse_log_level(*level, log_level);
        }
        parser.read("logging.stderr", log_to_stderr);

        parser.read("bridge.binary_name", binary_name);
        parser.read("bridge.bundle_dir", bundle_dir);
        parser.read("bridge.subdir", bridge_subdir);
        parser.read("bridge.staging_prefix", staging_prefix);
        parser.read("bridge.log_stdout_lines", log_stdout_lines);
        parser.read("bridge.log_stderr_lines", log_stderr_lines);

        parser.read("timeouts.default_ms", default_timeout_ms);
        parser.read("timeouts.devices_ms", devices_timeout_ms);
        parser.read("timeouts.connect_ms", connect_timeout_ms);
        parser.read("timeouts.disconnect_ms", disconnect_timeout_ms);
        parser.read("timeouts.shell_ms", shell_timeout_ms);
        parser.read("timeouts.install_ms", install_timeout_ms);
        parser.read("timeouts.screencap_ms", screencap_timeout_ms);
        parser.read("timeouts.version_ms", version_timeout_ms);

        parser.read("install.force", install_force);
        parser.read("install.downgrade", install_downgrade);

        parser.read("screencap.output_dir", screencap_output_dir);

        return true;
    }

    static void fix_timeout(const char* key, int& value, int fallback) {
        if (value <= 0) {
            syslog(LOG_WARNING, "%s=%d is not positive, using %d", key, value, fallback);
            value = fallback;
        }
    }
};

inline std::string home_directory() {
    const char* home = getenv("HOME");
    if (home && *home) {
        return home;
    }
    const struct passwd* pw = getpwuid(getuid());
    return (pw && pw->pw_dir) ? std::string(pw->pw_dir) : std::string();
}

/**
 * ~/.tvbridge/config, or empty when no home directory is known
 */
inline std::string get_config_path() {
    std::string home = home_directory();
    return home.empty() ? std::string() : home + "/.tvbridge/config";
}

} // namespace TvBridge

#endif // BRIDGE_CONFIG_H
