// include/device_info.h
// Identity and state of one bridge target

#ifndef DEVICE_INFO_H
#define DEVICE_INFO_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace TvBridge {

enum class DeviceStatus {
    UNKNOWN,
    CONNECTING,
    CONNECTED,
    DISCONNECTED
};

enum class Transport {
    UNKNOWN,
    USB,
    NETWORK
};

inline const char* to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::CONNECTING: return "connecting";
        case DeviceStatus::CONNECTED: return "connected";
        case DeviceStatus::DISCONNECTED: return "disconnected";
        default: return "unknown";
    }
}

inline const char* to_string(Transport transport) {
    switch (transport) {
        case Transport::USB: return "usb";
        case Transport::NETWORK: return "network";
        default: return "unknown";
    }
}

/**
 * Map the state column of `devices` output onto DeviceStatus.
 */
inline DeviceStatus status_from_bridge_state(const std::string& state) {
    if (state == "device") return DeviceStatus::CONNECTED;
    if (state == "connecting" || state == "authorizing") return DeviceStatus::CONNECTING;
    if (state == "offline" || state == "disconnected") return DeviceStatus::DISCONNECTED;
    return DeviceStatus::UNKNOWN;
}

/**
 * host:port serials are network targets, everything else came over USB.
 */
inline Transport transport_from_serial(const std::string& serial) {
    if (serial.empty()) return Transport::UNKNOWN;
    size_t colon = serial.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == serial.size()) {
        return Transport::USB;
    }
    for (size_t i = colon + 1; i < serial.size(); ++i) {
        if (serial[i] < '0' || serial[i] > '9') return Transport::USB;
    }
    return Transport::NETWORK;
}

struct DeviceInfo {
    std::string serial;
    std::optional<std::string> name;
    std::optional<std::string> model;
    DeviceStatus status = DeviceStatus::UNKNOWN;
    Transport transport = Transport::UNKNOWN;
    std::string bridge_state;

    DeviceInfo() = default;

    explicit DeviceInfo(std::string s,
                        DeviceStatus st = DeviceStatus::UNKNOWN)
        : serial(std::move(s)), status(st),
          transport(transport_from_serial(serial)) {}

    std::string display_name() const {
        if (name && !name->empty()) return *name;
        if (model && !model->empty()) return *model;
        return serial;
    }

    nlohmann::json to_json() const {
        nlohmann::json obj;
        obj["serial"] = serial;
        obj["name"] = name ? nlohmann::json(*name) : nlohmann::json(nullptr);
        obj["model"] = model ? nlohmann::json(*model) : nlohmann::json(nullptr);
        obj["status"] = to_string(status);
        obj["transport"] = to_string(transport);
        obj["state"] = bridge_state;
        return obj;
    }

    bool operator==(const DeviceInfo& other) const {
        return serial == other.serial && name == other.name &&
               model == other.model && status == other.status &&
               transport == other.transport && bridge_state == other.bridge_state;
    }

    bool operator!=(const DeviceInfo& other) const {
        return !(*this == other);
    }
};

} // namespace TvBridge

#endif // DEVICE_INFO_H
