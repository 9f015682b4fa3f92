// include/device_connector.h
// Foreground connect/disconnect of the active device

#ifndef DEVICE_CONNECTOR_H
#define DEVICE_CONNECTOR_H

#include <chrono>
#include <optional>
#include <string>
#include "command_executor.h"
#include "device_info.h"
#include "session_registry.h"

namespace TvBridge {

struct ConnectOutcome {
    bool connected = false;
    std::string message;
    std::optional<DeviceInfo> device;
};

/**
 * Validates reachability through the bridge and only then publishes the
 * device to the registry. A failed connect leaves the registry untouched.
 */
class DeviceConnector {
public:
    struct Timeouts {
        std::chrono::milliseconds connect{10000};
        std::chrono::milliseconds disconnect{5000};
        std::chrono::milliseconds devices{10000};
        std::chrono::milliseconds shell{5000};
    };

private:
    const CommandExecutor& executor_;
    SessionRegistry& registry_;
    Timeouts timeouts_;

    void drop_stale_session(const std::string& serial, const CancelToken* cancel) const;

public:
    DeviceConnector(const CommandExecutor& executor, SessionRegistry& registry, Timeouts timeouts)
        : executor_(executor), registry_(registry), timeouts_(timeouts) {}

    ConnectOutcome connect(const std::string& serial, const CancelToken* cancel = nullptr);

    /**
     * Disconnect and clear the active device.
     * @return false when no device was active
     */
    bool disconnect();
};

} // namespace TvBridge

#endif // DEVICE_CONNECTOR_H
