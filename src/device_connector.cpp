// src/device_connector.cpp
#include "device_connector.h"

#include <syslog.h>
#include <algorithm>
#include <stdexcept>
#include "bridge_protocol.h"
#include "package_ops.h"

namespace TvBridge {

void DeviceConnector::drop_stale_session(const std::string& serial, const CancelToken* cancel) const {
    auto result = executor_.run(Protocol::disconnect(serial), timeouts_.disconnect,
                                OutputMode::TEXT, cancel);
    if (!result.success) {
        syslog(LOG_DEBUG, "No stale session for %s: %s", serial.c_str(), result.describe().c_str());
    }
}

ConnectOutcome DeviceConnector::connect(const std::string& serial, const CancelToken* cancel) {
    if (serial.empty()) {
        throw std::invalid_argument("connect requires a serial");
    }

    ConnectOutcome outcome;
    const Transport transport = transport_from_serial(serial);
    syslog(LOG_INFO, "Connecting to %s (%s)", serial.c_str(), to_string(transport));

    if (transport == Transport::NETWORK) {
        drop_stale_session(serial, cancel);

        auto result = executor_.run(Protocol::connect(serial), timeouts_.connect,
                                    OutputMode::TEXT, cancel);
        if (!result.success || !Protocol::connect_succeeded(result.text_out())) {
            std::string detail = result.success ? trim(result.text_out()) : result.describe();
            outcome.message = "connect to " + serial + " failed: " + detail;
            syslog(LOG_WARNING, "%s", outcome.message.c_str());
            return outcome;
        }
    }

    auto listing = executor_.run(Protocol::devices(), timeouts_.devices, OutputMode::TEXT, cancel);
    if (!listing.success) {
        outcome.message = "cannot list devices: " + listing.describe();
        syslog(LOG_WARNING, "%s", outcome.message.c_str());
        return outcome;
    }

    auto entries = Protocol::parse_devices(listing.text_out());
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Protocol::DeviceEntry& e) { return e.serial == serial; });
    if (it == entries.end()) {
        outcome.message = serial + " is not listed by the bridge";
        syslog(LOG_WARNING, "%s", outcome.message.c_str());
        return outcome;
    }

    DeviceInfo device = Protocol::to_device_info(*it);
    if (device.status != DeviceStatus::CONNECTED) {
        outcome.message = serial + " is " + it->state + ", not ready";
        syslog(LOG_WARNING, "%s", outcome.message.c_str());
        return outcome;
    }

    read_identity(executor_, device, timeouts_.shell, cancel);

    if (cancel && cancel->is_cancelled()) {
        outcome.message = "connect to " + serial + " cancelled";
        syslog(LOG_INFO, "%s", outcome.message.c_str());
        return outcome;
    }

    registry_.set(device);

    outcome.connected = true;
    outcome.message = "Connected to " + device.display_name();
    outcome.device = device;
    return outcome;
}

bool DeviceConnector::disconnect() {
    auto active = registry_.get();
    if (!active) {
        syslog(LOG_INFO, "Disconnect requested with no active device");
        return false;
    }

    if (active->transport == Transport::NETWORK) {
        auto result = executor_.run(Protocol::disconnect(active->serial), timeouts_.disconnect);
        if (!result.success) {
            syslog(LOG_WARNING, "Disconnect of %s failed: %s", active->serial.c_str(),
                   result.describe().c_str());
        }
    }

    registry_.clear();
    return true;
}

} // namespace TvBridge
