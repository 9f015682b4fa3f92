// src/session_registry.cpp
#include "session_registry.h"

#include <syslog.h>
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace TvBridge {

void SessionRegistry::set(const DeviceInfo& device) {
    if (device.serial.empty()) {
        throw std::invalid_argument("active device requires a serial");
    }
    publish(device);
}

bool SessionRegistry::set_if_active(const std::string& serial, const DeviceInfo& device) {
    if (device.serial.empty()) {
        throw std::invalid_argument("active device requires a serial");
    }
    ensure_not_notifying();

    std::lock_guard<std::mutex> round(round_mutex_);

    std::vector<ListenerPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (!active_ || active_->serial != serial) {
            return false;
        }
        active_ = device;
        snapshot = listeners_;
    }

    run_round(snapshot, device);
    return true;
}

void SessionRegistry::clear() {
    publish(std::nullopt);
}

void SessionRegistry::ensure_not_notifying() const {
    if (notifying_thread_.load() == std::this_thread::get_id()) {
        throw std::logic_error("session registry modified from inside a listener");
    }
}

void SessionRegistry::publish(std::optional<DeviceInfo> next) {
    ensure_not_notifying();

    std::lock_guard<std::mutex> round(round_mutex_);

    std::vector<ListenerPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        active_ = next;
        snapshot = listeners_;
    }

    run_round(snapshot, next);
}

// Caller holds round_mutex_
void SessionRegistry::run_round(const std::vector<ListenerPtr>& listeners,
                                const std::optional<DeviceInfo>& device) {
    if (device) {
        syslog(LOG_INFO, "Active device: %s (%s, %s)", device->serial.c_str(),
               device->display_name().c_str(), to_string(device->status));
    } else {
        syslog(LOG_INFO, "Active device cleared");
    }

    notifying_thread_.store(std::this_thread::get_id());
    size_t index = 0;
    for (const auto& listener : listeners) {
        try {
            listener->on_device_changed(device);
        } catch (const std::exception& e) {
            syslog(LOG_ERR, "Device listener #%zu failed: %s", index, e.what());
        } catch (...) {
            syslog(LOG_ERR, "Device listener #%zu failed with a non-standard exception", index);
        }
        ++index;
    }
    notifying_thread_.store(std::thread::id());
}

std::optional<DeviceInfo> SessionRegistry::get() const {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return active_;
}

bool SessionRegistry::has_active() const {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return active_.has_value();
}

bool SessionRegistry::add_listener(const ListenerPtr& listener) {
    if (!listener) return false;

    std::lock_guard<std::mutex> lock(slot_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
        return false;
    }
    listeners_.push_back(listener);
    syslog(LOG_DEBUG, "Added device listener: %zu registered", listeners_.size());
    return true;
}

bool SessionRegistry::remove_listener(const ListenerPtr& listener) {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    syslog(LOG_DEBUG, "Removed device listener: %zu registered", listeners_.size());
    return true;
}

size_t SessionRegistry::listener_count() const {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return listeners_.size();
}

} // namespace TvBridge
