// include/session_registry.h
// Single active-device slot with synchronous change notification

#ifndef SESSION_REGISTRY_H
#define SESSION_REGISTRY_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "device_info.h"

namespace TvBridge {

/**
 * Receives active-device transitions. An empty optional means the slot was
 * cleared. Implementations must not call SessionRegistry::set/clear from
 * inside the callback.
 */
class DeviceListener {
public:
    virtual ~DeviceListener() = default;
    virtual void on_device_changed(const std::optional<DeviceInfo>& device) = 0;
};

/**
 * Adapts a plain callable to DeviceListener.
 */
class CallbackListener : public DeviceListener {
private:
    std::function<void(const std::optional<DeviceInfo>&)> callback_;

public:
    explicit CallbackListener(std::function<void(const std::optional<DeviceInfo>&)> callback)
        : callback_(std::move(callback)) {}

    void on_device_changed(const std::optional<DeviceInfo>& device) override {
        if (callback_) callback_(device);
    }
};

/**
 * Which device is active, shared between otherwise unrelated components.
 *
 * set() and clear() run their notification round while holding the round
 * lock, so concurrent writers are serialized and every listener observes the
 * same sequence. get() only takes the slot lock and never waits for a round.
 * The registry performs no bridge I/O.
 */
class SessionRegistry {
private:
    using ListenerPtr = std::shared_ptr<DeviceListener>;

    mutable std::mutex slot_mutex_;
    std::optional<DeviceInfo> active_;
    std::vector<ListenerPtr> listeners_;

    std::mutex round_mutex_;
    std::atomic<std::thread::id> notifying_thread_{};

    void ensure_not_notifying() const;
    void publish(std::optional<DeviceInfo> next);
    void run_round(const std::vector<ListenerPtr>& listeners,
                   const std::optional<DeviceInfo>& device);

public:
    SessionRegistry() = default;
    ~SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * Replace the active device and notify every listener in registration order.
     * @throws std::invalid_argument if device.serial is empty
     * @throws std::logic_error if called from inside a notification round
     */
    void set(const DeviceInfo& device);

    /**
     * Replace the active device only if its serial is still `serial`.
     * Lets a background worker refresh the device it observed without
     * overwriting a newer foreground selection.
     * @return false (and no notification) if the slot holds another device or is empty
     */
    bool set_if_active(const std::string& serial, const DeviceInfo& device);

    std::optional<DeviceInfo> get() const;

    /**
     * Empty the slot and notify every listener with an empty value, also when
     * the slot was already empty.
     * @throws std::logic_error if called from inside a notification round
     */
    void clear();

    bool has_active() const;

    // Returns false if the listener was already registered (or null)
    bool add_listener(const ListenerPtr& listener);

    // Returns false if the listener was not registered
    bool remove_listener(const ListenerPtr& listener);

    size_t listener_count() const;
};

} // namespace TvBridge

#endif // SESSION_REGISTRY_H
