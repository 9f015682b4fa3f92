// include/usb_probe.h
// libusb enumeration of interfaces that speak the debug-bridge protocol

#ifndef USB_PROBE_H
#define USB_PROBE_H

#include <libusb-1.0/libusb.h>
#include <cstdint>
#include <string>
#include <vector>

namespace TvBridge {

struct UsbBridgeInterface {
    uint8_t bus = 0;
    uint8_t address = 0;
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    uint8_t interface_number = 0;
    std::string serial;   // empty when the device could not be opened

    // "bus:address", same form the bridge uses for usb: paths
    std::string usb_id() const {
        return std::to_string(bus) + ":" + std::to_string(address);
    }
};

/**
 * Anything that can enumerate bridge-capable USB interfaces
 */
class UsbInterfaceSource {
public:
    virtual ~UsbInterfaceSource() = default;

    virtual bool available() const = 0;
    // Why the source is unavailable; empty while available
    virtual const std::string& init_error() const = 0;
    virtual std::vector<UsbBridgeInterface> scan() const = 0;
};

/**
 * Owns a libusb context for the lifetime of the probe. A failed
 * libusb_init leaves the probe unavailable; scan() then returns nothing.
 */
class UsbProbe final : public UsbInterfaceSource {
public:
    static constexpr uint8_t BRIDGE_CLASS = 0xFF;
    static constexpr uint8_t BRIDGE_SUBCLASS = 0x42;
    static constexpr uint8_t BRIDGE_PROTOCOL = 0x01;

private:
    libusb_context* ctx_ = nullptr;
    std::string init_error_;

public:
    UsbProbe();
    ~UsbProbe() override;

    UsbProbe(const UsbProbe&) = delete;
    UsbProbe& operator=(const UsbProbe&) = delete;

    bool available() const override { return ctx_ != nullptr; }
    const std::string& init_error() const override { return init_error_; }

    std::vector<UsbBridgeInterface> scan() const override;
};

inline bool is_bridge_interface(uint8_t cls, uint8_t subclass, uint8_t protocol) {
    return cls == UsbProbe::BRIDGE_CLASS &&
           subclass == UsbProbe::BRIDGE_SUBCLASS &&
           protocol == UsbProbe::BRIDGE_PROTOCOL;
}

} // namespace TvBridge

#endif // USB_PROBE_H
