// src/usb_probe.cpp
#include "usb_probe.h"

#include <syslog.h>

namespace TvBridge {

UsbProbe::UsbProbe() {
    int rc = libusb_init(&ctx_);
    if (rc < 0) {
        init_error_ = libusb_error_name(rc);
        ctx_ = nullptr;
        syslog(LOG_WARNING, "libusb init failed: %s", init_error_.c_str());
    }
}

UsbProbe::~UsbProbe() {
    if (ctx_) {
        libusb_exit(ctx_);
    }
}

std::vector<UsbBridgeInterface> UsbProbe::scan() const {
    std::vector<UsbBridgeInterface> found;
    if (!ctx_) return found;

    libusb_device** device_list = nullptr;
    ssize_t count = libusb_get_device_list(ctx_, &device_list);
    if (count < 0) {
        syslog(LOG_ERR, "Failed to get USB device list: %s", libusb_error_name((int)count));
        return found;
    }

    syslog(LOG_DEBUG, "Scanning %zd USB devices for bridge interfaces", count);

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device* device = device_list[i];
        struct libusb_device_descriptor desc;

        int result = libusb_get_device_descriptor(device, &desc);
        if (result != LIBUSB_SUCCESS) {
            syslog(LOG_WARNING, "Failed to get device descriptor: %s", libusb_error_name(result));
            continue;
        }

        libusb_config_descriptor* config = nullptr;
        if (libusb_get_active_config_descriptor(device, &config) != LIBUSB_SUCCESS) {
            continue;
        }

        int bridge_interface = -1;
        for (int j = 0; j < config->bNumInterfaces && bridge_interface < 0; ++j) {
            const struct libusb_interface* interface = &config->interface[j];
            for (int k = 0; k < interface->num_altsetting; ++k) {
                const struct libusb_interface_descriptor* alt = &interface->altsetting[k];
                if (is_bridge_interface(alt->bInterfaceClass, alt->bInterfaceSubClass,
                                        alt->bInterfaceProtocol)) {
                    bridge_interface = alt->bInterfaceNumber;
                    break;
                }
            }
        }
        libusb_free_config_descriptor(config);

        if (bridge_interface < 0) continue;

        UsbBridgeInterface entry;
        entry.bus = libusb_get_bus_number(device);
        entry.address = libusb_get_device_address(device);
        entry.vendor_id = desc.idVendor;
        entry.product_id = desc.idProduct;
        entry.interface_number = static_cast<uint8_t>(bridge_interface);

        // The serial is what the bridge lists; reading it needs an open handle
        libusb_device_handle* handle = nullptr;
        if (libusb_open(device, &handle) == LIBUSB_SUCCESS) {
            if (desc.iSerialNumber != 0) {
                unsigned char buffer[256];
                int n = libusb_get_string_descriptor_ascii(handle, desc.iSerialNumber,
                                                           buffer, sizeof(buffer));
                if (n > 0) {
                    entry.serial.assign(reinterpret_cast<const char*>(buffer),
                                        static_cast<size_t>(n));
                } else {
                    syslog(LOG_WARNING, "Cannot read serial of USB device %s: %s",
                           entry.usb_id().c_str(), libusb_error_name(n));
                }
            }
            libusb_close(handle);
        } else {
            syslog(LOG_WARNING, "Cannot open USB device %s (permission issue?)",
                   entry.usb_id().c_str());
        }

        syslog(LOG_INFO, "Bridge-capable USB device %s (VID:PID %04x:%04x) serial=%s",
               entry.usb_id().c_str(), desc.idVendor, desc.idProduct,
               entry.serial.empty() ? "?" : entry.serial.c_str());
        found.push_back(entry);
    }

    libusb_free_device_list(device_list, 1);
    syslog(LOG_DEBUG, "USB scan complete. Found %zu bridge interfaces", found.size());
    return found;
}

} // namespace TvBridge
