// src/device_scan_task.cpp
#include "device_scan_task.h"

#include <syslog.h>
#include <algorithm>
#include "bridge_protocol.h"
#include "package_ops.h"

namespace TvBridge {

ScanReport DeviceScanTask::execute(const CancelToken& cancel) {
    ScanReport report;

    auto result = executor_.run(Protocol::devices(), options_.devices_timeout,
                                OutputMode::TEXT, &cancel);
    if (!result.success) {
        report.error = result.describe();
        syslog(LOG_WARNING, "Device scan failed: %s", report.error.c_str());
        return report;
    }

    for (const auto& entry : Protocol::parse_devices(result.text_out())) {
        DeviceInfo info = Protocol::to_device_info(entry);

        if (options_.fetch_names && info.status == DeviceStatus::CONNECTED &&
            !cancel.is_cancelled()) {
            read_identity(executor_, info, options_.shell_timeout, &cancel);
        }
        report.devices.push_back(info);
    }

    if (cancel.is_cancelled()) {
        report.error = "cancelled";
        return report;
    }

    report.success = true;
    syslog(LOG_INFO, "Device scan found %zu devices", report.devices.size());

    cross_check_usb(report);
    refresh_active(report);
    return report;
}

void DeviceScanTask::cross_check_usb(ScanReport& report) const {
    if (!usb_source_ || !usb_source_->available()) return;

    for (const auto& usb : usb_source_->scan()) {
        if (usb.serial.empty()) continue;

        bool listed = std::any_of(report.devices.begin(), report.devices.end(),
                                  [&](const DeviceInfo& d) { return d.serial == usb.serial; });
        if (!listed) {
            syslog(LOG_WARNING, "USB device %s (%s) exposes the bridge interface but is not listed;"
                   " check authorization on the device", usb.serial.c_str(), usb.usb_id().c_str());
            report.unlisted_usb.push_back(usb.serial);
        }
    }
}

void DeviceScanTask::refresh_active(const ScanReport& report) {
    auto active = registry_.get();
    if (!active) return;

    auto it = std::find_if(report.devices.begin(), report.devices.end(),
                           [&](const DeviceInfo& d) { return d.serial == active->serial; });

    DeviceInfo updated = *active;
    if (it == report.devices.end()) {
        if (active->status == DeviceStatus::DISCONNECTED) return;
        updated.status = DeviceStatus::DISCONNECTED;
        updated.bridge_state.clear();
    } else {
        if (it->status == active->status) return;
        updated.status = it->status;
        updated.bridge_state = it->bridge_state;
        if (it->name) updated.name = it->name;
        if (it->model) updated.model = it->model;
    }

    if (registry_.set_if_active(active->serial, updated)) {
        syslog(LOG_INFO, "Active device %s is now %s", updated.serial.c_str(),
               to_string(updated.status));
    }
}

} // namespace TvBridge
