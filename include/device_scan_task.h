// include/device_scan_task.h
// Background `devices` listing with name lookup and active-device refresh

#ifndef DEVICE_SCAN_TASK_H
#define DEVICE_SCAN_TASK_H

#include <chrono>
#include <string>
#include <vector>
#include "command_executor.h"
#include "device_info.h"
#include "session_registry.h"
#include "usb_probe.h"
#include "worker_task.h"

namespace TvBridge {

struct ScanReport {
    bool success = false;
    std::string error;
    std::vector<DeviceInfo> devices;
    // Bridge-capable USB serials the bridge did not list (unauthorized, no driver)
    std::vector<std::string> unlisted_usb;
};

class DeviceScanTask final : public WorkerTask<ScanReport> {
public:
    struct Options {
        std::chrono::milliseconds devices_timeout{10000};
        std::chrono::milliseconds shell_timeout{5000};
        bool fetch_names = true;
    };

private:
    const CommandExecutor& executor_;
    SessionRegistry& registry_;
    const UsbInterfaceSource* usb_source_;
    Options options_;

    void cross_check_usb(ScanReport& report) const;
    void refresh_active(const ScanReport& report);

protected:
    ScanReport execute(const CancelToken& cancel) override;

public:
    // usb_source may be null; the USB cross-check is then skipped
    DeviceScanTask(const CommandExecutor& executor, SessionRegistry& registry,
                   const UsbInterfaceSource* usb_source, Options options)
        : WorkerTask("device-scan"), executor_(executor), registry_(registry),
          usb_source_(usb_source), options_(options) {}

    ~DeviceScanTask() override {
        stop();
    }
};

} // namespace TvBridge

#endif // DEVICE_SCAN_TASK_H
