// tests/test_worker_tasks.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "device_scan_task.h"
#include "file_digest.h"
#include "install_task.h"
#include "screenshot_task.h"
#include "session_registry.h"
#include "test_helpers.h"
#include "worker_task.h"

using namespace TvBridge;
using TvBridgeTest::FakeBridge;
using TvBridgeTest::FakeUsbSource;
using TvBridgeTest::usb_interface;
using TvBridgeTest::read_text;
using TvBridgeTest::write_text;
using namespace std::chrono_literals;

namespace {

const char* SCAN_BRIDGE = R"(
case "$*" in
  "devices") printf '* daemon started successfully\nList of devices attached\n192.168.1.20:5555\tdevice\nR58M123ABC\toffline\n\n' ;;
  *"192.168.1.20:5555 shell getprop ro.product.model"*) echo "BRAVIA 4K VH2" ;;
  *"192.168.1.20:5555 shell getprop ro.product.brand"*) echo "Sony" ;;
  *) exit 1 ;;
esac
)";

DeviceScanTask::Options scan_options() {
    DeviceScanTask::Options options;
    options.devices_timeout = 5s;
    options.shell_timeout = 5s;
    return options;
}

class CountingTask final : public WorkerTask<int> {
protected:
    int execute(const CancelToken&) override { return 42; }

public:
    CountingTask() : WorkerTask("counting") {}
    ~CountingTask() override { stop(); }
};

class FailingTask final : public WorkerTask<int> {
protected:
    int execute(const CancelToken&) override { throw std::runtime_error("body failed"); }

public:
    FailingTask() : WorkerTask("failing") {}
    ~FailingTask() override { stop(); }
};

}  // namespace

// =============================================================================
// WORKER TASK CONTRACT
// =============================================================================

TEST(WorkerTask, DeliversResultThroughFuture) {
    CountingTask task;
    auto future = task.start();
    EXPECT_EQ(future.get(), 42);
    task.stop();
    EXPECT_FALSE(task.is_running());
}

TEST(WorkerTask, StartingTwiceIsRejected) {
    CountingTask task;
    auto future = task.start();
    EXPECT_THROW(task.start(), std::logic_error);
    future.get();
}

TEST(WorkerTask, BodyExceptionArrivesThroughFuture) {
    FailingTask task;
    auto future = task.start();
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerTask, StopWithoutStartIsHarmless) {
    CountingTask task;
    task.stop();
    EXPECT_TRUE(task.is_cancelled());
}

// =============================================================================
// DEVICE SCAN
// =============================================================================

TEST(DeviceScanTask, ListsDevicesWithNames) {
    FakeBridge bridge(SCAN_BRIDGE);
    SessionRegistry registry;
    DeviceScanTask task(bridge.executor(), registry, nullptr, scan_options());

    ScanReport report = task.start().get();
    ASSERT_TRUE(report.success) << report.error;
    ASSERT_EQ(report.devices.size(), 2u);

    const DeviceInfo& tv = report.devices[0];
    EXPECT_EQ(tv.serial, "192.168.1.20:5555");
    EXPECT_EQ(tv.status, DeviceStatus::CONNECTED);
    EXPECT_EQ(tv.transport, Transport::NETWORK);
    EXPECT_EQ(tv.name, std::optional<std::string>("Sony BRAVIA 4K VH2"));
    EXPECT_EQ(tv.model, std::optional<std::string>("BRAVIA 4K VH2"));

    // Offline devices are not queried
    const DeviceInfo& offline = report.devices[1];
    EXPECT_EQ(offline.status, DeviceStatus::DISCONNECTED);
    EXPECT_FALSE(offline.name.has_value());
    for (const auto& call : bridge.calls()) {
        EXPECT_EQ(call.find("R58M123ABC shell"), std::string::npos) << call;
    }
}

TEST(DeviceScanTask, FailedListingIsReported) {
    FakeBridge bridge("echo 'cannot connect to daemon' >&2\nexit 1");
    SessionRegistry registry;
    DeviceScanTask task(bridge.executor(), registry, nullptr, scan_options());

    ScanReport report = task.start().get();
    EXPECT_FALSE(report.success);
    EXPECT_NE(report.error.find("cannot connect to daemon"), std::string::npos);
    EXPECT_TRUE(report.devices.empty());
}

TEST(DeviceScanTask, ReportsUsbDevicesTheBridgeDoesNotList) {
    FakeBridge bridge(SCAN_BRIDGE);
    SessionRegistry registry;
    FakeUsbSource usb({usb_interface("R58M123ABC", 1, 4),
                       usb_interface("HT9000", 1, 7),
                       usb_interface("", 2, 3)});
    DeviceScanTask task(bridge.executor(), registry, &usb, scan_options());

    ScanReport report = task.start().get();
    ASSERT_TRUE(report.success) << report.error;
    EXPECT_EQ(report.unlisted_usb, (std::vector<std::string>{"HT9000"}));
}

TEST(DeviceScanTask, UnavailableUsbSourceSkipsCrossCheck) {
    FakeBridge bridge(SCAN_BRIDGE);
    SessionRegistry registry;
    FakeUsbSource usb = FakeUsbSource::unavailable("LIBUSB_ERROR_ACCESS");
    DeviceScanTask task(bridge.executor(), registry, &usb, scan_options());

    ScanReport report = task.start().get();
    ASSERT_TRUE(report.success) << report.error;
    EXPECT_EQ(report.devices.size(), 2u);
    EXPECT_TRUE(report.unlisted_usb.empty());
}

TEST(DeviceScanTask, RefreshesActiveDeviceStatus) {
    FakeBridge bridge(SCAN_BRIDGE);
    SessionRegistry registry;
    registry.set(DeviceInfo("R58M123ABC", DeviceStatus::CONNECTED));
    auto listener = std::make_shared<TvBridgeTest::RecordingStatusListener>();
    registry.add_listener(listener);

    DeviceScanTask task(bridge.executor(), registry, nullptr, scan_options());
    task.start().get();

    ASSERT_TRUE(registry.get().has_value());
    EXPECT_EQ(registry.get()->status, DeviceStatus::DISCONNECTED);
    EXPECT_EQ(registry.get()->bridge_state, "offline");
    EXPECT_EQ(listener->statuses(), (std::vector<DeviceStatus>{DeviceStatus::DISCONNECTED}));
}

TEST(DeviceScanTask, MissingActiveDeviceBecomesDisconnected) {
    FakeBridge bridge(SCAN_BRIDGE);
    SessionRegistry registry;
    registry.set(DeviceInfo("10.9.9.9:5555", DeviceStatus::CONNECTED));

    DeviceScanTask task(bridge.executor(), registry, nullptr, scan_options());
    task.start().get();

    EXPECT_EQ(registry.get()->serial, "10.9.9.9:5555");
    EXPECT_EQ(registry.get()->status, DeviceStatus::DISCONNECTED);
}

TEST(DeviceScanTask, UnchangedActiveDeviceIsNotRepublished) {
    FakeBridge bridge(SCAN_BRIDGE);
    SessionRegistry registry;
    registry.set(DeviceInfo("192.168.1.20:5555", DeviceStatus::CONNECTED));
    auto listener = std::make_shared<TvBridgeTest::RecordingStatusListener>();
    registry.add_listener(listener);

    DeviceScanTask task(bridge.executor(), registry, nullptr, scan_options());
    task.start().get();
    EXPECT_TRUE(listener->statuses().empty());
}

TEST(DeviceScanTask, StopCancelsRunningListing) {
    FakeBridge bridge("echo $$ > \"@DIR@/pid\"\nexec sleep 30");
    SessionRegistry registry;
    DeviceScanTask::Options options = scan_options();
    options.devices_timeout = 30s;
    DeviceScanTask task(bridge.executor(), registry, nullptr, options);

    auto started = std::chrono::steady_clock::now();
    auto future = task.start();
    ASSERT_TRUE(TvBridgeTest::wait_for_file(bridge.dir() / "pid"));
    task.stop();
    ScanReport report = future.get();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.error, "cancelled");
}

// =============================================================================
// INSTALL
// =============================================================================

TEST(InstallTask, InstallsEachPackageAndReports) {
    FakeBridge bridge(R"(
case "$*" in
  *"install -r "*good.apk) printf 'Performing Streamed Install\nSuccess\n' ;;
  *"install -r "*old.apk) echo "Failure [INSTALL_FAILED_VERSION_DOWNGRADE]" ;;
  *) exit 1 ;;
esac
)");
    write_text(bridge.dir() / "good.apk", "PK-good");
    write_text(bridge.dir() / "old.apk", "PK-old");

    std::vector<std::string> paths = {
        (bridge.dir() / "good.apk").string(),
        (bridge.dir() / "old.apk").string(),
        (bridge.dir() / "absent.apk").string(),
    };

    std::vector<std::string> progress;
    InstallTask task(bridge.executor(), "tv:5555", paths, Protocol::InstallOptions{}, 5s,
                     [&](size_t done, size_t total, const std::string& message) {
                         progress.push_back(std::to_string(done) + "/" + std::to_string(total) +
                                            " " + message);
                     });

    InstallReport report = task.start().get();
    ASSERT_EQ(report.items.size(), 3u);
    EXPECT_EQ(report.requested, 3u);
    EXPECT_EQ(report.succeeded(), 1u);
    EXPECT_FALSE(report.all_succeeded());
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(report.summary(), "1/3 installed");

    EXPECT_TRUE(report.items[0].success);
    EXPECT_EQ(report.items[0].sha256, sha256_file(paths[0]));
    EXPECT_EQ(report.items[1].message, "Failure [INSTALL_FAILED_VERSION_DOWNGRADE]");
    EXPECT_FALSE(report.items[2].success);
    EXPECT_EQ(report.items[2].message, "file not found");

    // The missing file never reaches the bridge
    EXPECT_EQ(bridge.calls().size(), 2u);

    ASSERT_EQ(progress.size(), 4u);
    EXPECT_EQ(progress[0], "0/3 Installing 1/3: good.apk");
    EXPECT_EQ(progress[3], "3/3 1/3 installed");

    auto json = report.to_json();
    EXPECT_EQ(json["succeeded"], 1);
    EXPECT_EQ(json["items"].size(), 3u);
}

TEST(InstallTask, PassesInstallFlags) {
    FakeBridge bridge("echo Success");
    write_text(bridge.dir() / "a.apk", "PK");

    Protocol::InstallOptions options;
    options.force = true;
    options.downgrade = true;
    InstallTask task(bridge.executor(), "tv:5555", {(bridge.dir() / "a.apk").string()}, options, 5s);

    InstallReport report = task.start().get();
    EXPECT_TRUE(report.all_succeeded());
    ASSERT_EQ(bridge.calls().size(), 1u);
    EXPECT_EQ(bridge.calls()[0], "-s tv:5555 install -r -f -d " + (bridge.dir() / "a.apk").string());
}

TEST(InstallTask, CancellationStopsBatch) {
    FakeBridge bridge("echo $$ > \"@DIR@/pid\"\nexec sleep 30");
    write_text(bridge.dir() / "a.apk", "PK-a");
    write_text(bridge.dir() / "b.apk", "PK-b");

    InstallTask task(bridge.executor(), "tv:5555",
                     {(bridge.dir() / "a.apk").string(), (bridge.dir() / "b.apk").string()},
                     Protocol::InstallOptions{}, 60s);

    auto started = std::chrono::steady_clock::now();
    auto future = task.start();
    ASSERT_TRUE(TvBridgeTest::wait_for_file(bridge.dir() / "pid"));
    task.stop();
    InstallReport report = future.get();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
    EXPECT_TRUE(report.cancelled);
    ASSERT_EQ(report.items.size(), 1u);
    EXPECT_EQ(report.items[0].message, "cancelled");
    EXPECT_EQ(bridge.calls().size(), 1u);
    EXPECT_EQ(report.summary(), "0/2 installed, cancelled");
}

// =============================================================================
// SCREENSHOT
// =============================================================================

TEST(ScreenshotTask, StripsNoiseBeforePng) {
    FakeBridge bridge("printf 'WARN:\\211PNG\\r\\n\\032\\nIHDR\\000\\001'");
    TvBridgeTest::TempDir out;
    std::string path = (out.path() / "shots" / "tv.png").string();

    ScreenshotTask task(bridge.executor(), "tv:5555", 5s, path);
    ScreenshotResult shot = task.start().get();

    ASSERT_TRUE(shot.success) << shot.error;
    EXPECT_EQ(shot.skipped_bytes, 5u);
    ASSERT_EQ(shot.png.size(), 14u);
    EXPECT_EQ(shot.png[0], 0x89);
    EXPECT_EQ(shot.png[13], 0x01);
    EXPECT_EQ(shot.saved_path, path);

    std::string saved = read_text(path);
    EXPECT_EQ(Bytes(saved.begin(), saved.end()), shot.png);
    EXPECT_EQ(bridge.calls()[0], "-s tv:5555 exec-out screencap -p");
}

TEST(ScreenshotTask, NoSignatureIsFailure) {
    FakeBridge bridge("printf 'error: closed'");
    ScreenshotTask task(bridge.executor(), "tv:5555", 5s);

    ScreenshotResult shot = task.start().get();
    EXPECT_FALSE(shot.success);
    EXPECT_EQ(shot.error, "no PNG signature in 13 bytes of output");
    EXPECT_TRUE(shot.png.empty());
}

TEST(ScreenshotTask, BridgeFailureIsReported) {
    FakeBridge bridge("echo 'error: device offline' >&2\nexit 1");
    ScreenshotTask task(bridge.executor(), "tv:5555", 5s);

    ScreenshotResult shot = task.start().get();
    EXPECT_FALSE(shot.success);
    EXPECT_EQ(shot.error, "exit code 1");
}

TEST(ScreenshotTask, DefaultPathIsFilesystemSafe) {
    std::string path = default_screenshot_path("screenshots", "10.0.0.5:5555");
    EXPECT_EQ(path.rfind("screenshots/screenshot_10.0.0.5_5555_", 0), 0u);
    EXPECT_EQ(path.substr(path.size() - 4), ".png");
}
