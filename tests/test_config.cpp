// tests/test_config.cpp
#include <gtest/gtest.h>

#include <syslog.h>
#include <optional>
#include <sstream>
#include <string>
#include "bridge_config.h"
#include "test_helpers.h"

using namespace TvBridge;
using TvBridgeTest::TempDir;
using TvBridgeTest::write_text;

TEST(BridgeConfig, DefaultsMatchShippedValues) {
    BridgeConfig config;
    EXPECT_EQ(config.binary_name, "adb");
    EXPECT_EQ(config.bridge_subdir, "adb");
    EXPECT_EQ(config.staging_prefix, "/tmp/tvbridge_");
    EXPECT_EQ(config.log_stdout_lines, 10);
    EXPECT_EQ(config.log_stderr_lines, 5);
    EXPECT_EQ(config.default_timeout_ms, 30000);
    EXPECT_EQ(config.devices_timeout_ms, 10000);
    EXPECT_EQ(config.shell_timeout_ms, 5000);
    EXPECT_EQ(config.install_timeout_ms, 60000);
    EXPECT_EQ(config.screencap_timeout_ms, 10000);
    EXPECT_FALSE(config.install_force);
    EXPECT_EQ(config.screencap_output_dir, "screenshots");
}

TEST(BridgeConfig, MissingFileKeepsDefaults) {
    TempDir dir;
    BridgeConfig config;
    EXPECT_FALSE(config.load_from_file((dir.path() / "absent").string()));
    EXPECT_EQ(config.install_timeout_ms, 60000);
}

TEST(BridgeConfig, LoadsJson) {
    TempDir dir;
    auto path = dir.path() / "config";
    write_text(path, R"({
        "logging": {"level": "debug", "stderr": true},
        "bridge": {"binary_name": "adb-tv", "bundle_dir": "/opt/tv", "log_stdout_lines": 3},
        "timeouts": {"install_ms": 120000, "shell_ms": 2500},
        "install": {"force": true},
        "screencap": {"output_dir": "/srv/shots"}
    })");

    BridgeConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.log_level, LOG_DEBUG);
    EXPECT_TRUE(config.log_to_stderr);
    EXPECT_EQ(config.binary_name, "adb-tv");
    EXPECT_EQ(config.bundle_dir, "/opt/tv");
    EXPECT_EQ(config.log_stdout_lines, 3);
    EXPECT_EQ(config.install_timeout_ms, 120000);
    EXPECT_EQ(config.shell_timeout_ms, 2500);
    EXPECT_TRUE(config.install_force);
    EXPECT_FALSE(config.install_downgrade);
    EXPECT_EQ(config.screencap_output_dir, "/srv/shots");
}

TEST(BridgeConfig, LoadsKeyValueWithComments) {
    TempDir dir;
    auto path = dir.path() / "config";
    write_text(path,
               "# tvbridge\n"
               "; legacy comment\n"
               "logging.level = warning\n"
               "bridge.staging_prefix = /var/tmp/tvb_\n"
               "timeouts.connect_ms = 15000\n"
               "install.downgrade = yes\n");

    BridgeConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.log_level, LOG_WARNING);
    EXPECT_EQ(config.staging_prefix, "/var/tmp/tvb_");
    EXPECT_EQ(config.connect_timeout_ms, 15000);
    EXPECT_TRUE(config.install_downgrade);
}

TEST(BridgeConfig, NonPositiveTimeoutsFallBackToDefaults) {
    TempDir dir;
    auto path = dir.path() / "config";
    write_text(path, R"({"timeouts": {"devices_ms": 0, "screencap_ms": -5, "version_ms": 700}})");

    BridgeConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.devices_timeout_ms, 10000);
    EXPECT_EQ(config.screencap_timeout_ms, 10000);
    EXPECT_EQ(config.version_timeout_ms, 700);
}

TEST(BridgeConfig, RejectsBinaryNameWithPath) {
    TempDir dir;
    auto path = dir.path() / "config";
    write_text(path, "bridge.binary_name = ../evil/adb\nbridge.log_stderr_lines = -2\n");

    BridgeConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.binary_name, "adb");
    EXPECT_EQ(config.log_stderr_lines, 0);
}

TEST(BridgeConfig, WrongJsonTypeKeepsDefaults) {
    TempDir dir;
    auto path = dir.path() / "config";
    write_text(path, R"({"timeouts": {"install_ms": "soon"}})");

    BridgeConfig config;
    // Valid JSON but unusable, and not key=value either
    EXPECT_FALSE(config.load_from_file(path.string()));
    EXPECT_EQ(config.install_timeout_ms, 60000);
}

TEST(BridgeConfig, PartiallyValidJsonChangesNothing) {
    TempDir dir;
    auto path = dir.path() / "config";
    // The negative timeout is read before the bad type aborts the load
    write_text(path, R"({"bridge": {"binary_name": "adb-tv"},
                         "timeouts": {"default_ms": -5, "install_ms": "soon"}})");

    BridgeConfig config;
    EXPECT_FALSE(config.load_from_file(path.string()));
    EXPECT_EQ(config.default_timeout_ms, 30000);
    EXPECT_EQ(config.install_timeout_ms, 60000);
    EXPECT_EQ(config.binary_name, "adb");
}

TEST(BridgeConfig, FailedLoadKeepsEarlierConfiguration) {
    TempDir dir;
    auto good = dir.path() / "good";
    auto bad = dir.path() / "bad";
    write_text(good, R"({"timeouts": {"shell_ms": 2500}})");
    write_text(bad, R"({"timeouts": {"shell_ms": 0, "devices_ms": [1]}})");

    BridgeConfig config;
    ASSERT_TRUE(config.load_from_file(good.string()));
    EXPECT_FALSE(config.load_from_file(bad.string()));
    EXPECT_EQ(config.shell_timeout_ms, 2500);
    EXPECT_EQ(config.devices_timeout_ms, 10000);
}

TEST(BridgeConfig, MalformedKeyValueEntriesAreSkipped) {
    TempDir dir;
    auto path = dir.path() / "config";
    write_text(path,
               "timeouts.shell_ms = fast
"
               "timeouts.devices_ms = 4000
"
               "install.force = maybe
"
               "not a setting
");

    BridgeConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.shell_timeout_ms, 5000);
    EXPECT_EQ(config.devices_timeout_ms, 4000);
    EXPECT_FALSE(config.install_force);
    EXPECT_EQ(config.log_level, LOG_INFO);
}

TEST(SimpleConfigParser, TypedReadsOnlyOverwriteValidValues) {
    std::istringstream in("timeouts.shell_ms = fast
"
                          "timeouts.connect_ms = 1500
"
                          "logging.stderr = off
"
                          "# commented = 1
");
    SimpleConfigParser parser;
    parser.parse(in);

    int shell = 5000;
    int connect = 10000;
    bool to_stderr = true;
    std::string missing = "kept";
    parser.read("timeouts.shell_ms", shell);
    parser.read("timeouts.connect_ms", connect);
    parser.read("logging.stderr", to_stderr);
    parser.read("absent", missing);

    EXPECT_EQ(shell, 5000);
    EXPECT_EQ(connect, 1500);
    EXPECT_FALSE(to_stderr);
    EXPECT_EQ(missing, "kept");
    EXPECT_EQ(parser.lookup("timeouts.shell_ms"), std::optional<std::string>("fast"));
    EXPECT_FALSE(parser.lookup("commented").has_value());
}

TEST(ParseLogLevel, UnknownNameKeepsFallback) {
    EXPECT_EQ(parse_log_level("error", LOG_INFO), LOG_ERR);
    EXPECT_EQ(parse_log_level("verbose", LOG_INFO), LOG_INFO);
}
