/*
 * test_bridge_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <fstream>
#include <map>

#include "config/bridge_config.hpp"
#include "device/common/bridge_exceptions.hpp"
#include "support/test_doubles.hpp"

using namespace skybridge::config;
using skybridge::device::InvalidParameterException;
using skybridge::tests::TempDir;

namespace {

auto envFrom(std::map<std::string, std::string> values) -> EnvLookup {
    return [values = std::move(values)](const std::string& name)
               -> std::optional<std::string> {
        if (auto it = values.find(name); it != values.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}

}  // namespace

// ==================== Defaults ====================

TEST(BridgeConfigTest, Defaults) {
    BridgeConfig config;

    EXPECT_DOUBLE_EQ(config.discovery.timeoutSeconds, 5.0);
    EXPECT_FALSE(config.discovery.skipUdp);
    ASSERT_EQ(config.discovery.knownDevices.size(), 1u);
    EXPECT_EQ(config.discovery.knownDevices[0].host, "localhost");
    EXPECT_EQ(config.discovery.knownDevices[0].port, 5555);
    EXPECT_EQ(config.discovery.knownDevices[0].name, "seestar_alp");
    EXPECT_TRUE(config.discovery.simulatorDevices.empty());

    EXPECT_EQ(config.retry.maxAttempts, 3);
    EXPECT_EQ(config.events.bufferSize, 100u);
    EXPECT_EQ(config.events.bridgeQueueSize, 1000u);
    EXPECT_EQ(config.events.ssePort, 7556);
    EXPECT_EQ(config.persistence.staleAfterDays, 30);
    EXPECT_EQ(config.persistence.stateFile.filename(), "devices.json");
}

TEST(RetryConfigTest, ExponentialDelayIsCapped) {
    RetryConfig retry;

    EXPECT_EQ(retry.delayFor(1), std::chrono::milliseconds(2000));
    EXPECT_EQ(retry.delayFor(2), std::chrono::milliseconds(4000));
    EXPECT_EQ(retry.delayFor(3), std::chrono::milliseconds(8000));
    EXPECT_EQ(retry.delayFor(4), std::chrono::milliseconds(10000));
    EXPECT_EQ(retry.delayFor(10), std::chrono::milliseconds(10000));
}

// ==================== List Parsing ====================

TEST(EndpointListTest, ParsesHostPortAndName) {
    auto endpoints =
        parseEndpointList("localhost:4700:Simulator, 10.0.0.2:11111");

    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_EQ(endpoints[0].host, "localhost");
    EXPECT_EQ(endpoints[0].port, 4700);
    EXPECT_EQ(endpoints[0].name, "Simulator");
    EXPECT_EQ(endpoints[1].host, "10.0.0.2");
    EXPECT_EQ(endpoints[1].port, 11111);
    EXPECT_EQ(endpoints[1].name, "10.0.0.2:11111");
}

TEST(EndpointListTest, SkipsMalformedEntries) {
    auto endpoints = parseEndpointList("nohost,host:notaport,host:70000,,ok:1");

    ASSERT_EQ(endpoints.size(), 1u);
    EXPECT_EQ(endpoints[0].host, "ok");
    EXPECT_EQ(endpoints[0].port, 1);
}

TEST(DirectDeviceListTest, AcceptsBothEntryForms) {
    auto devices = parseDirectDeviceList(
        "telescope_1@192.168.1.50:5555:Seestar S50,"
        "telescope_99:localhost:4700:Simulator");

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "telescope_1");
    EXPECT_EQ(devices[0].host, "192.168.1.50");
    EXPECT_EQ(devices[0].port, 5555);
    EXPECT_EQ(devices[0].name, "Seestar S50");
    EXPECT_EQ(devices[1].id, "telescope_99");
    EXPECT_EQ(devices[1].host, "localhost");
    EXPECT_EQ(devices[1].port, 4700);
    EXPECT_EQ(devices[1].name, "Simulator");
}

TEST(DirectDeviceListTest, SkipsEntriesWithoutId) {
    auto devices = parseDirectDeviceList("@host:1,camera_1@host:2");

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "camera_1");
}

// ==================== Environment ====================

TEST(BridgeConfigTest, EnvironmentOverridesDefaults) {
    BridgeConfig config;
    config.applyEnvironment(envFrom({
        {"ASCOM_DISCOVERY_TIMEOUT", "2.5"},
        {"ASCOM_SKIP_UDP", "true"},
        {"ASCOM_KNOWN_DEVICES", "seestar.local:5555:Seestar"},
        {"ASCOM_SIMULATOR_DEVICES", "localhost:4700:Simulator"},
        {"ASCOM_DIRECT_DEVICES", "telescope_1@10.0.0.5:5555"},
        {"ASCOM_STATE_FILE", "/tmp/skybridge-state.json"},
        {"ASCOM_LOG_LEVEL", "debug"},
    }));

    EXPECT_DOUBLE_EQ(config.discovery.timeoutSeconds, 2.5);
    EXPECT_TRUE(config.discovery.skipUdp);
    ASSERT_EQ(config.discovery.knownDevices.size(), 1u);
    EXPECT_EQ(config.discovery.knownDevices[0].host, "seestar.local");
    ASSERT_EQ(config.discovery.simulatorDevices.size(), 1u);
    EXPECT_EQ(config.discovery.simulatorDevices[0].port, 4700);
    ASSERT_EQ(config.discovery.directDevices.size(), 1u);
    EXPECT_EQ(config.discovery.directDevices[0].id, "telescope_1");
    EXPECT_EQ(config.persistence.stateFile,
              std::filesystem::path("/tmp/skybridge-state.json"));
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(BridgeConfigTest, MalformedScalarsKeepDefaults) {
    BridgeConfig config;
    config.applyEnvironment(envFrom({
        {"ASCOM_DISCOVERY_TIMEOUT", "soon"},
        {"ASCOM_SKIP_UDP", "maybe"},
        {"ASCOM_LOG_LEVEL", "loud"},
    }));

    EXPECT_DOUBLE_EQ(config.discovery.timeoutSeconds, 5.0);
    EXPECT_FALSE(config.discovery.skipUdp);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(BridgeConfigTest, TimeoutIsClamped) {
    BridgeConfig low;
    low.applyEnvironment(envFrom({{"ASCOM_DISCOVERY_TIMEOUT", "0.01"}}));
    EXPECT_DOUBLE_EQ(low.discovery.timeoutSeconds, DiscoveryConfig::MIN_TIMEOUT);

    BridgeConfig high;
    high.applyEnvironment(envFrom({{"ASCOM_DISCOVERY_TIMEOUT", "600"}}));
    EXPECT_DOUBLE_EQ(high.discovery.timeoutSeconds,
                     DiscoveryConfig::MAX_TIMEOUT);
}

// ==================== File Loading ====================

TEST(BridgeConfigTest, FileOverlaysOnlyGivenKeys) {
    TempDir dir;
    auto path = dir.file("config.json");
    std::ofstream(path) << R"({
        "discovery": {"skipUdp": true, "knownDevices": []},
        "retry": {"maxAttempts": 5},
        "events": {"bufferSize": 10}
    })";

    BridgeConfig config;
    config.loadFile(path);

    EXPECT_TRUE(config.discovery.skipUdp);
    EXPECT_TRUE(config.discovery.knownDevices.empty());
    EXPECT_DOUBLE_EQ(config.discovery.timeoutSeconds, 5.0);
    EXPECT_EQ(config.retry.maxAttempts, 5);
    EXPECT_EQ(config.retry.initialDelayMs, 2000u);
    EXPECT_EQ(config.events.bufferSize, 10u);
    EXPECT_EQ(config.events.ssePort, 7556);
}

TEST(BridgeConfigTest, MissingFileThrows) {
    TempDir dir;
    BridgeConfig config;
    EXPECT_THROW(config.loadFile(dir.file("absent.json")),
                 InvalidParameterException);
}

TEST(BridgeConfigTest, MalformedFileThrows) {
    TempDir dir;
    auto path = dir.file("broken.json");
    std::ofstream(path) << "{ not json";

    BridgeConfig config;
    EXPECT_THROW(config.loadFile(path), InvalidParameterException);

    std::ofstream(path) << "[1, 2, 3]";
    EXPECT_THROW(config.loadFile(path), InvalidParameterException);
}

TEST(BridgeConfigTest, JsonRoundTripKeepsDevices) {
    BridgeConfig config;
    config.discovery.simulatorDevices = {{"localhost", 4700, "Simulator"}};
    config.discovery.directDevices = {{"camera_1", "10.0.0.7", 11111, "Cam"}};

    auto restored = BridgeConfig::fromJson(config.toJson());

    EXPECT_EQ(restored.discovery.simulatorDevices,
              config.discovery.simulatorDevices);
    EXPECT_EQ(restored.discovery.directDevices,
              config.discovery.directDevices);
}
