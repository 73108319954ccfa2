/*
 * test_discovery_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

#include "device/discovery/discovery_engine.hpp"
#include "support/test_doubles.hpp"

using namespace skybridge::device;
using namespace skybridge::device::discovery;
using skybridge::config::DiscoveryConfig;
using skybridge::config::HostEndpoint;
using skybridge::tests::MockDiscoveryProbes;
using skybridge::tests::TempDir;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using namespace std::chrono_literals;

namespace {

auto makeDevice(const std::string& id, const std::string& host, int port,
                const std::string& name = "Device") -> DeviceDescriptor {
    DeviceDescriptor d;
    d.id = id;
    d.name = name;
    d.host = host;
    d.port = port;
    return d;
}

auto failure(ProbeError code, const std::string& message) -> ProbeFailure {
    return ProbeFailure{code, message};
}

/**
 * Probes whose broadcast blocks far longer than any discovery window
 */
class HangingBroadcastProbes : public DiscoveryProbes {
public:
    auto broadcast(std::chrono::milliseconds)
        -> std::expected<std::vector<AlpacaServer>, ProbeFailure> override {
        std::this_thread::sleep_for(3s);
        return std::vector<AlpacaServer>{{"10.0.0.99", 11111}};
    }

    auto configuredDevices(const std::string& host, int port,
                           std::chrono::milliseconds)
        -> std::expected<std::vector<DeviceDescriptor>, ProbeFailure> override {
        return std::vector<DeviceDescriptor>{
            makeDevice("telescope_1", host, port, "Known scope")};
    }

    auto tcpReachable(const std::string&, int, std::chrono::milliseconds)
        -> std::expected<void, ProbeFailure> override {
        return std::unexpected(failure(ProbeError::Refused, "refused"));
    }
};

}  // namespace

class DiscoveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        probes_ = std::make_shared<NiceMock<MockDiscoveryProbes>>();
        persistence_ =
            std::make_shared<StatePersistence>(dir_.file("devices.json"));
        config_.knownDevices.clear();
        config_.timeoutSeconds = 0.5;

        ON_CALL(*probes_, broadcast(_))
            .WillByDefault(Return(std::vector<AlpacaServer>{}));
        ON_CALL(*probes_, tcpReachable(_, _, _))
            .WillByDefault(Return(std::unexpected(
                failure(ProbeError::Refused, "connection refused"))));
    }

    auto makeEngine() -> std::unique_ptr<DiscoveryEngine> {
        return std::make_unique<DiscoveryEngine>(
            config_, probes_, table_, persistence_, 30,
            DiscoveryTimings{50ms, 50ms, 50ms});
    }

    TempDir dir_;
    DiscoveryConfig config_;
    DeviceTable table_;
    std::shared_ptr<NiceMock<MockDiscoveryProbes>> probes_;
    std::shared_ptr<StatePersistence> persistence_;
};

TEST_F(DiscoveryEngineTest, NoDevicesIsAnEmptySuccess) {
    auto engine = makeEngine();

    auto found = engine->discover();

    EXPECT_TRUE(found.empty());
    EXPECT_EQ(table_.size(), 0u);
}

TEST_F(DiscoveryEngineTest, ReachableSimulatorYieldsTelescope99) {
    config_.simulatorDevices = {{"localhost", 4700, "Simulator"}};
    EXPECT_CALL(*probes_, tcpReachable("localhost", 4700, _))
        .WillOnce(Return(std::expected<void, ProbeFailure>{}));

    auto found = makeEngine()->discover();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_TRUE(found[0].isSimulator);
    EXPECT_EQ(found[0].type, "Telescope");
    EXPECT_EQ(found[0].number, 99);
    EXPECT_EQ(found[0].id, "telescope_99");
    EXPECT_EQ(found[0].host, "localhost");
    EXPECT_EQ(found[0].port, 4700);
    EXPECT_EQ(found[0].uniqueId, "simulator_localhost_4700");
}

TEST_F(DiscoveryEngineTest, UnreachableSimulatorIsSkipped) {
    config_.simulatorDevices = {{"localhost", 4700, "Simulator"}};

    auto found = makeEngine()->discover();

    EXPECT_TRUE(found.empty());
}

TEST_F(DiscoveryEngineTest, UdpFailureDoesNotAffectOtherStrategies) {
    config_.knownDevices = {{"seestar.local", 5555, "seestar_alp"}};
    config_.simulatorDevices = {{"localhost", 4700, "Simulator"}};

    EXPECT_CALL(*probes_, broadcast(_))
        .WillOnce(Throw(std::runtime_error("socket exploded")));
    EXPECT_CALL(*probes_, configuredDevices("seestar.local", 5555, _))
        .WillOnce(Return(std::vector<DeviceDescriptor>{
            makeDevice("telescope_1", "seestar.local", 5555, "Seestar S50")}));
    EXPECT_CALL(*probes_, tcpReachable("localhost", 4700, _))
        .WillOnce(Return(std::expected<void, ProbeFailure>{}));

    std::vector<DeviceDescriptor> found;
    EXPECT_NO_THROW(found = makeEngine()->discover());

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].id, "telescope_1");
    EXPECT_EQ(found[1].id, "telescope_99");
}

TEST_F(DiscoveryEngineTest, UdpServersAreQueriedForDevices) {
    EXPECT_CALL(*probes_, broadcast(_))
        .WillOnce(Return(std::vector<AlpacaServer>{{"192.168.1.20", 11111}}));
    EXPECT_CALL(*probes_, configuredDevices("192.168.1.20", 11111, _))
        .WillOnce(Return(std::vector<DeviceDescriptor>{
            makeDevice("camera_0", "192.168.1.20", 11111, "ZWO"),
            makeDevice("focuser_0", "192.168.1.20", 11111, "EAF")}));

    auto found = makeEngine()->discover();

    ASSERT_EQ(found.size(), 2u);
    EXPECT_TRUE(table_.contains("camera_0"));
    EXPECT_TRUE(table_.contains("focuser_0"));
}

TEST_F(DiscoveryEngineTest, SkipUdpNeverBroadcasts) {
    config_.skipUdp = true;
    EXPECT_CALL(*probes_, broadcast(_)).Times(0);

    makeEngine()->discover();
}

TEST_F(DiscoveryEngineTest, FirstStrategyWinsForDuplicateIds) {
    config_.knownDevices = {{"known.local", 5555, "seestar_alp"}};

    EXPECT_CALL(*probes_, broadcast(_))
        .WillOnce(Return(std::vector<AlpacaServer>{{"udp.local", 11111}}));
    EXPECT_CALL(*probes_, configuredDevices("udp.local", 11111, _))
        .WillOnce(Return(std::vector<DeviceDescriptor>{
            makeDevice("telescope_1", "udp.local", 11111, "From UDP")}));
    EXPECT_CALL(*probes_, configuredDevices("known.local", 5555, _))
        .WillOnce(Return(std::vector<DeviceDescriptor>{
            makeDevice("telescope_1", "known.local", 5555, "From known")}));

    auto found = makeEngine()->discover();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(table_.find("telescope_1")->host, "udp.local");
}

TEST_F(DiscoveryEngineTest, DirectDevicesAreAddedWithoutNetwork) {
    config_.skipUdp = true;
    config_.directDevices = {{"telescope_1", "192.168.1.50", 5555, "Seestar S50"}};
    EXPECT_CALL(*probes_, configuredDevices(_, _, _)).Times(0);
    EXPECT_CALL(*probes_, tcpReachable(_, _, _)).Times(0);

    auto found = makeEngine()->discover();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, "telescope_1");
    EXPECT_EQ(found[0].name, "Seestar S50");
    EXPECT_EQ(found[0].port, 5555);
}

TEST_F(DiscoveryEngineTest, InvalidUtf8DeviceNameDoesNotFailDiscovery) {
    config_.skipUdp = true;
    config_.directDevices = {{"telescope_1", "192.168.1.50", 5555, "caf\xe9"}};

    std::vector<DeviceDescriptor> found;
    EXPECT_NO_THROW(found = makeEngine()->discover());

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "caf\xe9");
    EXPECT_EQ(persistence_->load().size(), 1u);
}

TEST_F(DiscoveryEngineTest, RediscoveryKeepsFirstSeenTime) {
    config_.knownDevices = {{"seestar.local", 5555, "seestar_alp"}};
    auto old = skybridge::utils::Clock::now() - 48h;
    auto previous = makeDevice("telescope_1", "192.168.1.50", 5555);
    previous.discoveredAt = old;
    table_.upsert(previous);

    EXPECT_CALL(*probes_, configuredDevices("seestar.local", 5555, _))
        .WillOnce(Return(std::vector<DeviceDescriptor>{
            makeDevice("telescope_1", "192.168.1.51", 5556)}));

    makeEngine()->discover();

    auto current = table_.find("telescope_1");
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->host, "192.168.1.51");
    EXPECT_EQ(current->port, 5556);
    EXPECT_EQ(current->discoveredAt, old);
}

TEST_F(DiscoveryEngineTest, DiscoveryClearsPreviousTable) {
    table_.upsert(makeDevice("camera_5", "gone.local", 11111));

    makeEngine()->discover();

    EXPECT_FALSE(table_.contains("camera_5"));
}

TEST_F(DiscoveryEngineTest, ResultsArePersistedAndMerged) {
    auto old = skybridge::utils::Clock::now() - 24h;
    auto stored = makeDevice("camera_2", "10.0.0.7", 11111);
    stored.discoveredAt = old;
    ASSERT_TRUE(persistence_->save({stored}));

    config_.simulatorDevices = {{"localhost", 4700, "Simulator"}};
    EXPECT_CALL(*probes_, tcpReachable("localhost", 4700, _))
        .WillOnce(Return(std::expected<void, ProbeFailure>{}));

    makeEngine()->discover();

    auto saved = persistence_->load();
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved[0].id, "camera_2");
    EXPECT_EQ(saved[1].id, "telescope_99");
}

TEST_F(DiscoveryEngineTest, LoadPersistedSeedsTable) {
    ASSERT_TRUE(persistence_->save({makeDevice("telescope_1", "h", 1),
                                    makeDevice("camera_1", "h", 2)}));

    auto engine = makeEngine();
    EXPECT_EQ(engine->loadPersisted(), 2u);
    EXPECT_TRUE(table_.contains("telescope_1"));
    EXPECT_TRUE(table_.contains("camera_1"));
    EXPECT_EQ(engine->loadPersisted(), 0u);
}

TEST(DiscoveryCeilingTest, HungBroadcastIsAbandoned) {
    TempDir dir;
    DeviceTable table;
    DiscoveryConfig config;
    config.timeoutSeconds = 0.5;
    config.knownDevices = {{"seestar.local", 5555, "seestar_alp"}};

    DiscoveryEngine engine(config, std::make_shared<HangingBroadcastProbes>(),
                           table,
                           std::make_shared<StatePersistence>(
                               dir.file("devices.json")),
                           30, DiscoveryTimings{50ms, 50ms, 100ms});

    auto start = std::chrono::steady_clock::now();
    auto found = engine.discover();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 2500ms);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].host, "seestar.local");
}

TEST(SimulatorDescriptorTest, Shape) {
    auto d = makeSimulatorDescriptor({"sim.local", 4700, "Alpaca Simulator"});

    EXPECT_EQ(d.id, "telescope_99");
    EXPECT_EQ(d.name, "Alpaca Simulator");
    EXPECT_TRUE(d.isSimulator);
}
