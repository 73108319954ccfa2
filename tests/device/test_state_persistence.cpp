/*
 * test_state_persistence.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <fstream>

#include "device/state_persistence.hpp"
#include "support/test_doubles.hpp"

using namespace skybridge::device;
using skybridge::tests::TempDir;
using namespace std::chrono_literals;

namespace {

auto makeDevice(const std::string& id, const std::string& host, int port,
                skybridge::utils::TimePoint discoveredAt) -> DeviceDescriptor {
    DeviceDescriptor d;
    d.id = id;
    d.name = id;
    d.host = host;
    d.port = port;
    d.discoveredAt = discoveredAt;
    return d;
}

auto epochMs(skybridge::utils::TimePoint tp) -> long long {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

}  // namespace

class StatePersistenceTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(StatePersistenceTest, MissingFileLoadsEmpty) {
    StatePersistence persistence(dir_.file("devices.json"));
    EXPECT_TRUE(persistence.load().empty());
}

TEST_F(StatePersistenceTest, MalformedFileLoadsEmpty) {
    auto path = dir_.file("devices.json");
    std::ofstream(path) << "{ this is not json";

    StatePersistence persistence(path);
    EXPECT_TRUE(persistence.load().empty());

    std::ofstream(path) << R"({"version": "1.0"})";
    EXPECT_TRUE(persistence.load().empty());
}

TEST_F(StatePersistenceTest, SaveThenLoad) {
    auto path = dir_.path() / "nested" / "devices.json";
    StatePersistence persistence(path);

    auto now = skybridge::utils::Clock::now();
    std::vector<DeviceDescriptor> devices{
        makeDevice("telescope_1", "192.168.1.50", 5555, now),
        makeDevice("camera_1", "10.0.0.7", 11111, now - 24h)};
    devices[1].type = "Camera";
    devices[1].isSimulator = true;

    ASSERT_TRUE(persistence.save(devices));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "nested" / "devices.tmp"));

    auto loaded = persistence.load();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, "telescope_1");
    EXPECT_EQ(loaded[0].host, "192.168.1.50");
    EXPECT_EQ(loaded[0].port, 5555);
    EXPECT_EQ(loaded[1].type, "Camera");
    EXPECT_TRUE(loaded[1].isSimulator);
    EXPECT_EQ(epochMs(loaded[1].discoveredAt), epochMs(devices[1].discoveredAt));
}

TEST_F(StatePersistenceTest, FileHasVersionedEnvelope) {
    auto path = dir_.file("devices.json");
    StatePersistence persistence(path);
    ASSERT_TRUE(persistence.save(
        {makeDevice("telescope_1", "h", 1, skybridge::utils::Clock::now())}));

    std::ifstream in(path);
    auto data = nlohmann::json::parse(in);
    EXPECT_EQ(data["version"], StatePersistence::FORMAT_VERSION);
    EXPECT_TRUE(data["updated_at"].is_string());
    ASSERT_TRUE(data["devices"].is_array());
    EXPECT_EQ(data["devices"].size(), 1u);
}

TEST_F(StatePersistenceTest, SaveFailureReturnsFalse) {
    auto blocker = dir_.file("blocker");
    std::ofstream(blocker) << "file, not a directory";

    StatePersistence persistence(blocker / "devices.json");
    EXPECT_FALSE(persistence.save(
        {makeDevice("telescope_1", "h", 1, skybridge::utils::Clock::now())}));
}

TEST_F(StatePersistenceTest, InvalidUtf8NamesAreStillSaved) {
    auto path = dir_.file("devices.json");
    StatePersistence persistence(path);
    auto device = makeDevice("caf\xe9@192.168.1.50:5555", "192.168.1.50", 5555,
                             skybridge::utils::Clock::now());
    device.name = "caf\xe9";

    bool saved = false;
    EXPECT_NO_THROW(saved = persistence.save({device}));
    EXPECT_TRUE(saved);

    auto loaded = persistence.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].host, "192.168.1.50");
    EXPECT_EQ(loaded[0].name, "caf\xef\xbf\xbd");
}

TEST_F(StatePersistenceTest, UnreadableTimestampIsTreatedAsFresh) {
    auto path = dir_.file("devices.json");
    std::ofstream(path) << R"({"version": "1.0", "devices": [
        {"id": "telescope_1", "host": "h", "port": 1,
         "discovered_at": "yesterday-ish"}]})";

    StatePersistence persistence(path);
    auto loaded = persistence.load();
    ASSERT_EQ(loaded.size(), 1u);

    auto kept = StatePersistence::cleanupStale(loaded, 30);
    EXPECT_EQ(kept.size(), 1u);
}

// ==================== Merge ====================

TEST(StatePersistenceMergeTest, MergeKeepsOriginalDiscoveredAt) {
    auto old = skybridge::utils::Clock::now() - 72h;
    auto fresh = skybridge::utils::Clock::now();

    auto merged = StatePersistence::merge(
        {makeDevice("telescope_1", "192.168.1.50", 5555, old)},
        {makeDevice("telescope_1", "192.168.1.51", 5556, fresh),
         makeDevice("camera_1", "10.0.0.7", 11111, fresh)});

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].id, "telescope_1");
    EXPECT_EQ(merged[0].host, "192.168.1.51");
    EXPECT_EQ(merged[0].port, 5556);
    EXPECT_EQ(merged[0].discoveredAt, old);
    EXPECT_EQ(merged[1].id, "camera_1");
    EXPECT_EQ(merged[1].discoveredAt, fresh);
}

TEST(StatePersistenceMergeTest, CleanupDropsOldEntries) {
    auto now = skybridge::utils::Clock::now();
    std::vector<DeviceDescriptor> devices{
        makeDevice("fresh", "h", 1, now - 1h),
        makeDevice("edge", "h", 1, now - std::chrono::days(30)),
        makeDevice("stale", "h", 1, now - std::chrono::days(31))};

    auto kept = StatePersistence::cleanupStale(devices, 30, now);

    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].id, "fresh");
    EXPECT_EQ(kept[1].id, "edge");
}
