/*
 * test_event_stream_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <thread>

#include "events/event_stream_manager.hpp"

using namespace skybridge::events;
using namespace std::chrono_literals;

namespace {

auto statusEvent(int index) -> json {
    return {{"Event", "PiStatus"}, {"index", index}};
}

}  // namespace

class EventStreamManagerTest : public ::testing::Test {
protected:
    EventStreamManager manager_{5, 3};
};

TEST_F(EventStreamManagerTest, UnknownDeviceHasNoEvents) {
    auto snapshot = manager_.getEvents("telescope_1");

    EXPECT_EQ(snapshot["device_id"], "telescope_1");
    EXPECT_EQ(snapshot["status"], "no_events");
    EXPECT_EQ(snapshot["event_count"], 0);
    EXPECT_TRUE(snapshot["events"].empty());
}

TEST_F(EventStreamManagerTest, EventTypeComesFromPayload) {
    manager_.addEvent("telescope_1", {{"Event", "GotoComplete"}});
    manager_.addEvent("telescope_1", {{"event_type", "Custom"}});
    manager_.addEvent("telescope_1", {{"value", 1}});
    manager_.addEvent("telescope_1", json("not an object"));

    auto history = manager_.history("telescope_1");
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].eventType, "GotoComplete");
    EXPECT_EQ(history[1].eventType, "Custom");
    EXPECT_EQ(history[2].eventType, "Unknown");
    EXPECT_EQ(history[3].eventType, "Unknown");
    EXPECT_EQ(history[0].payload["Event"], "GotoComplete");
}

TEST_F(EventStreamManagerTest, BufferEvictsOldestBeyondCapacity) {
    for (int i = 0; i < 5 + 3; ++i) {
        manager_.addEvent("telescope_1", statusEvent(i));
    }

    auto snapshot = manager_.getEvents("telescope_1");
    ASSERT_EQ(snapshot["event_count"], 5);
    EXPECT_EQ(snapshot["buffer_size"], 5);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(snapshot["events"][i]["data"]["index"], i + 3);
    }
}

TEST_F(EventStreamManagerTest, SnapshotShape) {
    manager_.setDeviceMetadata("telescope_1", {{"type", "Seestar"}});
    manager_.addEvent("telescope_1", {{"Event", "Stack"}});
    manager_.addEvent("telescope_1", {{"Event", "PiStatus"}});

    auto snapshot = manager_.getEvents("telescope_1");

    EXPECT_EQ(snapshot["status"], "active");
    EXPECT_EQ(snapshot["metadata"]["type"], "Seestar");
    EXPECT_EQ(snapshot["available_types"], json::array({"PiStatus", "Stack"}));

    const auto& event = snapshot["events"][0];
    EXPECT_EQ(event["device_id"], "telescope_1");
    EXPECT_EQ(event["event_type"], "Stack");
    EXPECT_TRUE(event["timestamp"].is_number());
    EXPECT_TRUE(event["datetime"].is_string());
}

TEST_F(EventStreamManagerTest, FiltersByTypeAndLimit) {
    manager_.addEvent("telescope_1", {{"Event", "PiStatus"}, {"n", 1}});
    manager_.addEvent("telescope_1", {{"Event", "Stack"}, {"n", 2}});
    manager_.addEvent("telescope_1", {{"Event", "PiStatus"}, {"n", 3}});
    manager_.addEvent("telescope_1", {{"Event", "PiStatus"}, {"n", 4}});

    EventQuery byType;
    byType.types = {"PiStatus"};
    auto filtered = manager_.getEvents("telescope_1", byType);
    EXPECT_EQ(filtered["event_count"], 3);

    EventQuery limited;
    limited.types = {"PiStatus"};
    limited.limit = 2;
    auto recent = manager_.getEvents("telescope_1", limited);
    ASSERT_EQ(recent["event_count"], 2);
    EXPECT_EQ(recent["events"][0]["data"]["n"], 3);
    EXPECT_EQ(recent["events"][1]["data"]["n"], 4);
}

TEST_F(EventStreamManagerTest, SinceIsExclusive) {
    Event older;
    older.deviceId = "telescope_1";
    older.eventType = "PiStatus";
    older.timestamp = skybridge::utils::Clock::now() - 10s;
    manager_.addEvent(older);

    Event newer = older;
    newer.timestamp = skybridge::utils::Clock::now();
    manager_.addEvent(newer);

    EventQuery query;
    query.since = skybridge::utils::toUnixSeconds(older.timestamp);
    auto snapshot = manager_.getEvents("telescope_1", query);

    EXPECT_EQ(snapshot["event_count"], 1);
}

TEST_F(EventStreamManagerTest, ClearDropsHistoryButKeepsMetadata) {
    manager_.setDeviceMetadata("telescope_1", {{"name", "Seestar"}});
    manager_.addEvent("telescope_1", statusEvent(1));
    manager_.clear("telescope_1");

    auto snapshot = manager_.getEvents("telescope_1");
    EXPECT_EQ(snapshot["status"], "active");
    EXPECT_EQ(snapshot["event_count"], 0);
    EXPECT_EQ(snapshot["buffer_size"], 0);
    EXPECT_TRUE(snapshot["events"].empty());
    EXPECT_TRUE(snapshot["available_types"].empty());
    EXPECT_EQ(snapshot["metadata"]["name"], "Seestar");
    EXPECT_NO_THROW(manager_.clear("nobody"));
}

TEST_F(EventStreamManagerTest, MetadataAloneIsNoEvents) {
    manager_.setDeviceMetadata("telescope_1", {{"name", "Seestar"}});
    auto queue = manager_.subscribe("telescope_1");

    auto snapshot = manager_.getEvents("telescope_1");
    EXPECT_EQ(snapshot["status"], "no_events");
    EXPECT_EQ(snapshot["metadata"]["name"], "Seestar");
}

TEST_F(EventStreamManagerTest, ZeroLimitKeepsEveryEvent) {
    for (int i = 0; i < 3; ++i) {
        manager_.addEvent("telescope_1", statusEvent(i));
    }

    EventQuery query;
    query.limit = 0;
    auto snapshot = manager_.getEvents("telescope_1", query);

    EXPECT_EQ(snapshot["event_count"], 3);
}

TEST_F(EventStreamManagerTest, DevicesAreIndependent) {
    manager_.addEvent("telescope_1", statusEvent(1));
    manager_.addEvent("camera_1", statusEvent(2));

    EXPECT_EQ(manager_.history("telescope_1").size(), 1u);
    EXPECT_EQ(manager_.history("camera_1").size(), 1u);
    EXPECT_TRUE(manager_.history("focuser_1").empty());
}

// ==================== Subscribers ====================

TEST_F(EventStreamManagerTest, SubscribersReceiveLiveEvents) {
    auto first = manager_.subscribe("telescope_1");
    auto second = manager_.subscribe("telescope_1");
    EXPECT_EQ(manager_.subscriberCount("telescope_1"), 2u);

    manager_.addEvent("telescope_1", statusEvent(1));

    auto a = first->tryPop();
    auto b = second->tryPop();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->payload["index"], 1);
    EXPECT_EQ(b->payload["index"], 1);
}

TEST_F(EventStreamManagerTest, FullSubscriberDoesNotBlockOthers) {
    auto slow = manager_.subscribe("telescope_1");
    auto fast = manager_.subscribe("telescope_1");

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) {
        EXPECT_NO_THROW(manager_.addEvent("telescope_1", statusEvent(i)));
        auto delivered = fast->tryPop();
        ASSERT_TRUE(delivered.has_value());
        EXPECT_EQ(delivered->payload["index"], i);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    // Queue capacity is 3: the slow subscriber kept the first three only
    EXPECT_EQ(slow->size(), 3u);
    EXPECT_EQ(slow->tryPop()->payload["index"], 0);
    EXPECT_EQ(manager_.history("telescope_1").size(), 5u);
}

TEST_F(EventStreamManagerTest, ClosedSubscriberIsPruned) {
    auto gone = manager_.subscribe("telescope_1");
    auto alive = manager_.subscribe("telescope_1");
    gone->close();

    manager_.addEvent("telescope_1", statusEvent(1));

    EXPECT_EQ(manager_.subscriberCount("telescope_1"), 1u);
    EXPECT_TRUE(alive->tryPop().has_value());
}

TEST_F(EventStreamManagerTest, UnsubscribeStopsDelivery) {
    auto queue = manager_.subscribe("telescope_1");
    manager_.unsubscribe("telescope_1", queue);

    manager_.addEvent("telescope_1", statusEvent(1));

    EXPECT_EQ(manager_.subscriberCount("telescope_1"), 0u);
    EXPECT_FALSE(queue->tryPop().has_value());
}

TEST_F(EventStreamManagerTest, ConcurrentProducersKeepPerDeviceCount) {
    EventStreamManager manager(1000, 1000);
    std::vector<std::jthread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&manager] {
            for (int i = 0; i < 100; ++i) {
                manager.addEvent("telescope_1", statusEvent(i));
            }
        });
    }
    producers.clear();

    EXPECT_EQ(manager.history("telescope_1").size(), 400u);
}

TEST(EventTypesTest, CatalogListsSeestarEvents) {
    auto types = EventStreamManager::eventTypes();

    for (const char* name : {"PiStatus", "GotoComplete", "BalanceSensor",
                             "EqModePA", "Stack", "ViewChanged", "MountEvent"}) {
        EXPECT_TRUE(types.contains(name)) << name;
    }
}
