/*
 * test_bounded_queue.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <thread>

#include "events/bounded_queue.hpp"
#include "events/event_ring_buffer.hpp"

using namespace skybridge::events;
using namespace std::chrono_literals;

// ==================== BoundedQueue ====================

TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> queue(4);
    EXPECT_EQ(queue.tryPush(1), PushResult::Ok);
    EXPECT_EQ(queue.tryPush(2), PushResult::Ok);

    EXPECT_EQ(queue.tryPop().value_or(0), 1);
    EXPECT_EQ(queue.tryPop().value_or(0), 2);
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(BoundedQueueTest, FullQueueRejectsWithoutBlocking) {
    BoundedQueue<int> queue(2);
    EXPECT_EQ(queue.tryPush(1), PushResult::Ok);
    EXPECT_EQ(queue.tryPush(2), PushResult::Ok);
    EXPECT_EQ(queue.tryPush(3), PushResult::Full);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.capacity(), 2u);
}

TEST(BoundedQueueTest, CloseRejectsPushesAndDrains) {
    BoundedQueue<int> queue(2);
    queue.tryPush(7);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.tryPush(8), PushResult::Closed);
    EXPECT_EQ(queue.popFor(10ms).value_or(0), 7);
    EXPECT_FALSE(queue.popFor(10ms).has_value());
}

TEST(BoundedQueueTest, PopForTimesOut) {
    BoundedQueue<int> queue(1);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.popFor(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(BoundedQueueTest, PopWakesOnPushFromAnotherThread) {
    BoundedQueue<int> queue(1);
    std::jthread producer([&] {
        std::this_thread::sleep_for(10ms);
        queue.tryPush(42);
    });

    std::stop_source source;
    EXPECT_EQ(queue.pop(source.get_token()).value_or(0), 42);
}

TEST(BoundedQueueTest, PopReturnsOnStopRequest) {
    BoundedQueue<int> queue(1);
    std::stop_source source;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(10ms);
        source.request_stop();
    });

    EXPECT_FALSE(queue.pop(source.get_token()).has_value());
}

// ==================== RingBuffer ====================

TEST(RingBufferTest, KeepsNewestEntriesInOrder) {
    RingBuffer<int> buffer(3);
    for (int i = 1; i <= 5; ++i) {
        buffer.push(i);
    }

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.entries(), (std::vector<int>{3, 4, 5}));
}

TEST(RingBufferTest, PartiallyFilled) {
    RingBuffer<int> buffer(5);
    buffer.push(1);
    buffer.push(2);

    EXPECT_EQ(buffer.entries(), (std::vector<int>{1, 2}));
    EXPECT_EQ(buffer.capacity(), 5u);
}

TEST(RingBufferTest, ClearEmpties) {
    RingBuffer<int> buffer(2);
    buffer.push(1);
    buffer.clear();

    EXPECT_TRUE(buffer.empty());
    EXPECT_TRUE(buffer.entries().empty());
    buffer.push(9);
    EXPECT_EQ(buffer.entries(), (std::vector<int>{9}));
}
