/*
 * bounded_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Thread-safe bounded queue with non-blocking push

**************************************************/

#ifndef SKYBRIDGE_EVENTS_BOUNDED_QUEUE_HPP
#define SKYBRIDGE_EVENTS_BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace skybridge::events {

enum class PushResult { Ok, Full, Closed };

/**
 * @brief Multi-producer, multi-consumer bounded FIFO
 *
 * Producers never block: a push into a full queue reports Full. After
 * close(), pushes report Closed and consumers drain what is left.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    auto tryPush(T item) -> PushResult {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (items_.size() >= capacity_) {
                return PushResult::Full;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return PushResult::Ok;
    }

    [[nodiscard]] auto tryPop() -> std::optional<T> {
        std::lock_guard lock(mutex_);
        return popLocked();
    }

    /**
     * @brief Wait up to timeout for an item
     */
    [[nodiscard]] auto popFor(std::chrono::milliseconds timeout)
        -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout,
                     [this] { return !items_.empty() || closed_; });
        return popLocked();
    }

    /**
     * @brief Wait for an item until stop is requested or the queue closes
     */
    [[nodiscard]] auto pop(std::stop_token stop) -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, stop, [this] { return !items_.empty() || closed_; });
        return popLocked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto closed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] auto capacity() const -> size_t { return capacity_; }

private:
    auto popLocked() -> std::optional<T> {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<T> items_;
    size_t capacity_;
    bool closed_{false};
};

}  // namespace skybridge::events

#endif  // SKYBRIDGE_EVENTS_BOUNDED_QUEUE_HPP
