/*
 * event_ring_buffer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Fixed-capacity FIFO with oldest-first eviction

**************************************************/

#ifndef SKYBRIDGE_EVENTS_EVENT_RING_BUFFER_HPP
#define SKYBRIDGE_EVENTS_EVENT_RING_BUFFER_HPP

#include <algorithm>
#include <cstddef>
#include <vector>

namespace skybridge::events {

/**
 * @brief Ring buffer keeping the newest max_items entries
 *
 * Not synchronized; the owner serializes access.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t max_items)
        : max_items_(std::max<size_t>(1, max_items)) {
        buffer_.resize(max_items_);
    }

    /**
     * @brief Append, evicting the oldest entry when full
     */
    void push(T item) {
        buffer_[head_] = std::move(item);
        head_ = (head_ + 1) % max_items_;
        if (count_ < max_items_) {
            ++count_;
        }
    }

    /**
     * @brief Entries from oldest to newest
     */
    [[nodiscard]] auto entries() const -> std::vector<T> {
        std::vector<T> result;
        result.reserve(count_);
        size_t start = (head_ + max_items_ - count_) % max_items_;
        for (size_t i = 0; i < count_; ++i) {
            result.push_back(buffer_[(start + i) % max_items_]);
        }
        return result;
    }

    void clear() {
        buffer_.assign(max_items_, T{});
        head_ = 0;
        count_ = 0;
    }

    [[nodiscard]] auto size() const -> size_t { return count_; }
    [[nodiscard]] auto capacity() const -> size_t { return max_items_; }
    [[nodiscard]] auto empty() const -> bool { return count_ == 0; }

private:
    std::vector<T> buffer_;
    size_t max_items_;
    size_t head_{0};
    size_t count_{0};
};

}  // namespace skybridge::events

#endif  // SKYBRIDGE_EVENTS_EVENT_RING_BUFFER_HPP
