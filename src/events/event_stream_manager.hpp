/*
 * event_stream_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Per-device event history and live subscriber fan-out

**************************************************/

#ifndef SKYBRIDGE_EVENTS_EVENT_STREAM_MANAGER_HPP
#define SKYBRIDGE_EVENTS_EVENT_STREAM_MANAGER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bounded_queue.hpp"
#include "event.hpp"
#include "event_ring_buffer.hpp"

namespace skybridge::events {

using EventQueue = BoundedQueue<Event>;

/**
 * @brief Filters for getEvents()
 */
struct EventQuery {
    std::optional<double> since;        ///< Unix seconds, exclusive
    std::vector<std::string> types;     ///< Empty keeps every type
    std::optional<size_t> limit;        ///< Keep the most recent N; 0 keeps all
};

/**
 * @brief Event history and fan-out for every device
 *
 * Each device keeps a fixed-capacity history in arrival order. Live
 * subscribers get at-most-once delivery: a full subscriber queue drops
 * the event for that subscriber only, and a closed queue is removed.
 * One lock covers history append and fan-out, so subscribe and
 * unsubscribe never interleave with a delivery.
 */
class EventStreamManager {
public:
    explicit EventStreamManager(size_t bufferSize = 100,
                                size_t subscriberQueueSize = 100);

    EventStreamManager(const EventStreamManager&) = delete;
    EventStreamManager& operator=(const EventStreamManager&) = delete;

    /**
     * @brief Store a raw payload
     *
     * The event type is taken from the payload's "Event" field, then
     * "event_type", then "Unknown".
     */
    void addEvent(const std::string& deviceId, json payload);

    void addEvent(Event event);

    /**
     * @brief Snapshot of a device's history
     *
     * Shape: {device_id, status, event_count, buffer_size, events,
     * metadata, available_types}. A device that never received an event
     * reports status "no_events"; a cleared one stays "active".
     */
    [[nodiscard]] auto getEvents(const std::string& deviceId,
                                 const EventQuery& query = {}) const -> json;

    /**
     * @brief Stored events, oldest first
     */
    [[nodiscard]] auto history(const std::string& deviceId) const
        -> std::vector<Event>;

    [[nodiscard]] auto subscribe(const std::string& deviceId)
        -> std::shared_ptr<EventQueue>;

    void unsubscribe(const std::string& deviceId,
                     const std::shared_ptr<EventQueue>& queue);

    void clear(const std::string& deviceId);

    void setDeviceMetadata(const std::string& deviceId, json metadata);

    [[nodiscard]] auto subscriberCount(const std::string& deviceId) const
        -> size_t;

    /**
     * @brief Known Seestar event tags with descriptions
     */
    [[nodiscard]] static auto eventTypes() -> json;

private:
    struct DeviceStream {
        explicit DeviceStream(size_t capacity) : buffer(capacity) {}

        RingBuffer<Event> buffer;
        std::vector<std::shared_ptr<EventQueue>> subscribers;
        json metadata = json::object();
        bool received{false};  ///< Stays set after clear()
    };

    auto streamFor(const std::string& deviceId) -> DeviceStream&;

    size_t bufferSize_;
    size_t subscriberQueueSize_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<DeviceStream>> streams_;
};

}  // namespace skybridge::events

#endif  // SKYBRIDGE_EVENTS_EVENT_STREAM_MANAGER_HPP
