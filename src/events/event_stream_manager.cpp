/*
 * event_stream_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Per-device event history and live subscriber fan-out

**************************************************/

#include "event_stream_manager.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace skybridge::events {

namespace {

auto eventTypeOf(const json& payload) -> std::string {
    if (payload.is_object()) {
        for (const char* key : {"Event", "event_type"}) {
            if (auto it = payload.find(key);
                it != payload.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    return "Unknown";
}

}  // namespace

EventStreamManager::EventStreamManager(size_t bufferSize,
                                       size_t subscriberQueueSize)
    : bufferSize_(std::max<size_t>(1, bufferSize)),
      subscriberQueueSize_(std::max<size_t>(1, subscriberQueueSize)) {}

auto EventStreamManager::streamFor(const std::string& deviceId)
    -> DeviceStream& {
    auto& stream = streams_[deviceId];
    if (!stream) {
        stream = std::make_unique<DeviceStream>(bufferSize_);
    }
    return *stream;
}

void EventStreamManager::addEvent(const std::string& deviceId, json payload) {
    Event event;
    event.deviceId = deviceId;
    event.eventType = eventTypeOf(payload);
    event.payload = std::move(payload);
    addEvent(std::move(event));
}

void EventStreamManager::addEvent(Event event) {
    size_t buffered = 0;
    {
        std::lock_guard lock(mutex_);
        auto& stream = streamFor(event.deviceId);
        stream.buffer.push(event);
        stream.received = true;
        buffered = stream.buffer.size();

        auto& subscribers = stream.subscribers;
        for (auto it = subscribers.begin(); it != subscribers.end();) {
            switch ((*it)->tryPush(event)) {
                case PushResult::Ok:
                    ++it;
                    break;
                case PushResult::Full:
                    spdlog::warn("Event queue full for device {}",
                                 event.deviceId);
                    ++it;
                    break;
                case PushResult::Closed:
                    it = subscribers.erase(it);
                    break;
            }
        }
    }

    spdlog::debug("Added {} event for device {} (buffer size {})",
                  event.eventType, event.deviceId, buffered);
}

auto EventStreamManager::getEvents(const std::string& deviceId,
                                   const EventQuery& query) const -> json {
    std::lock_guard lock(mutex_);

    auto it = streams_.find(deviceId);
    if (it == streams_.end() || !it->second->received) {
        json metadata = it != streams_.end() ? it->second->metadata
                                             : json::object();
        return {{"device_id", deviceId},
                {"status", "no_events"},
                {"event_count", 0},
                {"buffer_size", 0},
                {"events", json::array()},
                {"metadata", metadata},
                {"available_types", json::array()}};
    }

    const auto& stream = *it->second;
    auto all = stream.buffer.entries();

    std::set<std::string> availableTypes;
    for (const auto& event : all) {
        availableTypes.insert(event.eventType);
    }

    std::vector<const Event*> selected;
    for (const auto& event : all) {
        if (query.since && utils::toUnixSeconds(event.timestamp) <= *query.since) {
            continue;
        }
        if (!query.types.empty() &&
            std::find(query.types.begin(), query.types.end(),
                      event.eventType) == query.types.end()) {
            continue;
        }
        selected.push_back(&event);
    }

    if (query.limit && *query.limit > 0 && selected.size() > *query.limit) {
        selected.erase(selected.begin(),
                       selected.end() - static_cast<std::ptrdiff_t>(*query.limit));
    }

    json events = json::array();
    for (const auto* event : selected) {
        events.push_back(event->toJson());
    }

    return {{"device_id", deviceId},
            {"status", "active"},
            {"event_count", events.size()},
            {"buffer_size", stream.buffer.size()},
            {"events", events},
            {"metadata", stream.metadata},
            {"available_types", availableTypes}};
}

auto EventStreamManager::history(const std::string& deviceId) const
    -> std::vector<Event> {
    std::lock_guard lock(mutex_);
    if (auto it = streams_.find(deviceId); it != streams_.end()) {
        return it->second->buffer.entries();
    }
    return {};
}

auto EventStreamManager::subscribe(const std::string& deviceId)
    -> std::shared_ptr<EventQueue> {
    auto queue = std::make_shared<EventQueue>(subscriberQueueSize_);
    {
        std::lock_guard lock(mutex_);
        streamFor(deviceId).subscribers.push_back(queue);
    }
    spdlog::info("New event subscriber for device {}", deviceId);
    return queue;
}

void EventStreamManager::unsubscribe(const std::string& deviceId,
                                     const std::shared_ptr<EventQueue>& queue) {
    std::lock_guard lock(mutex_);
    if (auto it = streams_.find(deviceId); it != streams_.end()) {
        auto& subscribers = it->second->subscribers;
        auto before = subscribers.size();
        subscribers.erase(
            std::remove(subscribers.begin(), subscribers.end(), queue),
            subscribers.end());
        if (subscribers.size() != before) {
            spdlog::info("Removed event subscriber for device {}", deviceId);
        }
    }
}

void EventStreamManager::clear(const std::string& deviceId) {
    std::lock_guard lock(mutex_);
    if (auto it = streams_.find(deviceId); it != streams_.end()) {
        it->second->buffer.clear();
        spdlog::info("Cleared events for device {}", deviceId);
    }
}

void EventStreamManager::setDeviceMetadata(const std::string& deviceId,
                                           json metadata) {
    std::lock_guard lock(mutex_);
    streamFor(deviceId).metadata = std::move(metadata);
}

auto EventStreamManager::subscriberCount(const std::string& deviceId) const
    -> size_t {
    std::lock_guard lock(mutex_);
    if (auto it = streams_.find(deviceId); it != streams_.end()) {
        return it->second->subscribers.size();
    }
    return 0;
}

auto EventStreamManager::eventTypes() -> json {
    return {{"PiStatus", "System status updates (battery, temperature)"},
            {"GotoComplete", "Telescope movement completed"},
            {"BalanceSensor", "Balance sensor updates"},
            {"EqModePA", "Polar alignment status"},
            {"Stack", "Image stacking progress"},
            {"ViewChanged", "View state changes"},
            {"MountEvent", "Mount status changes"}};
}

}  // namespace skybridge::events
