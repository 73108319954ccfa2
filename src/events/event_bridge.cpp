/*
 * event_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Connects device lifecycle hooks to event ingestion

**************************************************/

#include "event_bridge.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <vector>

#include <spdlog/spdlog.h>

#include "device/connection_manager.hpp"

namespace skybridge::events {

namespace {

constexpr int SEESTAR_ALP_PORT = 5555;

auto toLower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

}  // namespace

EventBridge::EventBridge(
    EventStreamManager& events,
    std::shared_ptr<client::alpaca::HttpTransport> transport,
    EventBridgeOptions options)
    : events_(events),
      transport_(std::move(transport)),
      options_(options),
      channel_(std::max<size_t>(1, options.queueSize)) {
    drainer_ = std::jthread([this](std::stop_token stop) { drain(stop); });
}

EventBridge::~EventBridge() { stop(); }

void EventBridge::install(device::ConnectionManager& manager) {
    {
        std::lock_guard lock(consumersMutex_);
        stillConnected_ = [&manager](const std::string& id) {
            return manager.isConnected(id);
        };
    }
    manager.registerEventCallback(
        device::ON_DEVICE_CONNECTED,
        [this](const std::string& id, const device::DeviceDescriptor& d) {
            onDeviceConnected(id, d);
        });
    manager.registerEventCallback(
        device::ON_DEVICE_DISCONNECTED,
        [this](const std::string& id, const device::DeviceDescriptor& d) {
            onDeviceDisconnected(id, d);
        });
}

auto EventBridge::exposesEventFeed(const device::DeviceDescriptor& descriptor)
    -> bool {
    return descriptor.port == SEESTAR_ALP_PORT &&
           toLower(descriptor.name).find("seestar") != std::string::npos;
}

auto EventBridge::feedUrl(const device::DeviceDescriptor& descriptor) const
    -> std::string {
    return std::format("http://{}:{}/{}/events", descriptor.host,
                       options_.ssePort, std::max(1, descriptor.number));
}

void EventBridge::onDeviceConnected(const std::string& deviceId,
                                    const device::DeviceDescriptor& descriptor) {
    if (!exposesEventFeed(descriptor)) {
        spdlog::debug("{} ({}:{}) has no event feed", deviceId,
                      descriptor.host, descriptor.port);
        return;
    }

    events_.setDeviceMetadata(deviceId, {{"name", descriptor.name},
                                         {"type", "Seestar"},
                                         {"unique_id", descriptor.uniqueId},
                                         {"supports_events", true},
                                         {"event_source", "SSE"}});
    startConsuming(deviceId, descriptor);
}

void EventBridge::onDeviceDisconnected(
    const std::string& deviceId, const device::DeviceDescriptor& /*descriptor*/) {
    stopConsuming(deviceId);
}

auto EventBridge::startConsuming(const std::string& deviceId,
                                 const device::DeviceDescriptor& descriptor)
    -> bool {
    std::lock_guard lock(consumersMutex_);
    // Under the lock, so a later disconnect finds the new consumer
    if (stillConnected_ && !stillConnected_(deviceId)) {
        spdlog::debug("{} was disconnected before its feed started", deviceId);
        return false;
    }
    auto& consumer = consumers_[deviceId];
    if (consumer && consumer->running()) {
        spdlog::debug("SSE consumer already running for {}", deviceId);
        return false;
    }

    consumer = std::make_unique<SSEConsumer>(
        deviceId, feedUrl(descriptor), transport_,
        [this](const std::string& id, json payload) {
            events_.addEvent(id, std::move(payload));
        },
        options_.reconnectDelay);
    consumer->start();
    return true;
}

void EventBridge::stopConsuming(const std::string& deviceId) {
    std::unique_ptr<SSEConsumer> consumer;
    {
        std::lock_guard lock(consumersMutex_);
        auto it = consumers_.find(deviceId);
        if (it == consumers_.end()) {
            return;
        }
        consumer = std::move(it->second);
        consumers_.erase(it);
    }
    consumer->stop();
}

auto EventBridge::isConsuming(const std::string& deviceId) const -> bool {
    std::lock_guard lock(consumersMutex_);
    auto it = consumers_.find(deviceId);
    return it != consumers_.end() && it->second->running();
}

auto EventBridge::consumerState(const std::string& deviceId) const
    -> std::optional<ConsumerState> {
    std::lock_guard lock(consumersMutex_);
    auto it = consumers_.find(deviceId);
    if (it == consumers_.end()) {
        return std::nullopt;
    }
    return it->second->state();
}

auto EventBridge::handleSyncEvent(const std::string& deviceId, json payload)
    -> bool {
    switch (channel_.tryPush({deviceId, std::move(payload)})) {
        case PushResult::Ok:
            return true;
        case PushResult::Full:
            spdlog::warn("Event channel full, dropping event for {}", deviceId);
            return false;
        case PushResult::Closed:
            spdlog::debug("Event bridge stopped, dropping event for {}",
                          deviceId);
            return false;
    }
    return false;
}

void EventBridge::drain(std::stop_token stop) {
    while (auto pending = channel_.pop(stop)) {
        events_.addEvent(pending->first, std::move(pending->second));
    }
}

void EventBridge::stop() {
    std::vector<std::unique_ptr<SSEConsumer>> consumers;
    {
        std::lock_guard lock(consumersMutex_);
        for (auto& [id, consumer] : consumers_) {
            consumers.push_back(std::move(consumer));
        }
        consumers_.clear();
    }
    for (auto& consumer : consumers) {
        consumer->stop();
    }

    channel_.close();
    if (drainer_.joinable()) {
        drainer_.join();
    }
}

}  // namespace skybridge::events
