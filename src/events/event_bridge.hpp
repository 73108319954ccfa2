/*
 * event_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Connects device lifecycle hooks to event ingestion

**************************************************/

#ifndef SKYBRIDGE_EVENTS_EVENT_BRIDGE_HPP
#define SKYBRIDGE_EVENTS_EVENT_BRIDGE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "client/alpaca/http_transport.hpp"
#include "config/bridge_config.hpp"
#include "device/types.hpp"
#include "event_stream_manager.hpp"
#include "sse_consumer.hpp"

namespace skybridge::device {
class ConnectionManager;
}

namespace skybridge::events {

struct EventBridgeOptions {
    int ssePort{7556};
    std::chrono::milliseconds reconnectDelay{5000};
    size_t queueSize{1000};

    static auto fromConfig(const config::EventConfig& config)
        -> EventBridgeOptions {
        return {config.ssePort,
                std::chrono::milliseconds(config.sseReconnectDelayMs),
                config.bridgeQueueSize};
    }
};

/**
 * @brief Feeds device events into an EventStreamManager
 *
 * Two sources are bridged. SSE consumers, one per Seestar device, write
 * straight into the manager from their own thread. Synchronous callback
 * producers call handleSyncEvent() from any thread; those events go
 * through a bounded channel drained by a dedicated thread.
 */
class EventBridge {
public:
    EventBridge(EventStreamManager& events,
                std::shared_ptr<client::alpaca::HttpTransport> transport,
                EventBridgeOptions options = {});
    ~EventBridge();

    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;

    /**
     * @brief Register the connect/disconnect hooks on a manager
     *
     * The manager's hooks run outside its connection lock, so a connect
     * hook can arrive after the matching disconnect hook. Once installed,
     * a feed is only started while the manager still reports the device
     * connected. The bridge must outlive the manager's use of the hooks.
     */
    void install(device::ConnectionManager& manager);

    void onDeviceConnected(const std::string& deviceId,
                           const device::DeviceDescriptor& descriptor);

    void onDeviceDisconnected(const std::string& deviceId,
                              const device::DeviceDescriptor& descriptor);

    /**
     * @brief Start reading a device's SSE feed
     * @return false if a consumer for the id is already running, or the
     * installed manager no longer has the device connected
     */
    auto startConsuming(const std::string& deviceId,
                        const device::DeviceDescriptor& descriptor) -> bool;

    /**
     * @brief Stop a device's consumer and wait for it to exit
     */
    void stopConsuming(const std::string& deviceId);

    [[nodiscard]] auto isConsuming(const std::string& deviceId) const -> bool;

    [[nodiscard]] auto consumerState(const std::string& deviceId) const
        -> std::optional<ConsumerState>;

    /**
     * @brief Queue an event from a synchronous producer
     * @return false when the channel is full or the bridge is stopped
     */
    auto handleSyncEvent(const std::string& deviceId, json payload) -> bool;

    [[nodiscard]] auto pendingEvents() const -> size_t {
        return channel_.size();
    }

    /**
     * @brief Stop every consumer, then drain and close the channel
     */
    void stop();

    /**
     * @brief Seestar devices served by seestar_alp publish an SSE feed
     */
    [[nodiscard]] static auto exposesEventFeed(
        const device::DeviceDescriptor& descriptor) -> bool;

    [[nodiscard]] auto feedUrl(const device::DeviceDescriptor& descriptor) const
        -> std::string;

private:
    using PendingEvent = std::pair<std::string, json>;

    void drain(std::stop_token stop);

    EventStreamManager& events_;
    std::shared_ptr<client::alpaca::HttpTransport> transport_;
    EventBridgeOptions options_;

    BoundedQueue<PendingEvent> channel_;

    mutable std::mutex consumersMutex_;
    std::unordered_map<std::string, std::unique_ptr<SSEConsumer>> consumers_;
    std::function<bool(const std::string&)> stillConnected_;

    std::jthread drainer_;
};

}  // namespace skybridge::events

#endif  // SKYBRIDGE_EVENTS_EVENT_BRIDGE_HPP
