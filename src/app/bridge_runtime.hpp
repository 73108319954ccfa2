/*
 * bridge_runtime.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Owns and wires every bridge component for one process

**************************************************/

#ifndef SKYBRIDGE_APP_BRIDGE_RUNTIME_HPP
#define SKYBRIDGE_APP_BRIDGE_RUNTIME_HPP

#include <memory>

#include "client/alpaca/device_client.hpp"
#include "client/alpaca/http_transport.hpp"
#include "config/bridge_config.hpp"
#include "device/connection_manager.hpp"
#include "device/discovery/discovery_engine.hpp"
#include "device/state_persistence.hpp"
#include "events/event_bridge.hpp"
#include "events/event_stream_manager.hpp"

namespace skybridge::app {

/**
 * @brief Network collaborators; null members get the production default
 */
struct RuntimeDependencies {
    std::shared_ptr<client::alpaca::HttpTransport> transport;
    std::shared_ptr<client::alpaca::DeviceClientFactory> clientFactory;
    std::shared_ptr<device::discovery::DiscoveryProbes> probes;
};

/**
 * @brief The one set of managers a process uses
 *
 * Constructed once at startup and passed by reference to whatever needs
 * it. Construction seeds the available table from the persisted snapshot
 * and hooks the event bridge into connection events.
 */
class BridgeRuntime {
public:
    explicit BridgeRuntime(config::BridgeConfig config,
                           RuntimeDependencies dependencies = {});
    ~BridgeRuntime();

    BridgeRuntime(const BridgeRuntime&) = delete;
    BridgeRuntime& operator=(const BridgeRuntime&) = delete;

    [[nodiscard]] auto config() const -> const config::BridgeConfig& {
        return config_;
    }

    [[nodiscard]] auto connections() -> device::ConnectionManager& {
        return *connections_;
    }

    [[nodiscard]] auto discovery() -> device::discovery::DiscoveryEngine& {
        return *discovery_;
    }

    [[nodiscard]] auto events() -> events::EventStreamManager& {
        return *events_;
    }

    [[nodiscard]] auto eventBridge() -> events::EventBridge& {
        return *bridge_;
    }

    [[nodiscard]] auto persistence() -> device::StatePersistence& {
        return *persistence_;
    }

    /**
     * @brief Disconnect every device, stop event ingestion, save state
     *
     * Safe to call more than once.
     */
    void shutdown();

private:
    config::BridgeConfig config_;
    std::shared_ptr<client::alpaca::HttpTransport> transport_;
    std::shared_ptr<device::StatePersistence> persistence_;
    std::unique_ptr<device::ConnectionManager> connections_;
    std::unique_ptr<device::discovery::DiscoveryEngine> discovery_;
    std::unique_ptr<events::EventStreamManager> events_;
    std::unique_ptr<events::EventBridge> bridge_;
    bool shutdown_{false};
};

}  // namespace skybridge::app

#endif  // SKYBRIDGE_APP_BRIDGE_RUNTIME_HPP
