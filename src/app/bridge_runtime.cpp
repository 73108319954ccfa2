/*
 * bridge_runtime.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Owns and wires every bridge component for one process

**************************************************/

#include "bridge_runtime.hpp"

#include <spdlog/spdlog.h>

#include "client/alpaca/alpaca_client_factory.hpp"
#include "device/discovery/discovery_probes.hpp"

namespace skybridge::app {

BridgeRuntime::BridgeRuntime(config::BridgeConfig config,
                             RuntimeDependencies dependencies)
    : config_(std::move(config)) {
    config_.normalize();

    transport_ = dependencies.transport
                     ? std::move(dependencies.transport)
                     : std::make_shared<client::alpaca::CurlTransport>();
    auto factory =
        dependencies.clientFactory
            ? std::move(dependencies.clientFactory)
            : std::make_shared<client::alpaca::AlpacaClientFactory>(transport_);
    auto probes =
        dependencies.probes
            ? std::move(dependencies.probes)
            : std::make_shared<device::discovery::NetworkProbes>(transport_);

    persistence_ =
        std::make_shared<device::StatePersistence>(config_.persistence.stateFile);

    device::ConnectionOptions options;
    options.retry = config_.retry;
    options.directDevices = config_.discovery.directDevices;
    options.knownDevices = config_.discovery.knownDevices;
    options.staleAfterDays = config_.persistence.staleAfterDays;
    connections_ = std::make_unique<device::ConnectionManager>(
        std::move(options), std::move(factory), persistence_);

    discovery_ = std::make_unique<device::discovery::DiscoveryEngine>(
        config_.discovery, std::move(probes), connections_->availableTable(),
        persistence_, config_.persistence.staleAfterDays);

    events_ = std::make_unique<events::EventStreamManager>(
        config_.events.bufferSize, config_.events.subscriberQueueSize);
    bridge_ = std::make_unique<events::EventBridge>(
        *events_, transport_,
        events::EventBridgeOptions::fromConfig(config_.events));
    bridge_->install(*connections_);

    auto restored = discovery_->loadPersisted();
    spdlog::info("Bridge runtime ready: {} device(s) restored from {}",
                 restored, persistence_->path().string());
}

BridgeRuntime::~BridgeRuntime() { shutdown(); }

void BridgeRuntime::shutdown() {
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    spdlog::info("Shutting down bridge runtime");

    connections_->shutdown();
    bridge_->stop();
}

}  // namespace skybridge::app
