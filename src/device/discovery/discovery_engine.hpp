/*
 * discovery_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Concurrent multi-source device discovery

**************************************************/

#ifndef SKYBRIDGE_DEVICE_DISCOVERY_DISCOVERY_ENGINE_HPP
#define SKYBRIDGE_DEVICE_DISCOVERY_DISCOVERY_ENGINE_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "config/bridge_config.hpp"
#include "device/device_table.hpp"
#include "device/state_persistence.hpp"
#include "discovery_probes.hpp"

namespace skybridge::device::discovery {

/**
 * @brief Per-strategy time limits
 */
struct DiscoveryTimings {
    std::chrono::milliseconds managementTimeout{2000};  ///< Known-host GET
    std::chrono::milliseconds tcpTimeout{2000};         ///< Simulator connect
    std::chrono::milliseconds ceilingPadding{1000};     ///< Added to UDP timeout
};

/**
 * @brief Runs every discovery strategy concurrently and merges the results
 *
 * Strategies, in merge order:
 *   1. UDP broadcast, followed by a management query per answering server
 *   2. Known hosts, queried through the management API
 *   3. Simulators, checked by a TCP connect
 *   4. Direct devices from configuration, no network I/O
 *
 * The first strategy to report an id wins within one pass. A failing
 * strategy contributes nothing and never aborts the others.
 */
class DiscoveryEngine {
public:
    DiscoveryEngine(config::DiscoveryConfig config,
                    std::shared_ptr<DiscoveryProbes> probes,
                    DeviceTable& available,
                    std::shared_ptr<StatePersistence> persistence,
                    int staleAfterDays = 30,
                    DiscoveryTimings timings = {});

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Replace the available table with a fresh discovery pass
     *
     * Calls are serialized. The connected table is not touched.
     *
     * @param timeout UDP collection window, defaults to the configured one
     * @return Descriptors added to the table in this pass
     */
    auto discover(std::optional<std::chrono::milliseconds> timeout =
                      std::nullopt) -> std::vector<DeviceDescriptor>;

    /**
     * @brief Seed the available table from the persisted snapshot
     * @return Number of descriptors added
     */
    auto loadPersisted() -> size_t;

    [[nodiscard]] auto config() const -> const config::DiscoveryConfig& {
        return config_;
    }

private:
    auto runUdp(std::chrono::milliseconds timeout)
        -> std::vector<DeviceDescriptor>;
    auto runKnownHosts() -> std::vector<DeviceDescriptor>;
    auto runSimulators() -> std::vector<DeviceDescriptor>;
    auto runDirect() -> std::vector<DeviceDescriptor>;

    void persist();

    config::DiscoveryConfig config_;
    std::shared_ptr<DiscoveryProbes> probes_;
    DeviceTable& available_;
    std::shared_ptr<StatePersistence> persistence_;
    int staleAfterDays_;
    DiscoveryTimings timings_;
    std::mutex discoveryMutex_;
};

/**
 * @brief Descriptor synthesized for a reachable simulator
 */
[[nodiscard]] auto makeSimulatorDescriptor(const config::HostEndpoint& endpoint)
    -> DeviceDescriptor;

}  // namespace skybridge::device::discovery

#endif  // SKYBRIDGE_DEVICE_DISCOVERY_DISCOVERY_ENGINE_HPP
