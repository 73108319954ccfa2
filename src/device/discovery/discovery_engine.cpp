/*
 * discovery_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Concurrent multi-source device discovery

**************************************************/

#include "discovery_engine.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "device/device_resolver.hpp"

namespace skybridge::device::discovery {

namespace {

constexpr int SIMULATOR_DEVICE_NUMBER = 99;

using Strategy = std::function<std::vector<DeviceDescriptor>()>;

/// Failure boundary around one strategy
auto guarded(const char* name, const Strategy& strategy)
    -> std::vector<DeviceDescriptor> {
    try {
        auto found = strategy();
        spdlog::debug("{} discovery found {} devices", name, found.size());
        return found;
    } catch (const std::exception& e) {
        spdlog::warn("{} discovery failed: {}", name, e.what());
        return {};
    }
}

/**
 * Run a blocking call on a detached thread and wait at most `ceiling`.
 * A call that outlives the ceiling is abandoned; it only holds shared
 * state, so it can finish on its own later.
 */
template <typename T>
auto runWithCeiling(std::function<T()> fn, std::chrono::milliseconds ceiling)
    -> std::optional<T> {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    std::thread([promise, fn = std::move(fn)] {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(ceiling) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

}  // namespace

auto makeSimulatorDescriptor(const config::HostEndpoint& endpoint)
    -> DeviceDescriptor {
    DeviceDescriptor d;
    d.type = "Telescope";
    d.number = SIMULATOR_DEVICE_NUMBER;
    d.id = DeviceDescriptor::makeId(d.type, d.number);
    d.name = endpoint.name;
    d.uniqueId = std::format("simulator_{}_{}", endpoint.host, endpoint.port);
    d.host = endpoint.host;
    d.port = endpoint.port;
    d.isSimulator = true;
    return d;
}

DiscoveryEngine::DiscoveryEngine(config::DiscoveryConfig config,
                                 std::shared_ptr<DiscoveryProbes> probes,
                                 DeviceTable& available,
                                 std::shared_ptr<StatePersistence> persistence,
                                 int staleAfterDays, DiscoveryTimings timings)
    : config_(std::move(config)),
      probes_(std::move(probes)),
      available_(available),
      persistence_(std::move(persistence)),
      staleAfterDays_(staleAfterDays),
      timings_(timings) {}

auto DiscoveryEngine::discover(std::optional<std::chrono::milliseconds> timeout)
    -> std::vector<DeviceDescriptor> {
    std::lock_guard lock(discoveryMutex_);

    auto window = timeout.value_or(config_.timeout());
    window = std::clamp(
        window,
        std::chrono::milliseconds(
            static_cast<long long>(config::DiscoveryConfig::MIN_TIMEOUT * 1000)),
        std::chrono::milliseconds(
            static_cast<long long>(config::DiscoveryConfig::MAX_TIMEOUT * 1000)));
    spdlog::info("Starting device discovery (timeout: {}ms)", window.count());

    // Keep first-seen times of devices that are rediscovered
    std::unordered_map<std::string, utils::TimePoint> firstSeen;
    for (const auto& previous : available_.snapshot()) {
        firstSeen.emplace(previous.id, previous.discoveredAt);
    }
    available_.clear();

    auto udp = std::async(std::launch::async, [this, window] {
        return guarded("UDP", [this, window] { return runUdp(window); });
    });
    auto known = std::async(std::launch::async, [this] {
        return guarded("Known-host", [this] { return runKnownHosts(); });
    });
    auto simulators = std::async(std::launch::async, [this] {
        return guarded("Simulator", [this] { return runSimulators(); });
    });
    auto direct = guarded("Direct", [this] { return runDirect(); });

    std::vector<std::vector<DeviceDescriptor>> results;
    results.push_back(udp.get());
    results.push_back(known.get());
    results.push_back(simulators.get());
    results.push_back(std::move(direct));

    std::vector<DeviceDescriptor> added;
    for (auto& batch : results) {
        for (auto& device : batch) {
            if (auto it = firstSeen.find(device.id); it != firstSeen.end()) {
                device.discoveredAt = it->second;
            }
            if (available_.insertIfAbsent(device)) {
                spdlog::info("Discovered: {} ({}) at {}:{}", device.name,
                             device.type, device.host, device.port);
                added.push_back(device);
            } else {
                spdlog::debug("Ignoring duplicate discovery of {}", device.id);
            }
        }
    }

    persist();

    spdlog::info("Discovery complete: found {} devices", added.size());
    if (added.empty()) {
        spdlog::warn(
            "No ASCOM devices found on network. Ensure devices are powered on "
            "and connected.");
    }
    return added;
}

auto DiscoveryEngine::loadPersisted() -> size_t {
    if (!persistence_) {
        return 0;
    }
    size_t count = 0;
    for (const auto& device : persistence_->load()) {
        if (available_.insertIfAbsent(device)) {
            ++count;
        }
    }
    spdlog::debug("Seeded {} devices from persisted state", count);
    return count;
}

auto DiscoveryEngine::runUdp(std::chrono::milliseconds timeout)
    -> std::vector<DeviceDescriptor> {
    if (config_.skipUdp) {
        spdlog::debug("UDP discovery skipped by configuration");
        return {};
    }

    auto probes = probes_;
    auto servers = runWithCeiling<std::expected<std::vector<AlpacaServer>,
                                                ProbeFailure>>(
        [probes, timeout] { return probes->broadcast(timeout); },
        timeout + timings_.ceilingPadding);

    if (!servers) {
        spdlog::warn("UDP discovery exceeded {}ms, abandoning",
                     (timeout + timings_.ceilingPadding).count());
        return {};
    }
    if (!servers->has_value()) {
        spdlog::warn("UDP discovery failed: {}", servers->error().message);
        return {};
    }

    std::vector<DeviceDescriptor> devices;
    for (const auto& server : servers->value()) {
        auto found = probes_->configuredDevices(server.host, server.port,
                                                timings_.managementTimeout);
        if (!found) {
            spdlog::warn("Alpaca server {}:{} did not list devices: {}",
                         server.host, server.port, found.error().message);
            continue;
        }
        devices.insert(devices.end(), found->begin(), found->end());
    }
    return devices;
}

auto DiscoveryEngine::runKnownHosts() -> std::vector<DeviceDescriptor> {
    std::vector<DeviceDescriptor> devices;
    for (const auto& known : config_.knownDevices) {
        spdlog::info("Checking known device: {} at {}:{}", known.name,
                     known.host, known.port);
        auto found = probes_->configuredDevices(known.host, known.port,
                                                timings_.managementTimeout);
        if (!found) {
            spdlog::warn("Known device {} at {}:{}: {}", known.name,
                         known.host, known.port, found.error().message);
            continue;
        }
        for (const auto& device : *found) {
            spdlog::info("Added known device: {} ({}) from {}", device.name,
                         device.type, known.name);
        }
        devices.insert(devices.end(), found->begin(), found->end());
    }
    return devices;
}

auto DiscoveryEngine::runSimulators() -> std::vector<DeviceDescriptor> {
    std::vector<DeviceDescriptor> devices;
    for (const auto& simulator : config_.simulatorDevices) {
        auto reachable = probes_->tcpReachable(simulator.host, simulator.port,
                                               timings_.tcpTimeout);
        if (!reachable) {
            spdlog::debug("Simulator {} at {}:{} not reachable: {}",
                          simulator.name, simulator.host, simulator.port,
                          reachable.error().message);
            continue;
        }
        devices.push_back(makeSimulatorDescriptor(simulator));
    }
    return devices;
}

auto DiscoveryEngine::runDirect() -> std::vector<DeviceDescriptor> {
    std::vector<DeviceDescriptor> devices;
    for (const auto& direct : config_.directDevices) {
        devices.push_back(DeviceResolver::descriptorFromConnection(
            direct.id, ConnectionTarget{direct.name, direct.host, direct.port}));
    }
    return devices;
}

void DiscoveryEngine::persist() {
    if (!persistence_) {
        return;
    }
    auto merged =
        StatePersistence::merge(persistence_->load(), available_.snapshot());
    persistence_->save(StatePersistence::cleanupStale(merged, staleAfterDays_));
}

}  // namespace skybridge::device::discovery
