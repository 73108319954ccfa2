/*
 * connection_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exclusive connect/disconnect of Alpaca devices with
multi-source resolution and retry

**************************************************/

#include "connection_manager.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "common/bridge_exceptions.hpp"
#include "device_resolver.hpp"

namespace skybridge::device {

namespace {

auto toLower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

auto notFound(const std::string& deviceId) -> DeviceNotFoundException {
    return DeviceNotFoundException(
        deviceId,
        std::format(
            "Device '{}' not found. Options: (1) run device discovery to find "
            "devices on the network; (2) connect directly with "
            "'name@host:port', e.g. 'seestar@192.168.1.50:5555'; (3) declare "
            "the device in ASCOM_DIRECT_DEVICES as 'id@host:port:name'.",
            deviceId),
        "Run discovery, use a name@host:port connection string, or set "
        "ASCOM_DIRECT_DEVICES");
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

class ConnectionManager::Impl {
public:
    Impl(ConnectionOptions opts,
         std::shared_ptr<client::alpaca::DeviceClientFactory> clientFactory,
         std::shared_ptr<StatePersistence> statePersistence,
         DeviceTable& availableTable)
        : options(std::move(opts)),
          factory(std::move(clientFactory)),
          persistence(std::move(statePersistence)),
          available(availableTable) {}

    auto findConnected(const std::string& deviceId) const -> ConnectedHandle* {
        std::shared_lock lock(tableMutex);
        if (auto it = connected.find(deviceId); it != connected.end()) {
            return it->second.get();
        }
        return nullptr;
    }

    auto resolve(const std::string& deviceId) const -> DeviceDescriptor {
        if (auto found = available.find(deviceId)) {
            spdlog::debug("Resolved {} from available devices", deviceId);
            return *found;
        }

        if (persistence) {
            for (const auto& device : persistence->load()) {
                if (device.id == deviceId) {
                    spdlog::debug("Resolved {} from persisted state", deviceId);
                    return device;
                }
            }
        }

        if (auto target = DeviceResolver::parseConnectionString(deviceId)) {
            spdlog::debug("Resolved {} as a direct connection string",
                          deviceId);
            return DeviceResolver::descriptorFromConnection(deviceId, *target);
        }

        for (const auto& direct : options.directDevices) {
            if (direct.id == deviceId) {
                spdlog::debug("Resolved {} from configured direct devices",
                              deviceId);
                return DeviceResolver::descriptorFromConnection(
                    deviceId,
                    ConnectionTarget{direct.name, direct.host, direct.port});
            }
        }

        if (auto known = resolveKnown(deviceId)) {
            return *known;
        }

        throw notFound(deviceId);
    }

    /// Known hosts matched by name, or "type_number" ids on the first host
    auto resolveKnown(const std::string& deviceId) const
        -> std::optional<DeviceDescriptor> {
        if (options.knownDevices.empty()) {
            return std::nullopt;
        }

        auto lowerId = toLower(deviceId);
        for (const auto& known : options.knownDevices) {
            if (toLower(known.name) == lowerId) {
                spdlog::debug("Resolved {} as known device {}:{}", deviceId,
                              known.host, known.port);
                auto d = DeviceResolver::descriptorFromConnection(
                    deviceId, ConnectionTarget{known.name, known.host,
                                               known.port});
                return d;
            }
        }

        if (auto kindId = DeviceResolver::parseKindId(deviceId)) {
            const auto& known = options.knownDevices.front();
            spdlog::debug("Resolved {} against known host {}:{}", deviceId,
                          known.host, known.port);
            auto d = DeviceResolver::descriptorFromConnection(
                deviceId,
                ConnectionTarget{known.name, known.host, known.port});
            d.type = client::alpaca::deviceKindName(kindId->first);
            d.number = kindId->second;
            return d;
        }
        return std::nullopt;
    }

    auto activate(client::alpaca::DeviceKind kind,
                  const DeviceDescriptor& descriptor)
        -> std::unique_ptr<client::alpaca::DeviceClient> {
        client::alpaca::DeviceAddress address{descriptor.host, descriptor.port,
                                              descriptor.number};
        std::string lastError;
        const int attempts = std::max(1, options.retry.maxAttempts);

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            try {
                auto client = factory->create(kind, address);
                if (!client) {
                    throw UnsupportedOperationException(
                        "No client available for device type " +
                        descriptor.type);
                }
                client->setConnected(true);
                if (!client->isConnected()) {
                    throw ConnectionFailedException(
                        "Device did not report Connected=true");
                }
                return client;
            } catch (const ConnectionFailedException& e) {
                lastError = e.what();
                spdlog::warn("Connection attempt {}/{} to {} failed: {}",
                             attempt, attempts, descriptor.id, lastError);
            }

            if (attempt < attempts) {
                auto delay = options.retry.delayFor(attempt);
                spdlog::debug("Retrying {} in {}ms", descriptor.id,
                              delay.count());
                std::this_thread::sleep_for(delay);
            }
        }

        throw ConnectionFailedException(
            descriptor.id,
            std::format("Connection to {} at {}:{} failed after {} attempts",
                        descriptor.id, descriptor.host, descriptor.port,
                        attempts),
            lastError);
    }

    void persistDevices(const std::vector<DeviceDescriptor>& devices) const {
        if (!persistence) {
            return;
        }
        auto merged = StatePersistence::merge(persistence->load(), devices);
        persistence->save(
            StatePersistence::cleanupStale(merged, options.staleAfterDays));
    }

    auto callback(const std::string& name) const -> DeviceCallback {
        std::lock_guard lock(callbackMutex);
        if (auto it = callbacks.find(name); it != callbacks.end()) {
            return it->second;
        }
        return {};
    }

    static void invoke(const DeviceCallback& cb, const char* name,
                       const std::string& deviceId,
                       const DeviceDescriptor& descriptor) {
        if (!cb) {
            return;
        }
        try {
            cb(deviceId, descriptor);
        } catch (const std::exception& e) {
            spdlog::error("{} callback for {} failed: {}", name, deviceId,
                          e.what());
        }
    }

    ConnectionOptions options;
    std::shared_ptr<client::alpaca::DeviceClientFactory> factory;
    std::shared_ptr<StatePersistence> persistence;
    DeviceTable& available;

    std::mutex connectionMutex;  ///< Serializes connect and disconnect
    mutable std::shared_mutex tableMutex;
    std::unordered_map<std::string, std::unique_ptr<ConnectedHandle>> connected;
    std::vector<std::string> connectedOrder;

    mutable std::mutex callbackMutex;
    std::unordered_map<std::string, DeviceCallback> callbacks;
};

// ============================================================================
// ConnectionManager
// ============================================================================

ConnectionManager::ConnectionManager(
    ConnectionOptions options,
    std::shared_ptr<client::alpaca::DeviceClientFactory> factory,
    std::shared_ptr<StatePersistence> persistence)
    : pimpl_(std::make_unique<Impl>(std::move(options), std::move(factory),
                                    std::move(persistence), available_)) {}

ConnectionManager::~ConnectionManager() = default;

auto ConnectionManager::connect(const std::string& deviceId)
    -> ConnectedHandle& {
    std::unique_lock connectionLock(pimpl_->connectionMutex);

    if (auto* existing = pimpl_->findConnected(deviceId)) {
        spdlog::info("Device {} already connected", deviceId);
        existing->updateLastUsed();
        return *existing;
    }

    auto descriptor = pimpl_->resolve(deviceId);
    descriptor.id = deviceId;

    auto kind = client::alpaca::parseDeviceKind(descriptor.type);
    if (!kind) {
        throw UnsupportedOperationException("Unsupported device type: " +
                                            descriptor.type);
    }

    spdlog::info("Connecting to {} at {}:{}", descriptor.name, descriptor.host,
                 descriptor.port);
    auto client = pimpl_->activate(*kind, descriptor);

    auto handle =
        std::make_unique<ConnectedHandle>(descriptor, std::move(client));
    ConnectedHandle& ref = *handle;
    {
        std::unique_lock lock(pimpl_->tableMutex);
        pimpl_->connected.emplace(deviceId, std::move(handle));
        pimpl_->connectedOrder.push_back(deviceId);
    }
    spdlog::info("Successfully connected to {}", descriptor.name);

    pimpl_->persistDevices({descriptor});

    auto hook = pimpl_->callback(ON_DEVICE_CONNECTED);
    connectionLock.unlock();
    Impl::invoke(hook, ON_DEVICE_CONNECTED, deviceId, descriptor);
    return ref;
}

void ConnectionManager::disconnect(const std::string& deviceId) {
    std::unique_lock connectionLock(pimpl_->connectionMutex);

    auto* handle = pimpl_->findConnected(deviceId);
    if (handle == nullptr) {
        spdlog::warn("Device {} not connected", deviceId);
        return;
    }

    DeviceDescriptor descriptor = handle->descriptor();
    spdlog::info("Disconnecting from {}", descriptor.name);

    try {
        handle->client().setConnected(false);
    } catch (const std::exception& e) {
        spdlog::error("Error during disconnect of {}: {}", deviceId, e.what());
    }

    {
        std::unique_lock lock(pimpl_->tableMutex);
        pimpl_->connected.erase(deviceId);
        auto& order = pimpl_->connectedOrder;
        order.erase(std::remove(order.begin(), order.end(), deviceId),
                    order.end());
    }
    spdlog::info("Disconnected from {}", descriptor.name);

    auto hook = pimpl_->callback(ON_DEVICE_DISCONNECTED);
    connectionLock.unlock();
    Impl::invoke(hook, ON_DEVICE_DISCONNECTED, deviceId, descriptor);
}

auto ConnectionManager::getConnected(const std::string& deviceId)
    -> ConnectedHandle& {
    auto* handle = pimpl_->findConnected(deviceId);
    if (handle == nullptr) {
        throw DeviceNotConnectedException(deviceId);
    }
    handle->updateLastUsed();
    return *handle;
}

auto ConnectionManager::isConnected(const std::string& deviceId) const
    -> bool {
    return pimpl_->findConnected(deviceId) != nullptr;
}

auto ConnectionManager::connectedIds() const -> std::vector<std::string> {
    std::shared_lock lock(pimpl_->tableMutex);
    return pimpl_->connectedOrder;
}

auto ConnectionManager::resolve(const std::string& deviceId) const
    -> DeviceDescriptor {
    auto descriptor = pimpl_->resolve(deviceId);
    descriptor.id = deviceId;
    return descriptor;
}

auto ConnectionManager::availableDevices() const -> json {
    return toJson(available_.snapshot());
}

auto ConnectionManager::connectedDevices() const -> json {
    std::shared_lock lock(pimpl_->tableMutex);
    json devices = json::array();
    for (const auto& id : pimpl_->connectedOrder) {
        devices.push_back(pimpl_->connected.at(id)->toJson());
    }
    return devices;
}

auto ConnectionManager::deviceInfo(const std::string& deviceId) -> json {
    {
        std::shared_lock lock(pimpl_->tableMutex);
        if (auto it = pimpl_->connected.find(deviceId);
            it != pimpl_->connected.end()) {
            auto& handle = *it->second;
            json info = handle.toJson();
            info["connected"] = true;
            try {
                info.update(handle.client().extendedInfo());
            } catch (const BridgeException& e) {
                spdlog::warn("Could not get extended info for {}: {}",
                             deviceId, e.what());
            }
            return info;
        }
    }

    if (auto available = available_.find(deviceId)) {
        json info = available->toJson();
        info["connected"] = false;
        return info;
    }

    throw DeviceNotFoundException(
        deviceId, std::format("Device {} not found", deviceId),
        "Run discovery or connect the device first");
}

void ConnectionManager::registerEventCallback(const std::string& name,
                                              DeviceCallback callback) {
    if (name != ON_DEVICE_CONNECTED && name != ON_DEVICE_DISCONNECTED) {
        throw InvalidParameterException(
            "Unknown event callback: " + name,
            std::format("Use {} or {}", ON_DEVICE_CONNECTED,
                        ON_DEVICE_DISCONNECTED));
    }
    std::lock_guard lock(pimpl_->callbackMutex);
    pimpl_->callbacks[name] = std::move(callback);
    spdlog::debug("Registered {} callback", name);
}

void ConnectionManager::shutdown() {
    auto ids = connectedIds();
    std::vector<DeviceDescriptor> known = available_.snapshot();
    {
        std::shared_lock lock(pimpl_->tableMutex);
        for (const auto& id : ids) {
            if (auto it = pimpl_->connected.find(id);
                it != pimpl_->connected.end()) {
                known.push_back(it->second->descriptor());
            }
        }
    }

    for (const auto& id : ids) {
        disconnect(id);
    }
    pimpl_->persistDevices(known);
    spdlog::info("Connection manager shutdown complete");
}

}  // namespace skybridge::device
