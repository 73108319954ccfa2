/*
 * connection_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exclusive connect/disconnect of Alpaca devices with
multi-source resolution and retry

**************************************************/

#ifndef SKYBRIDGE_DEVICE_CONNECTION_MANAGER_HPP
#define SKYBRIDGE_DEVICE_CONNECTION_MANAGER_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "client/alpaca/device_client.hpp"
#include "config/bridge_config.hpp"
#include "device_table.hpp"
#include "state_persistence.hpp"
#include "types.hpp"

namespace skybridge::device {

/**
 * @brief Lifecycle hook, invoked with (device_id, descriptor)
 */
using DeviceCallback =
    std::function<void(const std::string& deviceId,
                       const DeviceDescriptor& descriptor)>;

inline constexpr const char* ON_DEVICE_CONNECTED = "on_device_connected";
inline constexpr const char* ON_DEVICE_DISCONNECTED = "on_device_disconnected";

/**
 * @brief Resolution sources and activation policy
 */
struct ConnectionOptions {
    config::RetryConfig retry;
    std::vector<config::DirectDevice> directDevices;
    std::vector<config::HostEndpoint> knownDevices;
    int staleAfterDays{30};
};

/**
 * @brief Owns the available and connected device tables
 *
 * connect() resolves an id, in order, against:
 *   1. the connected table (returns the existing handle)
 *   2. the available table
 *   3. the persisted snapshot
 *   4. a "[name@]host:port" connection string
 *   5. configured direct devices
 *   6. configured known devices, by name or by a "type_number" id
 *
 * One connect or disconnect runs at a time. Handles stay owned by the
 * manager; a returned reference is valid until that id is disconnected.
 */
class ConnectionManager {
public:
    ConnectionManager(ConnectionOptions options,
                      std::shared_ptr<client::alpaca::DeviceClientFactory> factory,
                      std::shared_ptr<StatePersistence> persistence);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Connect a device, or return its existing handle
     *
     * @throws DeviceNotFoundException if no source knows the id
     * @throws InvalidParameterException for a malformed connection string
     * @throws UnsupportedOperationException if the type has no client
     * @throws ConnectionFailedException once retries are exhausted
     */
    auto connect(const std::string& deviceId) -> ConnectedHandle&;

    /**
     * @brief Deactivate and forget a device
     *
     * The id always leaves the connected table, even if deactivation
     * fails. Unknown ids are a no-op.
     */
    void disconnect(const std::string& deviceId);

    /**
     * @brief Connected handle for an id, refreshing last_used
     * @throws DeviceNotConnectedException
     */
    auto getConnected(const std::string& deviceId) -> ConnectedHandle&;

    [[nodiscard]] auto isConnected(const std::string& deviceId) const -> bool;

    [[nodiscard]] auto connectedIds() const -> std::vector<std::string>;

    /**
     * @brief Resolve an id to a descriptor without connecting
     * @throws DeviceNotFoundException, InvalidParameterException
     */
    [[nodiscard]] auto resolve(const std::string& deviceId) const
        -> DeviceDescriptor;

    [[nodiscard]] auto availableTable() -> DeviceTable& { return available_; }
    [[nodiscard]] auto availableTable() const -> const DeviceTable& {
        return available_;
    }

    /**
     * @brief Available descriptors as a JSON array
     */
    [[nodiscard]] auto availableDevices() const -> json;

    /**
     * @brief Connected descriptors with connected_at and last_used
     */
    [[nodiscard]] auto connectedDevices() const -> json;

    /**
     * @brief Descriptor plus connection state and driver details
     * @throws DeviceNotFoundException if neither connected nor available
     */
    [[nodiscard]] auto deviceInfo(const std::string& deviceId) -> json;

    /**
     * @brief Register a lifecycle hook
     *
     * Accepted names are "on_device_connected" and
     * "on_device_disconnected". Registering again replaces the hook.
     *
     * @throws InvalidParameterException for any other name
     */
    void registerEventCallback(const std::string& name, DeviceCallback callback);

    /**
     * @brief Disconnect every device and write the snapshot
     */
    void shutdown();

private:
    DeviceTable available_;

    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_CONNECTION_MANAGER_HPP
