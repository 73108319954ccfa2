/*
 * device_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Capability interface of a connected device client

**************************************************/

#ifndef SKYBRIDGE_CLIENT_ALPACA_DEVICE_CLIENT_HPP
#define SKYBRIDGE_CLIENT_ALPACA_DEVICE_CLIENT_HPP

#include <memory>
#include <string>

#include "atom/type/json.hpp"
#include "device_kind.hpp"

namespace skybridge::client::alpaca {

using json = nlohmann::json;

/**
 * @brief Network location of one device on an Alpaca server
 */
struct DeviceAddress {
    std::string host;
    int port{0};
    int number{0};
};

/**
 * @brief Opaque device client held by a connected handle
 *
 * The connection layer only toggles and reads the Connected property.
 * Everything else is type-specific and reported through extendedInfo().
 */
class DeviceClient {
public:
    virtual ~DeviceClient() = default;

    [[nodiscard]] virtual auto kind() const -> DeviceKind = 0;

    /**
     * @brief Write the Connected property
     * @throws device::ConnectionFailedException on transport or Alpaca error
     */
    virtual void setConnected(bool connected) = 0;

    /**
     * @brief Read the Connected property
     * @throws device::ConnectionFailedException on transport or Alpaca error
     */
    [[nodiscard]] virtual auto isConnected() -> bool = 0;

    /**
     * @brief Driver and type-specific details, best effort
     */
    [[nodiscard]] virtual auto extendedInfo() -> json = 0;
};

/**
 * @brief Builds a client for a device kind
 */
class DeviceClientFactory {
public:
    virtual ~DeviceClientFactory() = default;

    [[nodiscard]] virtual auto create(DeviceKind kind,
                                      const DeviceAddress& address)
        -> std::unique_ptr<DeviceClient> = 0;
};

}  // namespace skybridge::client::alpaca

#endif  // SKYBRIDGE_CLIENT_ALPACA_DEVICE_CLIENT_HPP
