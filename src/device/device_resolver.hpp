/*
 * device_resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsing of device ids and direct connection strings

**************************************************/

#ifndef SKYBRIDGE_DEVICE_DEVICE_RESOLVER_HPP
#define SKYBRIDGE_DEVICE_DEVICE_RESOLVER_HPP

#include <optional>
#include <string>
#include <utility>

#include "client/alpaca/device_kind.hpp"
#include "types.hpp"

namespace skybridge::device {

/**
 * @brief Parsed form of "[name@]host:port"
 */
struct ConnectionTarget {
    std::string name;
    std::string host;
    int port{0};
};

/**
 * @brief Pure helpers turning ids and connection strings into descriptors
 */
class DeviceResolver {
public:
    static constexpr const char* DEFAULT_CONNECTION_NAME = "Direct Connection";

    /**
     * @brief Parse "[name@]host:port"
     *
     * @return std::nullopt if the text does not have that shape
     * @throws InvalidParameterException if it has the shape but the port is
     *         outside 1-65535
     */
    [[nodiscard]] static auto parseConnectionString(const std::string& text)
        -> std::optional<ConnectionTarget>;

    /**
     * @brief Split "type_number" into a title-cased type and a number
     *
     * Falls back to ("Telescope", 1). A non-numeric suffix keeps the type
     * and uses number 1.
     */
    [[nodiscard]] static auto parseDeviceIdType(const std::string& deviceId)
        -> std::pair<std::string, int>;

    /**
     * @brief Strict form of parseDeviceIdType for supported kinds only
     */
    [[nodiscard]] static auto parseKindId(const std::string& deviceId)
        -> std::optional<std::pair<client::alpaca::DeviceKind, int>>;

    /**
     * @brief Descriptor for a device reached by host and port
     *
     * The id is kept as given. Type and number come from the id when it
     * names a supported kind, otherwise Telescope #1. The unique id is
     * "{id}_{host}_{port}".
     */
    [[nodiscard]] static auto descriptorFromConnection(
        const std::string& deviceId, const ConnectionTarget& target)
        -> DeviceDescriptor;
};

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_DEVICE_RESOLVER_HPP
