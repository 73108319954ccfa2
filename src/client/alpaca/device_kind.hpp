/*
 * device_kind.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Supported Alpaca device kinds

**************************************************/

#ifndef SKYBRIDGE_CLIENT_ALPACA_DEVICE_KIND_HPP
#define SKYBRIDGE_CLIENT_ALPACA_DEVICE_KIND_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace skybridge::client::alpaca {

/**
 * @brief Device kinds that have a typed client
 */
enum class DeviceKind : uint8_t { Telescope, Camera, Focuser, FilterWheel };

inline constexpr std::array<DeviceKind, 4> ALL_DEVICE_KINDS{
    DeviceKind::Telescope, DeviceKind::Camera, DeviceKind::Focuser,
    DeviceKind::FilterWheel};

/**
 * @brief Canonical ASCOM type name, e.g. "FilterWheel"
 */
[[nodiscard]] auto deviceKindName(DeviceKind kind) -> std::string;

/**
 * @brief Lower-case name used in Alpaca URLs and device ids
 */
[[nodiscard]] auto deviceKindPath(DeviceKind kind) -> std::string;

/**
 * @brief Parse a device type name, ignoring case
 */
[[nodiscard]] auto parseDeviceKind(std::string_view name)
    -> std::optional<DeviceKind>;

}  // namespace skybridge::client::alpaca

#endif  // SKYBRIDGE_CLIENT_ALPACA_DEVICE_KIND_HPP
