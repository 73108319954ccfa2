/*
 * device_kind.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Supported Alpaca device kinds

**************************************************/

#include "device_kind.hpp"

#include <algorithm>
#include <cctype>

namespace skybridge::client::alpaca {

auto deviceKindName(DeviceKind kind) -> std::string {
    switch (kind) {
        case DeviceKind::Telescope:
            return "Telescope";
        case DeviceKind::Camera:
            return "Camera";
        case DeviceKind::Focuser:
            return "Focuser";
        case DeviceKind::FilterWheel:
            return "FilterWheel";
    }
    return "Unknown";
}

auto deviceKindPath(DeviceKind kind) -> std::string {
    std::string name = deviceKindName(kind);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return name;
}

auto parseDeviceKind(std::string_view name) -> std::optional<DeviceKind> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (auto kind : ALL_DEVICE_KINDS) {
        if (deviceKindPath(kind) == lower) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace skybridge::client::alpaca
