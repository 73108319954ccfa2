/*
 * alpaca_client_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Factory building typed Alpaca clients

**************************************************/

#include "alpaca_client_factory.hpp"

#include "alpaca_device.hpp"

namespace skybridge::client::alpaca {

AlpacaClientFactory::AlpacaClientFactory(
    std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {}

auto AlpacaClientFactory::create(DeviceKind kind, const DeviceAddress& address)
    -> std::unique_ptr<DeviceClient> {
    switch (kind) {
        case DeviceKind::Telescope:
            return std::make_unique<AlpacaTelescope>(transport_, address);
        case DeviceKind::Camera:
            return std::make_unique<AlpacaCamera>(transport_, address);
        case DeviceKind::Focuser:
            return std::make_unique<AlpacaFocuser>(transport_, address);
        case DeviceKind::FilterWheel:
            return std::make_unique<AlpacaFilterWheel>(transport_, address);
    }
    return nullptr;
}

}  // namespace skybridge::client::alpaca
