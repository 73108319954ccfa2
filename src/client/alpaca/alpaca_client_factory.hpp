/*
 * alpaca_client_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Factory building typed Alpaca clients

**************************************************/

#ifndef SKYBRIDGE_CLIENT_ALPACA_ALPACA_CLIENT_FACTORY_HPP
#define SKYBRIDGE_CLIENT_ALPACA_ALPACA_CLIENT_FACTORY_HPP

#include <memory>

#include "device_client.hpp"
#include "http_transport.hpp"

namespace skybridge::client::alpaca {

/**
 * @brief Creates the typed client for each DeviceKind
 */
class AlpacaClientFactory : public DeviceClientFactory {
public:
    explicit AlpacaClientFactory(std::shared_ptr<HttpTransport> transport);

    [[nodiscard]] auto create(DeviceKind kind, const DeviceAddress& address)
        -> std::unique_ptr<DeviceClient> override;

private:
    std::shared_ptr<HttpTransport> transport_;
};

}  // namespace skybridge::client::alpaca

#endif  // SKYBRIDGE_CLIENT_ALPACA_ALPACA_CLIENT_FACTORY_HPP
