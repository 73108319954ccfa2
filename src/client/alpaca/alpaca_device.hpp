/*
 * alpaca_device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Alpaca REST device clients

**************************************************/

#ifndef SKYBRIDGE_CLIENT_ALPACA_ALPACA_DEVICE_HPP
#define SKYBRIDGE_CLIENT_ALPACA_ALPACA_DEVICE_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "device_client.hpp"
#include "http_transport.hpp"

namespace skybridge::client::alpaca {

/**
 * @brief Alpaca response envelope
 */
struct AlpacaResponse {
    json value;
    int errorNumber{0};
    std::string errorMessage;
    int clientTransactionId{0};
    int serverTransactionId{0};

    [[nodiscard]] auto isSuccess() const -> bool { return errorNumber == 0; }

    [[nodiscard]] static AlpacaResponse fromJson(const json& j);
};

/**
 * @brief Base client speaking /api/v1/{type}/{number}/{method}
 */
class AlpacaDevice : public DeviceClient {
public:
    AlpacaDevice(std::shared_ptr<HttpTransport> transport, DeviceKind kind,
                 DeviceAddress address,
                 std::chrono::milliseconds timeout = std::chrono::seconds(10));

    [[nodiscard]] auto kind() const -> DeviceKind override { return kind_; }

    void setConnected(bool connected) override;
    [[nodiscard]] auto isConnected() -> bool override;
    [[nodiscard]] auto extendedInfo() -> json override;

    [[nodiscard]] auto description() -> std::string;
    [[nodiscard]] auto driverInfo() -> std::string;
    [[nodiscard]] auto driverVersion() -> std::string;
    [[nodiscard]] auto interfaceVersion() -> int;

    /**
     * @brief GET a property and return its Value
     * @throws device::ConnectionFailedException
     */
    auto getProperty(const std::string& method) -> json;

    /**
     * @brief PUT a property or method with form parameters
     * @throws device::ConnectionFailedException
     */
    auto putProperty(const std::string& method,
                     const std::map<std::string, std::string>& params) -> json;

    [[nodiscard]] auto buildUrl(const std::string& method) const
        -> std::string;

    [[nodiscard]] auto address() const -> const DeviceAddress& {
        return address_;
    }

protected:
    /// Type-specific fields appended to extendedInfo()
    virtual void addTypeInfo(json& /*info*/) {}

private:
    auto nextTransactionId() -> int;
    auto parseResponse(const std::string& method, long status,
                       const std::string& body) -> json;

    std::shared_ptr<HttpTransport> transport_;
    DeviceKind kind_;
    DeviceAddress address_;
    std::chrono::milliseconds timeout_;
    std::atomic<int> transactionId_{1};
};

class AlpacaTelescope : public AlpacaDevice {
public:
    AlpacaTelescope(std::shared_ptr<HttpTransport> transport,
                    DeviceAddress address)
        : AlpacaDevice(std::move(transport), DeviceKind::Telescope,
                       std::move(address)) {}

    [[nodiscard]] auto canSlew() -> bool;
    [[nodiscard]] auto canPark() -> bool;

protected:
    void addTypeInfo(json& info) override;
};

class AlpacaCamera : public AlpacaDevice {
public:
    AlpacaCamera(std::shared_ptr<HttpTransport> transport,
                 DeviceAddress address)
        : AlpacaDevice(std::move(transport), DeviceKind::Camera,
                       std::move(address)) {}

    [[nodiscard]] auto sensorType() -> int;
    [[nodiscard]] auto pixelSizeX() -> double;

protected:
    void addTypeInfo(json& info) override;
};

class AlpacaFocuser : public AlpacaDevice {
public:
    AlpacaFocuser(std::shared_ptr<HttpTransport> transport,
                  DeviceAddress address)
        : AlpacaDevice(std::move(transport), DeviceKind::Focuser,
                       std::move(address)) {}

    [[nodiscard]] auto position() -> int;

protected:
    void addTypeInfo(json& info) override;
};

class AlpacaFilterWheel : public AlpacaDevice {
public:
    AlpacaFilterWheel(std::shared_ptr<HttpTransport> transport,
                      DeviceAddress address)
        : AlpacaDevice(std::move(transport), DeviceKind::FilterWheel,
                       std::move(address)) {}

    [[nodiscard]] auto names() -> std::vector<std::string>;

protected:
    void addTypeInfo(json& info) override;
};

}  // namespace skybridge::client::alpaca

#endif  // SKYBRIDGE_CLIENT_ALPACA_ALPACA_DEVICE_HPP
