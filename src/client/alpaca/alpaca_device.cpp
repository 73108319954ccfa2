/*
 * alpaca_device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Alpaca REST device clients

**************************************************/

#include "alpaca_device.hpp"

#include <spdlog/spdlog.h>

#include <format>

#include "device/common/bridge_exceptions.hpp"

namespace skybridge::client::alpaca {

namespace {

constexpr int CLIENT_ID = 1;

/// Run one accessor for extendedInfo(), logging instead of failing
template <typename Fn>
void tryAdd(json& info, const char* key, Fn&& fn) {
    try {
        info[key] = fn();
    } catch (const device::BridgeException& e) {
        spdlog::warn("Could not read {}: {}", key, e.what());
    } catch (const json::exception& e) {
        spdlog::warn("Unexpected value for {}: {}", key, e.what());
    }
}

}  // namespace

AlpacaResponse AlpacaResponse::fromJson(const json& j) {
    AlpacaResponse response;
    if (j.contains("Value")) {
        response.value = j["Value"];
    }
    response.errorNumber = j.value("ErrorNumber", 0);
    response.errorMessage = j.value("ErrorMessage", "");
    response.clientTransactionId = j.value("ClientTransactionID", 0);
    response.serverTransactionId = j.value("ServerTransactionID", 0);
    return response;
}

AlpacaDevice::AlpacaDevice(std::shared_ptr<HttpTransport> transport,
                           DeviceKind kind, DeviceAddress address,
                           std::chrono::milliseconds timeout)
    : transport_(std::move(transport)),
      kind_(kind),
      address_(std::move(address)),
      timeout_(timeout) {
    spdlog::debug("AlpacaDevice created for {} #{} at {}:{}",
                  deviceKindName(kind_), address_.number, address_.host,
                  address_.port);
}

auto AlpacaDevice::buildUrl(const std::string& method) const -> std::string {
    return std::format("http://{}:{}/api/v1/{}/{}/{}", address_.host,
                       address_.port, deviceKindPath(kind_), address_.number,
                       method);
}

auto AlpacaDevice::nextTransactionId() -> int {
    return transactionId_.fetch_add(1);
}

auto AlpacaDevice::parseResponse(const std::string& method, long status,
                                 const std::string& body) -> json {
    if (status < 200 || status >= 300) {
        throw device::ConnectionFailedException(
            std::format("HTTP {} from {}", status, buildUrl(method)));
    }

    AlpacaResponse response;
    try {
        response = AlpacaResponse::fromJson(json::parse(body));
    } catch (const json::exception& e) {
        throw device::ConnectionFailedException(
            std::format("Malformed Alpaca response for {}: {}", method,
                        e.what()));
    }

    if (!response.isSuccess()) {
        throw device::ConnectionFailedException(
            std::format("Alpaca error {} on {}: {}", response.errorNumber,
                        method, response.errorMessage));
    }
    return response.value;
}

auto AlpacaDevice::getProperty(const std::string& method) -> json {
    std::string url = std::format("{}?ClientID={}&ClientTransactionID={}",
                                  buildUrl(method), CLIENT_ID,
                                  nextTransactionId());
    auto result = transport_->get(url, timeout_);
    if (!result) {
        throw device::ConnectionFailedException(std::format(
            "GET {} failed: {}", buildUrl(method), result.error().message));
    }
    return parseResponse(method, result->status, result->body);
}

auto AlpacaDevice::putProperty(const std::string& method,
                               const std::map<std::string, std::string>& params)
    -> json {
    std::string body;
    for (const auto& [key, value] : params) {
        body += key + "=" + urlEncode(value) + "&";
    }
    body += std::format("ClientID={}&ClientTransactionID={}", CLIENT_ID,
                        nextTransactionId());

    auto result = transport_->put(buildUrl(method), body, timeout_);
    if (!result) {
        throw device::ConnectionFailedException(std::format(
            "PUT {} failed: {}", buildUrl(method), result.error().message));
    }
    return parseResponse(method, result->status, result->body);
}

void AlpacaDevice::setConnected(bool connected) {
    putProperty("connected", {{"Connected", connected ? "true" : "false"}});
    spdlog::debug("{} #{} Connected={}", deviceKindName(kind_),
                  address_.number, connected);
}

auto AlpacaDevice::isConnected() -> bool {
    auto value = getProperty("connected");
    return value.is_boolean() && value.get<bool>();
}

auto AlpacaDevice::description() -> std::string {
    return getProperty("description").get<std::string>();
}

auto AlpacaDevice::driverInfo() -> std::string {
    return getProperty("driverinfo").get<std::string>();
}

auto AlpacaDevice::driverVersion() -> std::string {
    return getProperty("driverversion").get<std::string>();
}

auto AlpacaDevice::interfaceVersion() -> int {
    return getProperty("interfaceversion").get<int>();
}

auto AlpacaDevice::extendedInfo() -> json {
    json info = json::object();
    tryAdd(info, "driver_info", [this] { return driverInfo(); });
    tryAdd(info, "driver_version", [this] { return driverVersion(); });
    tryAdd(info, "interface_version", [this] { return interfaceVersion(); });
    tryAdd(info, "description", [this] { return description(); });
    addTypeInfo(info);
    return info;
}

// ============================================================================
// Typed clients
// ============================================================================

auto AlpacaTelescope::canSlew() -> bool {
    return getProperty("canslew").get<bool>();
}

auto AlpacaTelescope::canPark() -> bool {
    return getProperty("canpark").get<bool>();
}

void AlpacaTelescope::addTypeInfo(json& info) {
    tryAdd(info, "can_slew", [this] { return canSlew(); });
    tryAdd(info, "can_park", [this] { return canPark(); });
    tryAdd(info, "can_find_home",
           [this] { return getProperty("canfindhome").get<bool>(); });
}

auto AlpacaCamera::sensorType() -> int {
    return getProperty("sensortype").get<int>();
}

auto AlpacaCamera::pixelSizeX() -> double {
    return getProperty("pixelsizex").get<double>();
}

void AlpacaCamera::addTypeInfo(json& info) {
    tryAdd(info, "sensor_type", [this] { return sensorType(); });
    tryAdd(info, "pixel_size", [this] { return pixelSizeX(); });
    tryAdd(info, "max_bin", [this] { return getProperty("maxbinx").get<int>(); });
}

auto AlpacaFocuser::position() -> int {
    return getProperty("position").get<int>();
}

void AlpacaFocuser::addTypeInfo(json& info) {
    tryAdd(info, "position", [this] { return position(); });
}

auto AlpacaFilterWheel::names() -> std::vector<std::string> {
    return getProperty("names").get<std::vector<std::string>>();
}

void AlpacaFilterWheel::addTypeInfo(json& info) {
    tryAdd(info, "names", [this] { return names(); });
}

}  // namespace skybridge::client::alpaca
