/*
 * device_resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsing of device ids and direct connection strings

**************************************************/

#include "device_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <regex>

#include <spdlog/spdlog.h>

#include "common/bridge_exceptions.hpp"

namespace skybridge::device {

namespace {

const std::regex CONNECTION_PATTERN{R"(^(?:([^@]+)@)?([^:]+):(\d+)$)"};

auto titleCase(std::string text) -> std::string {
    bool startOfWord = true;
    for (auto& c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(startOfWord ? std::toupper(uc)
                                              : std::tolower(uc));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return text;
}

auto parseInt(const std::string& text) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto DeviceResolver::parseConnectionString(const std::string& text)
    -> std::optional<ConnectionTarget> {
    std::smatch match;
    if (!std::regex_match(text, match, CONNECTION_PATTERN)) {
        return std::nullopt;
    }

    ConnectionTarget target;
    target.name =
        match[1].matched ? match[1].str() : std::string(DEFAULT_CONNECTION_NAME);
    target.host = match[2].str();

    auto port = parseInt(match[3].str());
    if (!port || *port <= 0 || *port > 65535) {
        throw InvalidParameterException(
            std::format("Invalid port in connection string '{}'", text),
            "Use a port between 1 and 65535, e.g. seestar@192.168.1.50:5555");
    }
    target.port = *port;
    return target;
}

auto DeviceResolver::parseDeviceIdType(const std::string& deviceId)
    -> std::pair<std::string, int> {
    std::string type = "Telescope";
    int number = 1;

    auto pos = deviceId.rfind('_');
    if (pos != std::string::npos) {
        type = titleCase(deviceId.substr(0, pos));
        if (auto parsed = parseInt(deviceId.substr(pos + 1))) {
            number = *parsed;
        }
    }
    return {type, number};
}

auto DeviceResolver::parseKindId(const std::string& deviceId)
    -> std::optional<std::pair<client::alpaca::DeviceKind, int>> {
    auto pos = deviceId.rfind('_');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    auto kind = client::alpaca::parseDeviceKind(deviceId.substr(0, pos));
    auto number = parseInt(deviceId.substr(pos + 1));
    if (!kind || !number || *number < 0) {
        return std::nullopt;
    }
    return std::make_pair(*kind, *number);
}

auto DeviceResolver::descriptorFromConnection(const std::string& deviceId,
                                              const ConnectionTarget& target)
    -> DeviceDescriptor {
    DeviceDescriptor d;
    d.id = deviceId;
    d.type = client::alpaca::deviceKindName(client::alpaca::DeviceKind::Telescope);
    d.number = 1;

    auto [type, number] = parseDeviceIdType(deviceId);
    if (auto kind = client::alpaca::parseDeviceKind(type)) {
        d.type = client::alpaca::deviceKindName(*kind);
        d.number = number;
    }

    d.name = target.name;
    d.host = target.host;
    d.port = target.port;
    d.uniqueId = std::format("{}_{}_{}", deviceId, target.host, target.port);
    d.apiVersion = 1;
    spdlog::debug("Resolved {} to {} #{} at {}:{}", deviceId, d.type, d.number,
                  d.host, d.port);
    return d;
}

}  // namespace skybridge::device
