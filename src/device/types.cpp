/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device descriptors and connected handles

**************************************************/

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <format>

#include <spdlog/spdlog.h>

namespace skybridge::device {

auto DeviceDescriptor::makeId(const std::string& type, int number)
    -> std::string {
    std::string lower = type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return std::format("{}_{}", lower, number);
}

auto DeviceDescriptor::connectionUrl() const -> std::string {
    return std::format("http://{}:{}/api/v{}", host, port, apiVersion);
}

auto DeviceDescriptor::toJson() const -> json {
    return {{"id", id},
            {"name", name},
            {"type", type},
            {"number", number},
            {"unique_id", uniqueId},
            {"host", host},
            {"port", port},
            {"api_version", apiVersion},
            {"is_simulator", isSimulator},
            {"discovered_at", utils::toIsoString(discoveredAt)},
            {"connection_url", connectionUrl()}};
}

auto DeviceDescriptor::fromJson(const json& j) -> DeviceDescriptor {
    DeviceDescriptor d;
    d.type = j.value("type", d.type);
    d.number = j.value("number", d.number);
    d.id = j.value("id", makeId(d.type, d.number));
    d.name = j.value("name", d.name);
    d.uniqueId = j.value("unique_id", d.uniqueId);
    d.host = j.value("host", d.host);
    d.port = j.value("port", d.port);
    d.apiVersion = j.value("api_version", d.apiVersion);
    d.isSimulator = j.value("is_simulator", d.isSimulator);

    auto discovered = j.value("discovered_at", std::string{});
    if (auto tp = utils::parseIsoString(discovered)) {
        d.discoveredAt = *tp;
    } else if (!discovered.empty()) {
        spdlog::debug("Device {} has unreadable discovered_at '{}'", d.id,
                      discovered);
    }
    return d;
}

auto DeviceDescriptor::fromAlpaca(const json& record, const std::string& host,
                                  int port) -> DeviceDescriptor {
    DeviceDescriptor d;
    d.type = record.value("DeviceType", std::string{"unknown"});
    d.number = record.value("DeviceNumber", 0);
    d.id = makeId(d.type, d.number);
    d.name = record.value("DeviceName", d.name);
    d.uniqueId = record.value("UniqueID", d.uniqueId);
    d.host = host;
    d.port = port;
    return d;
}

auto toJson(const std::vector<DeviceDescriptor>& devices) -> json {
    json array = json::array();
    for (const auto& device : devices) {
        array.push_back(device.toJson());
    }
    return array;
}

// ============================================================================
// ConnectedHandle
// ============================================================================

ConnectedHandle::ConnectedHandle(
    DeviceDescriptor descriptor,
    std::unique_ptr<client::alpaca::DeviceClient> client)
    : descriptor_(std::move(descriptor)),
      client_(std::move(client)),
      connectedAt_(utils::Clock::now()),
      lastUsed_(connectedAt_) {}

auto ConnectedHandle::client() -> client::alpaca::DeviceClient& {
    updateLastUsed();
    return *client_;
}

void ConnectedHandle::updateLastUsed() { lastUsed_.store(utils::Clock::now()); }

auto ConnectedHandle::toJson() const -> json {
    json j = descriptor_.toJson();
    j["connected_at"] = utils::toIsoString(connectedAt_);
    j["last_used"] = utils::toIsoString(lastUsed_.load());
    return j;
}

}  // namespace skybridge::device
