/*
 * bridge_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bridge configuration loading and environment overrides

**************************************************/

#include "bridge_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

#include "device/common/bridge_exceptions.hpp"

namespace skybridge::config {

namespace {

auto trim(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

auto split(std::string_view text, char sep) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

auto parsePort(const std::string& text) -> std::optional<int> {
    int port = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size() || port <= 0 ||
        port > 65535) {
        return std::nullopt;
    }
    return port;
}

auto parseBool(const std::string& text) -> std::optional<bool> {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off" ||
        lower.empty()) {
        return false;
    }
    return std::nullopt;
}

/// host:port[:name] tail shared by both list formats
auto parseHostPortName(const std::vector<std::string>& parts, size_t offset)
    -> std::optional<HostEndpoint> {
    if (parts.size() < offset + 2) {
        return std::nullopt;
    }
    HostEndpoint ep;
    ep.host = trim(parts[offset]);
    auto port = parsePort(trim(parts[offset + 1]));
    if (ep.host.empty() || !port) {
        return std::nullopt;
    }
    ep.port = *port;
    if (parts.size() > offset + 2) {
        // Names may contain colons
        std::string name;
        for (size_t i = offset + 2; i < parts.size(); ++i) {
            if (!name.empty()) {
                name += ':';
            }
            name += parts[i];
        }
        ep.name = trim(name);
    }
    if (ep.name.empty()) {
        ep.name = ep.host + ":" + std::to_string(ep.port);
    }
    return ep;
}

}  // namespace

auto processEnvironment(const std::string& name)
    -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ============================================================================
// List parsing
// ============================================================================

auto parseEndpointList(const std::string& text) -> std::vector<HostEndpoint> {
    std::vector<HostEndpoint> endpoints;
    for (const auto& raw : split(text, ',')) {
        auto entry = trim(raw);
        if (entry.empty()) {
            continue;
        }
        auto ep = parseHostPortName(split(entry, ':'), 0);
        if (!ep) {
            spdlog::warn("Skipping malformed device entry '{}'", entry);
            continue;
        }
        endpoints.push_back(std::move(*ep));
    }
    return endpoints;
}

auto parseDirectDeviceList(const std::string& text)
    -> std::vector<DirectDevice> {
    std::vector<DirectDevice> devices;
    for (const auto& raw : split(text, ',')) {
        auto entry = trim(raw);
        if (entry.empty()) {
            continue;
        }

        std::string id;
        std::optional<HostEndpoint> ep;
        if (auto at = entry.find('@'); at != std::string::npos) {
            id = trim(entry.substr(0, at));
            ep = parseHostPortName(split(entry.substr(at + 1), ':'), 0);
        } else {
            auto parts = split(entry, ':');
            if (!parts.empty()) {
                id = trim(parts[0]);
            }
            ep = parseHostPortName(parts, 1);
        }

        if (id.empty() || !ep) {
            spdlog::warn("Skipping malformed direct device entry '{}'", entry);
            continue;
        }

        DirectDevice dev;
        dev.id = std::move(id);
        dev.host = ep->host;
        dev.port = ep->port;
        dev.name = ep->name;
        devices.push_back(std::move(dev));
    }
    return devices;
}

// ============================================================================
// Section serialization
// ============================================================================

json DiscoveryConfig::toJson() const {
    json known = json::array();
    for (const auto& ep : knownDevices) {
        known.push_back(ep.toJson());
    }
    json simulators = json::array();
    for (const auto& ep : simulatorDevices) {
        simulators.push_back(ep.toJson());
    }
    json direct = json::array();
    for (const auto& dev : directDevices) {
        direct.push_back(dev.toJson());
    }
    return {{"timeoutSeconds", timeoutSeconds},
            {"skipUdp", skipUdp},
            {"knownDevices", known},
            {"simulatorDevices", simulators},
            {"directDevices", direct}};
}

DiscoveryConfig DiscoveryConfig::fromJson(const json& j) {
    DiscoveryConfig cfg;
    cfg.timeoutSeconds = j.value("timeoutSeconds", cfg.timeoutSeconds);
    cfg.skipUdp = j.value("skipUdp", cfg.skipUdp);
    if (j.contains("knownDevices") && j["knownDevices"].is_array()) {
        cfg.knownDevices.clear();
        for (const auto& item : j["knownDevices"]) {
            cfg.knownDevices.push_back(HostEndpoint::fromJson(item));
        }
    }
    if (j.contains("simulatorDevices") && j["simulatorDevices"].is_array()) {
        for (const auto& item : j["simulatorDevices"]) {
            cfg.simulatorDevices.push_back(HostEndpoint::fromJson(item));
        }
    }
    if (j.contains("directDevices") && j["directDevices"].is_array()) {
        for (const auto& item : j["directDevices"]) {
            cfg.directDevices.push_back(DirectDevice::fromJson(item));
        }
    }
    return cfg;
}

auto RetryConfig::delayFor(int attempt) const -> std::chrono::milliseconds {
    double delay = static_cast<double>(initialDelayMs) *
                   std::pow(multiplier, std::max(0, attempt - 1));
    delay = std::min(delay, static_cast<double>(maxDelayMs));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

auto PersistenceConfig::defaultStateFile() -> std::filesystem::path {
    std::filesystem::path base{"."};
    if (auto home = processEnvironment("HOME"); home && !home->empty()) {
        base = *home;
    }
    return base / ".skybridge" / "devices.json";
}

json BridgeConfig::toJson() const {
    return {{"discovery", discovery.toJson()},
            {"retry", retry.toJson()},
            {"events", events.toJson()},
            {"persistence", persistence.toJson()},
            {"logging", logging.toJson()}};
}

BridgeConfig BridgeConfig::fromJson(const json& j) {
    BridgeConfig cfg;
    if (j.contains("discovery")) {
        cfg.discovery = DiscoveryConfig::fromJson(j["discovery"]);
    }
    if (j.contains("retry")) {
        cfg.retry = RetryConfig::fromJson(j["retry"]);
    }
    if (j.contains("events")) {
        cfg.events = EventConfig::fromJson(j["events"]);
    }
    if (j.contains("persistence")) {
        cfg.persistence = PersistenceConfig::fromJson(j["persistence"]);
    }
    if (j.contains("logging")) {
        cfg.logging = logging::LoggingConfig::fromJson(j["logging"]);
    }
    cfg.normalize();
    return cfg;
}

// ============================================================================
// Sources
// ============================================================================

void BridgeConfig::loadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw device::InvalidParameterException(
            "Cannot read configuration file " + path.string(),
            "Check the --config path");
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw device::InvalidParameterException(
            "Malformed configuration file " + path.string() + ": " + e.what(),
            "Fix the JSON syntax in the configuration file");
    }
    if (!j.is_object()) {
        throw device::InvalidParameterException(
            "Configuration file " + path.string() + " is not a JSON object");
    }

    try {
        // Overlay onto the current values, section by section
        json merged = toJson();
        merged.merge_patch(j);
        *this = fromJson(merged);
    } catch (const json::exception& e) {
        throw device::InvalidParameterException(
            "Invalid value in configuration file " + path.string() + ": " +
            e.what());
    }
    spdlog::info("Loaded configuration from {}", path.string());
}

void BridgeConfig::applyEnvironment(const EnvLookup& lookup) {
    if (auto value = lookup("ASCOM_DISCOVERY_TIMEOUT")) {
        try {
            size_t used = 0;
            double timeout = std::stod(*value, &used);
            if (used != value->size()) {
                throw std::invalid_argument("trailing characters");
            }
            discovery.timeoutSeconds = timeout;
        } catch (const std::exception&) {
            spdlog::warn("Invalid ASCOM_DISCOVERY_TIMEOUT '{}', keeping {}",
                         *value, discovery.timeoutSeconds);
        }
    }

    if (auto value = lookup("ASCOM_SKIP_UDP")) {
        if (auto flag = parseBool(*value)) {
            discovery.skipUdp = *flag;
        } else {
            spdlog::warn("Invalid ASCOM_SKIP_UDP '{}', keeping {}", *value,
                         discovery.skipUdp);
        }
    }

    if (auto value = lookup("ASCOM_KNOWN_DEVICES")) {
        discovery.knownDevices = parseEndpointList(*value);
    }
    if (auto value = lookup("ASCOM_SIMULATOR_DEVICES")) {
        discovery.simulatorDevices = parseEndpointList(*value);
    }
    if (auto value = lookup("ASCOM_DIRECT_DEVICES")) {
        discovery.directDevices = parseDirectDeviceList(*value);
    }

    if (auto value = lookup("ASCOM_STATE_FILE"); value && !value->empty()) {
        persistence.stateFile = *value;
    }

    if (auto value = lookup("ASCOM_LOG_LEVEL")) {
        if (logging::parseLevel(*value)) {
            logging.level = *value;
        } else {
            spdlog::warn("Invalid ASCOM_LOG_LEVEL '{}', keeping {}", *value,
                         logging.level);
        }
    }

    normalize();
}

void BridgeConfig::normalize() {
    if (std::isnan(discovery.timeoutSeconds)) {
        discovery.timeoutSeconds = 5.0;
    }
    auto clamped = std::clamp(discovery.timeoutSeconds,
                              DiscoveryConfig::MIN_TIMEOUT,
                              DiscoveryConfig::MAX_TIMEOUT);
    if (clamped != discovery.timeoutSeconds) {
        spdlog::warn("Discovery timeout {}s clamped to {}s",
                     discovery.timeoutSeconds, clamped);
        discovery.timeoutSeconds = clamped;
    }
    retry.maxAttempts = std::max(1, retry.maxAttempts);
    retry.multiplier = std::max(1.0, retry.multiplier);
    events.bufferSize = std::max<size_t>(1, events.bufferSize);
    events.subscriberQueueSize = std::max<size_t>(1, events.subscriberQueueSize);
    events.bridgeQueueSize = std::max<size_t>(1, events.bridgeQueueSize);
    if (persistence.stateFile.empty()) {
        persistence.stateFile = PersistenceConfig::defaultStateFile();
    }
}

}  // namespace skybridge::config
