/*
 * bridge_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bridge configuration: discovery sources, retry policy,
event buffering, persistence and logging

**************************************************/

#ifndef SKYBRIDGE_CONFIG_BRIDGE_CONFIG_HPP
#define SKYBRIDGE_CONFIG_BRIDGE_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "atom/type/json.hpp"
#include "logging/log_setup.hpp"

namespace skybridge::config {

using json = nlohmann::json;

/**
 * @brief A host:port pair with a display name
 */
struct HostEndpoint {
    std::string host;
    int port{0};
    std::string name;

    [[nodiscard]] json toJson() const {
        return {{"host", host}, {"port", port}, {"name", name}};
    }

    [[nodiscard]] static HostEndpoint fromJson(const json& j) {
        HostEndpoint ep;
        ep.host = j.value("host", ep.host);
        ep.port = j.value("port", ep.port);
        ep.name = j.value("name", ep.host + ":" + std::to_string(ep.port));
        return ep;
    }

    bool operator==(const HostEndpoint&) const = default;
};

/**
 * @brief A device declared ahead of time under a fixed id
 */
struct DirectDevice {
    std::string id;
    std::string host;
    int port{0};
    std::string name;

    [[nodiscard]] json toJson() const {
        return {{"id", id}, {"host", host}, {"port", port}, {"name", name}};
    }

    [[nodiscard]] static DirectDevice fromJson(const json& j) {
        DirectDevice dev;
        dev.id = j.value("id", dev.id);
        dev.host = j.value("host", dev.host);
        dev.port = j.value("port", dev.port);
        dev.name = j.value("name", dev.id);
        return dev;
    }

    bool operator==(const DirectDevice&) const = default;
};

/**
 * @brief Discovery sources and timing
 */
struct DiscoveryConfig {
    static constexpr double MIN_TIMEOUT = 0.5;
    static constexpr double MAX_TIMEOUT = 30.0;

    double timeoutSeconds{5.0};          ///< UDP collection window
    bool skipUdp{false};                 ///< Skip the UDP broadcast probe
    std::vector<HostEndpoint> knownDevices{
        {"localhost", 5555, "seestar_alp"}};
    std::vector<HostEndpoint> simulatorDevices;
    std::vector<DirectDevice> directDevices;

    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(
            static_cast<long long>(timeoutSeconds * 1000.0));
    }

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static DiscoveryConfig fromJson(const json& j);
};

/**
 * @brief Exponential backoff for client activation
 */
struct RetryConfig {
    int maxAttempts{3};
    size_t initialDelayMs{2000};
    size_t maxDelayMs{10000};
    double multiplier{2.0};

    /**
     * @brief Delay before the given retry (1 = after the first failure)
     */
    [[nodiscard]] auto delayFor(int attempt) const
        -> std::chrono::milliseconds;

    [[nodiscard]] json toJson() const {
        return {{"maxAttempts", maxAttempts},
                {"initialDelayMs", initialDelayMs},
                {"maxDelayMs", maxDelayMs},
                {"multiplier", multiplier}};
    }

    [[nodiscard]] static RetryConfig fromJson(const json& j) {
        RetryConfig cfg;
        cfg.maxAttempts = j.value("maxAttempts", cfg.maxAttempts);
        cfg.initialDelayMs = j.value("initialDelayMs", cfg.initialDelayMs);
        cfg.maxDelayMs = j.value("maxDelayMs", cfg.maxDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        return cfg;
    }
};

/**
 * @brief Event buffering and SSE ingestion
 */
struct EventConfig {
    size_t bufferSize{100};           ///< Ring buffer capacity per device
    size_t subscriberQueueSize{100};  ///< Live subscriber queue bound
    size_t bridgeQueueSize{1000};     ///< Sync-to-async channel bound
    size_t sseReconnectDelayMs{5000};
    int ssePort{7556};

    [[nodiscard]] json toJson() const {
        return {{"bufferSize", bufferSize},
                {"subscriberQueueSize", subscriberQueueSize},
                {"bridgeQueueSize", bridgeQueueSize},
                {"sseReconnectDelayMs", sseReconnectDelayMs},
                {"ssePort", ssePort}};
    }

    [[nodiscard]] static EventConfig fromJson(const json& j) {
        EventConfig cfg;
        cfg.bufferSize = j.value("bufferSize", cfg.bufferSize);
        cfg.subscriberQueueSize =
            j.value("subscriberQueueSize", cfg.subscriberQueueSize);
        cfg.bridgeQueueSize = j.value("bridgeQueueSize", cfg.bridgeQueueSize);
        cfg.sseReconnectDelayMs =
            j.value("sseReconnectDelayMs", cfg.sseReconnectDelayMs);
        cfg.ssePort = j.value("ssePort", cfg.ssePort);
        return cfg;
    }
};

/**
 * @brief Location and retention of the device snapshot
 */
struct PersistenceConfig {
    std::filesystem::path stateFile;
    int staleAfterDays{30};

    [[nodiscard]] static auto defaultStateFile() -> std::filesystem::path;

    [[nodiscard]] json toJson() const {
        return {{"stateFile", stateFile.string()},
                {"staleAfterDays", staleAfterDays}};
    }

    [[nodiscard]] static PersistenceConfig fromJson(const json& j) {
        PersistenceConfig cfg;
        cfg.stateFile = j.value("stateFile", defaultStateFile().string());
        cfg.staleAfterDays = j.value("staleAfterDays", cfg.staleAfterDays);
        return cfg;
    }
};

/**
 * @brief Environment lookup, replaceable in tests
 */
using EnvLookup =
    std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief Read a variable from the process environment
 */
[[nodiscard]] auto processEnvironment(const std::string& name)
    -> std::optional<std::string>;

/**
 * @brief Complete bridge configuration
 *
 * Built from defaults, then an optional JSON file, then environment
 * variables (ASCOM_*). Later sources override earlier ones.
 */
struct BridgeConfig {
    DiscoveryConfig discovery;
    RetryConfig retry;
    EventConfig events;
    PersistenceConfig persistence{PersistenceConfig::defaultStateFile(), 30};
    logging::LoggingConfig logging;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static BridgeConfig fromJson(const json& j);

    /**
     * @brief Overlay settings from a JSON file
     * @throws device::InvalidParameterException if the file cannot be read
     *         or is not a JSON object
     */
    void loadFile(const std::filesystem::path& path);

    /**
     * @brief Overlay ASCOM_* environment variables
     */
    void applyEnvironment(const EnvLookup& lookup = processEnvironment);

    /**
     * @brief Clamp values into their valid ranges
     */
    void normalize();
};

/**
 * @brief Parse "host:port[:name],..." into endpoints
 *
 * Malformed entries are skipped with a warning. A missing name defaults
 * to "host:port".
 */
[[nodiscard]] auto parseEndpointList(const std::string& text)
    -> std::vector<HostEndpoint>;

/**
 * @brief Parse "id@host:port[:name],..." into direct devices
 *
 * The form "id:host:port[:name]" is accepted as well.
 */
[[nodiscard]] auto parseDirectDeviceList(const std::string& text)
    -> std::vector<DirectDevice>;

}  // namespace skybridge::config

#endif  // SKYBRIDGE_CONFIG_BRIDGE_CONFIG_HPP
