/*
 * discovery_probes.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Network probes used by device discovery

**************************************************/

#ifndef SKYBRIDGE_DEVICE_DISCOVERY_DISCOVERY_PROBES_HPP
#define SKYBRIDGE_DEVICE_DISCOVERY_DISCOVERY_PROBES_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "client/alpaca/http_transport.hpp"
#include "device/types.hpp"

namespace skybridge::device::discovery {

/**
 * @brief Probe failure categories
 */
enum class ProbeError {
    SocketError,
    HostNotFound,
    Timeout,
    Refused,
    BadResponse
};

struct ProbeFailure {
    ProbeError code{ProbeError::SocketError};
    std::string message;
};

/**
 * @brief An Alpaca server that answered the discovery broadcast
 */
struct AlpacaServer {
    std::string host;
    int port{0};
};

/**
 * @brief Blocking network probes
 *
 * All calls block the calling thread for at most their timeout. The
 * discovery engine runs them off the caller's thread.
 */
class DiscoveryProbes {
public:
    virtual ~DiscoveryProbes() = default;

    /**
     * @brief Broadcast "alpacadiscovery1" on UDP 32227 and collect replies
     */
    virtual auto broadcast(std::chrono::milliseconds timeout)
        -> std::expected<std::vector<AlpacaServer>, ProbeFailure> = 0;

    /**
     * @brief GET /management/v1/configureddevices, stamped with host/port
     */
    virtual auto configuredDevices(const std::string& host, int port,
                                   std::chrono::milliseconds timeout)
        -> std::expected<std::vector<DeviceDescriptor>, ProbeFailure> = 0;

    /**
     * @brief Plain TCP connect to test reachability
     */
    virtual auto tcpReachable(const std::string& host, int port,
                              std::chrono::milliseconds timeout)
        -> std::expected<void, ProbeFailure> = 0;
};

/**
 * @brief Probes over POSIX sockets and the HTTP transport
 */
class NetworkProbes : public DiscoveryProbes {
public:
    static constexpr int DISCOVERY_PORT = 32227;
    static constexpr const char* DISCOVERY_MESSAGE = "alpacadiscovery1";

    explicit NetworkProbes(std::shared_ptr<client::alpaca::HttpTransport> http);

    auto broadcast(std::chrono::milliseconds timeout)
        -> std::expected<std::vector<AlpacaServer>, ProbeFailure> override;

    auto configuredDevices(const std::string& host, int port,
                           std::chrono::milliseconds timeout)
        -> std::expected<std::vector<DeviceDescriptor>, ProbeFailure> override;

    auto tcpReachable(const std::string& host, int port,
                      std::chrono::milliseconds timeout)
        -> std::expected<void, ProbeFailure> override;

private:
    std::shared_ptr<client::alpaca::HttpTransport> http_;
};

}  // namespace skybridge::device::discovery

#endif  // SKYBRIDGE_DEVICE_DISCOVERY_DISCOVERY_PROBES_HPP
