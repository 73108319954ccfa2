/*
 * discovery_probes.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Network probes used by device discovery

**************************************************/

#include "discovery_probes.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <set>

#include <spdlog/spdlog.h>

namespace skybridge::device::discovery {

namespace {

constexpr int INVALID_SOCK = -1;

/// Closes the descriptor on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ != INVALID_SOCK) {
            close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }

private:
    int fd_;
};

auto setNonBlocking(int sock) -> bool {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0)
        return false;
    return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

auto remaining(std::chrono::steady_clock::time_point deadline) -> int {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

NetworkProbes::NetworkProbes(
    std::shared_ptr<client::alpaca::HttpTransport> http)
    : http_(std::move(http)) {}

auto NetworkProbes::broadcast(std::chrono::milliseconds timeout)
    -> std::expected<std::vector<AlpacaServer>, ProbeFailure> {
    SocketGuard sock(socket(AF_INET, SOCK_DGRAM, 0));
    if (sock.get() < 0) {
        return std::unexpected(ProbeFailure{
            ProbeError::SocketError,
            std::format("socket() failed: {}", std::strerror(errno))});
    }

    int broadcastFlag = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &broadcastFlag,
                   sizeof(broadcastFlag)) != 0) {
        return std::unexpected(ProbeFailure{
            ProbeError::SocketError,
            std::format("SO_BROADCAST failed: {}", std::strerror(errno))});
    }

    sockaddr_in broadcastAddr{};
    broadcastAddr.sin_family = AF_INET;
    broadcastAddr.sin_addr.s_addr = htonl(INADDR_BROADCAST);
    broadcastAddr.sin_port = htons(DISCOVERY_PORT);

    auto sent = sendto(sock.get(), DISCOVERY_MESSAGE,
                       std::strlen(DISCOVERY_MESSAGE), 0,
                       reinterpret_cast<sockaddr*>(&broadcastAddr),
                       sizeof(broadcastAddr));
    if (sent < 0) {
        return std::unexpected(ProbeFailure{
            ProbeError::SocketError,
            std::format("sendto() failed: {}", std::strerror(errno))});
    }

    std::vector<AlpacaServer> servers;
    std::set<std::pair<std::string, int>> seen;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        int waitMs = remaining(deadline);
        if (waitMs <= 0) {
            break;
        }

        pollfd pfd{sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ProbeFailure{
                ProbeError::SocketError,
                std::format("poll() failed: {}", std::strerror(errno))});
        }
        if (ready == 0) {
            break;
        }

        char buffer[1024];
        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        auto received = recvfrom(sock.get(), buffer, sizeof(buffer) - 1, 0,
                                 reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (received <= 0) {
            continue;
        }

        char hostIp[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &from.sin_addr, hostIp, sizeof(hostIp)) ==
            nullptr) {
            continue;
        }

        // Replies look like {"AlpacaPort": 11111}
        auto reply = json::parse(std::string(buffer, received), nullptr, false);
        if (reply.is_discarded() || !reply.is_object() ||
            !reply.contains("AlpacaPort") ||
            !reply["AlpacaPort"].is_number_integer()) {
            spdlog::debug("Ignoring malformed discovery reply from {}", hostIp);
            continue;
        }

        AlpacaServer server{hostIp, reply["AlpacaPort"].get<int>()};
        if (seen.emplace(server.host, server.port).second) {
            spdlog::debug("Alpaca server answered at {}:{}", server.host,
                          server.port);
            servers.push_back(std::move(server));
        }
    }
    return servers;
}

auto NetworkProbes::configuredDevices(const std::string& host, int port,
                                      std::chrono::milliseconds timeout)
    -> std::expected<std::vector<DeviceDescriptor>, ProbeFailure> {
    auto url = std::format("http://{}:{}/management/v1/configureddevices",
                           host, port);
    auto response = http_->get(url, timeout);
    if (!response) {
        auto code = response.error().code ==
                            client::alpaca::HttpErrorCode::Timeout
                        ? ProbeError::Timeout
                        : ProbeError::Refused;
        return std::unexpected(ProbeFailure{code, response.error().message});
    }
    if (response->status != 200) {
        return std::unexpected(ProbeFailure{
            ProbeError::BadResponse,
            std::format("returned status {}", response->status)});
    }

    auto body = json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return std::unexpected(
            ProbeFailure{ProbeError::BadResponse, "response is not JSON"});
    }

    std::vector<DeviceDescriptor> devices;
    auto value = body.value("Value", json::array());
    if (!value.is_array()) {
        return std::unexpected(
            ProbeFailure{ProbeError::BadResponse, "Value is not a list"});
    }
    for (const auto& record : value) {
        if (!record.is_object()) {
            continue;
        }
        try {
            devices.push_back(DeviceDescriptor::fromAlpaca(record, host, port));
        } catch (const json::exception& e) {
            spdlog::debug("Skipping device record from {}:{}: {}", host, port,
                          e.what());
        }
    }
    return devices;
}

auto NetworkProbes::tcpReachable(const std::string& host, int port,
                                 std::chrono::milliseconds timeout)
    -> std::expected<void, ProbeFailure> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    auto portStr = std::to_string(port);
    int ret = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (ret != 0) {
        return std::unexpected(
            ProbeFailure{ProbeError::HostNotFound, gai_strerror(ret)});
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    ProbeFailure failure{ProbeError::Refused,
                         std::format("{}:{} refused connection", host, port)};
    bool connected = false;

    for (auto* rp = result; rp != nullptr && !connected; rp = rp->ai_next) {
        SocketGuard sock(socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
        if (sock.get() < 0 || !setNonBlocking(sock.get())) {
            continue;
        }

        ret = ::connect(sock.get(), rp->ai_addr, rp->ai_addrlen);
        if (ret == 0) {
            connected = true;
            break;
        }
        if (errno != EINPROGRESS) {
            continue;
        }

        pollfd pfd{sock.get(), POLLOUT, 0};
        ret = poll(&pfd, 1, remaining(deadline));
        if (ret == 0) {
            failure = ProbeFailure{
                ProbeError::Timeout,
                std::format("{}:{} timed out", host, port)};
            continue;
        }
        if (ret > 0) {
            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len);
            if (error == 0) {
                connected = true;
            }
        }
    }
    freeaddrinfo(result);

    if (!connected) {
        return std::unexpected(failure);
    }
    return {};
}

}  // namespace skybridge::device::discovery
