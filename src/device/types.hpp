/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device descriptors and connected handles

**************************************************/

#ifndef SKYBRIDGE_DEVICE_TYPES_HPP
#define SKYBRIDGE_DEVICE_TYPES_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "atom/type/json.hpp"
#include "client/alpaca/device_client.hpp"
#include "utils/time_utils.hpp"

namespace skybridge::device {

using json = nlohmann::json;

/**
 * @brief Identity and location of a discoverable device
 */
struct DeviceDescriptor {
    std::string id;        ///< lower(type)_number, or an opaque direct id
    std::string type{"Telescope"};
    int number{0};
    std::string name{"Unknown Device"};
    std::string uniqueId;
    std::string host{"localhost"};
    int port{11111};
    int apiVersion{1};
    bool isSimulator{false};
    utils::TimePoint discoveredAt{utils::Clock::now()};

    /**
     * @brief Composite id "lower(type)_number"
     */
    [[nodiscard]] static auto makeId(const std::string& type, int number)
        -> std::string;

    /**
     * @brief http://{host}:{port}/api/v{api_version}
     */
    [[nodiscard]] auto connectionUrl() const -> std::string;

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Read a descriptor written by toJson()
     *
     * A missing id is derived from type and number. An unparseable
     * discovered_at is replaced by the current time.
     *
     * @throws json::exception if a field has the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& j) -> DeviceDescriptor;

    /**
     * @brief Build from an Alpaca configureddevices record
     *
     * Records carry DeviceName, DeviceType, DeviceNumber and UniqueID.
     */
    [[nodiscard]] static auto fromAlpaca(const json& record,
                                         const std::string& host, int port)
        -> DeviceDescriptor;
};

/**
 * @brief A connected device: descriptor plus its live client
 *
 * Owned by the ConnectionManager. Callers only ever hold references.
 */
class ConnectedHandle {
public:
    ConnectedHandle(DeviceDescriptor descriptor,
                    std::unique_ptr<client::alpaca::DeviceClient> client);

    ConnectedHandle(const ConnectedHandle&) = delete;
    ConnectedHandle& operator=(const ConnectedHandle&) = delete;

    [[nodiscard]] auto descriptor() const -> const DeviceDescriptor& {
        return descriptor_;
    }

    [[nodiscard]] auto id() const -> const std::string& {
        return descriptor_.id;
    }

    /**
     * @brief Access the client and refresh last_used
     */
    [[nodiscard]] auto client() -> client::alpaca::DeviceClient&;

    [[nodiscard]] auto connectedAt() const -> utils::TimePoint {
        return connectedAt_;
    }

    [[nodiscard]] auto lastUsed() const -> utils::TimePoint {
        return lastUsed_.load();
    }

    void updateLastUsed();

    /**
     * @brief Descriptor JSON plus connected_at and last_used
     */
    [[nodiscard]] auto toJson() const -> json;

private:
    DeviceDescriptor descriptor_;
    std::unique_ptr<client::alpaca::DeviceClient> client_;
    utils::TimePoint connectedAt_;
    std::atomic<utils::TimePoint> lastUsed_;
};

/**
 * @brief Serialize a list of descriptors as a JSON array
 */
[[nodiscard]] auto toJson(const std::vector<DeviceDescriptor>& devices)
    -> json;

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_TYPES_HPP
