/*
 * state_persistence.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Durable JSON snapshot of previously discovered devices

**************************************************/

#ifndef SKYBRIDGE_DEVICE_STATE_PERSISTENCE_HPP
#define SKYBRIDGE_DEVICE_STATE_PERSISTENCE_HPP

#include <filesystem>
#include <mutex>
#include <vector>

#include "types.hpp"

namespace skybridge::device {

/**
 * @brief Device snapshot stored as {version, updated_at, devices}
 *
 * The snapshot is a cache. Loading never throws and saving never throws;
 * failures are logged and the in-memory tables stay authoritative.
 */
class StatePersistence {
public:
    static constexpr const char* FORMAT_VERSION = "1.0";

    explicit StatePersistence(std::filesystem::path stateFile);

    /**
     * @brief Read the snapshot
     * @return Stored descriptors, or an empty list on any failure
     */
    [[nodiscard]] auto load() const -> std::vector<DeviceDescriptor>;

    /**
     * @brief Write the snapshot through a temporary file and a rename
     * @return true if the file was replaced
     */
    auto save(const std::vector<DeviceDescriptor>& devices) const -> bool;

    /**
     * @brief Combine by id, preferring fresh fields
     *
     * An id present in both keeps the existing discovered_at.
     */
    [[nodiscard]] static auto merge(
        const std::vector<DeviceDescriptor>& existing,
        const std::vector<DeviceDescriptor>& fresh)
        -> std::vector<DeviceDescriptor>;

    /**
     * @brief Drop descriptors discovered more than maxAgeDays ago
     */
    [[nodiscard]] static auto cleanupStale(
        const std::vector<DeviceDescriptor>& devices, int maxAgeDays,
        utils::TimePoint now = utils::Clock::now())
        -> std::vector<DeviceDescriptor>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return stateFile_;
    }

private:
    std::filesystem::path stateFile_;
    mutable std::mutex fileMutex_;
};

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_STATE_PERSISTENCE_HPP
