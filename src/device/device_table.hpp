/*
 * device_table.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Versioned, thread-safe table of available devices

**************************************************/

#ifndef SKYBRIDGE_DEVICE_DEVICE_TABLE_HPP
#define SKYBRIDGE_DEVICE_DEVICE_TABLE_HPP

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace skybridge::device {

/**
 * @brief Descriptors keyed by id, kept in insertion order
 *
 * Every mutation bumps version(), so readers can tell whether a snapshot
 * is still current. The in-memory table is the source of truth at
 * runtime; the persisted snapshot is only a cache.
 */
class DeviceTable {
public:
    DeviceTable() = default;

    DeviceTable(const DeviceTable&) = delete;
    DeviceTable& operator=(const DeviceTable&) = delete;

    /**
     * @brief Insert unless the id is already present
     * @return true if inserted
     */
    auto insertIfAbsent(const DeviceDescriptor& descriptor) -> bool;

    /**
     * @brief Insert or replace
     */
    void upsert(const DeviceDescriptor& descriptor);

    auto erase(const std::string& id) -> bool;

    void clear();

    [[nodiscard]] auto find(const std::string& id) const
        -> std::optional<DeviceDescriptor>;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    [[nodiscard]] auto snapshot() const -> std::vector<DeviceDescriptor>;

    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto version() const -> uint64_t;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DeviceDescriptor> entries_;
    std::vector<std::string> order_;
    uint64_t version_{0};
};

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_DEVICE_TABLE_HPP
