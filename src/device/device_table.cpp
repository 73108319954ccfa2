/*
 * device_table.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Versioned, thread-safe table of available devices

**************************************************/

#include "device_table.hpp"

#include <algorithm>
#include <mutex>

namespace skybridge::device {

auto DeviceTable::insertIfAbsent(const DeviceDescriptor& descriptor) -> bool {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(descriptor.id, descriptor);
    if (inserted) {
        order_.push_back(descriptor.id);
        ++version_;
    }
    return inserted;
}

void DeviceTable::upsert(const DeviceDescriptor& descriptor) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.insert_or_assign(descriptor.id, descriptor);
    if (inserted) {
        order_.push_back(descriptor.id);
    }
    ++version_;
}

auto DeviceTable::erase(const std::string& id) -> bool {
    std::unique_lock lock(mutex_);
    if (entries_.erase(id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    ++version_;
    return true;
}

void DeviceTable::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    order_.clear();
    ++version_;
}

auto DeviceTable::find(const std::string& id) const
    -> std::optional<DeviceDescriptor> {
    std::shared_lock lock(mutex_);
    if (auto it = entries_.find(id); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto DeviceTable::contains(const std::string& id) const -> bool {
    std::shared_lock lock(mutex_);
    return entries_.contains(id);
}

auto DeviceTable::snapshot() const -> std::vector<DeviceDescriptor> {
    std::shared_lock lock(mutex_);
    std::vector<DeviceDescriptor> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(entries_.at(id));
    }
    return result;
}

auto DeviceTable::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

auto DeviceTable::version() const -> uint64_t {
    std::shared_lock lock(mutex_);
    return version_;
}

}  // namespace skybridge::device
