/*
 * state_persistence.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Durable JSON snapshot of previously discovered devices

**************************************************/

#include "state_persistence.hpp"

#include <fstream>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace skybridge::device {

StatePersistence::StatePersistence(std::filesystem::path stateFile)
    : stateFile_(std::move(stateFile)) {
    spdlog::info("Using state file: {}", stateFile_.string());
}

auto StatePersistence::load() const -> std::vector<DeviceDescriptor> {
    std::lock_guard lock(fileMutex_);
    std::vector<DeviceDescriptor> devices;

    std::error_code ec;
    if (!std::filesystem::exists(stateFile_, ec)) {
        spdlog::debug("No state file found at {}", stateFile_.string());
        return devices;
    }

    json data;
    try {
        std::ifstream in(stateFile_);
        if (!in) {
            spdlog::warn("Cannot open state file {}", stateFile_.string());
            return devices;
        }
        data = json::parse(in);
    } catch (const json::exception& e) {
        spdlog::warn("Failed to load state file {}: {}", stateFile_.string(),
                     e.what());
        return devices;
    }

    if (!data.is_object() || !data.contains("devices") ||
        !data["devices"].is_array()) {
        spdlog::warn("State file {} has no device list", stateFile_.string());
        return devices;
    }

    for (const auto& record : data["devices"]) {
        try {
            devices.push_back(DeviceDescriptor::fromJson(record));
        } catch (const json::exception& e) {
            spdlog::warn("Skipping unreadable device record: {}", e.what());
        }
    }

    spdlog::info("Loaded {} devices from state", devices.size());
    return devices;
}

auto StatePersistence::save(const std::vector<DeviceDescriptor>& devices) const
    -> bool {
    std::lock_guard lock(fileMutex_);

    json data = {{"version", FORMAT_VERSION},
                 {"updated_at", utils::toIsoString(utils::Clock::now())},
                 {"devices", toJson(devices)}};

    auto tempFile = stateFile_;
    tempFile.replace_extension(".tmp");

    try {
        if (auto parent = stateFile_.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        {
            std::ofstream out(tempFile, std::ios::trunc);
            if (!out) {
                spdlog::error("Failed to save state file: cannot write {}",
                              tempFile.string());
                return false;
            }
            // Names from connection strings or the environment may not be
            // valid UTF-8
            out << data.dump(2, ' ', false, json::error_handler_t::replace);
            out.flush();
            if (!out) {
                spdlog::error("Failed to save state file: write to {} failed",
                              tempFile.string());
                return false;
            }
        }

        std::filesystem::rename(tempFile, stateFile_);
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to save state file: {}", e.what());
        std::error_code ec;
        std::filesystem::remove(tempFile, ec);
        return false;
    } catch (const json::exception& e) {
        spdlog::error("Failed to serialize state: {}", e.what());
        std::error_code ec;
        std::filesystem::remove(tempFile, ec);
        return false;
    }

    spdlog::info("Saved {} devices to state", devices.size());
    return true;
}

auto StatePersistence::merge(const std::vector<DeviceDescriptor>& existing,
                             const std::vector<DeviceDescriptor>& fresh)
    -> std::vector<DeviceDescriptor> {
    std::vector<DeviceDescriptor> merged = existing;
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < merged.size(); ++i) {
        index[merged[i].id] = i;
    }

    for (const auto& device : fresh) {
        if (auto it = index.find(device.id); it != index.end()) {
            auto discoveredAt = merged[it->second].discoveredAt;
            merged[it->second] = device;
            merged[it->second].discoveredAt = discoveredAt;
        } else {
            index[device.id] = merged.size();
            merged.push_back(device);
        }
    }
    return merged;
}

auto StatePersistence::cleanupStale(
    const std::vector<DeviceDescriptor>& devices, int maxAgeDays,
    utils::TimePoint now) -> std::vector<DeviceDescriptor> {
    std::vector<DeviceDescriptor> cleaned;
    cleaned.reserve(devices.size());

    for (const auto& device : devices) {
        auto ageDays = std::chrono::floor<std::chrono::days>(
                           now - device.discoveredAt)
                           .count();
        if (ageDays <= maxAgeDays) {
            cleaned.push_back(device);
        } else {
            spdlog::info("Removing stale device {} (age: {} days)", device.id,
                         ageDays);
        }
    }
    return cleaned;
}

}  // namespace skybridge::device
