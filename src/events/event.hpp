/*
 * event.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device telemetry event

**************************************************/

#ifndef SKYBRIDGE_EVENTS_EVENT_HPP
#define SKYBRIDGE_EVENTS_EVENT_HPP

#include <string>

#include "atom/type/json.hpp"
#include "utils/time_utils.hpp"

namespace skybridge::events {

using json = nlohmann::json;

/**
 * @brief One telemetry notification, immutable once stored
 */
struct Event {
    std::string deviceId;
    std::string eventType{"Unknown"};
    utils::TimePoint timestamp{utils::Clock::now()};
    json payload;

    /**
     * @brief {timestamp, datetime, device_id, event_type, data}
     */
    [[nodiscard]] auto toJson() const -> json {
        return {{"timestamp", utils::toUnixSeconds(timestamp)},
                {"datetime", utils::toIsoString(timestamp)},
                {"device_id", deviceId},
                {"event_type", eventType},
                {"data", payload}};
    }
};

}  // namespace skybridge::events

#endif  // SKYBRIDGE_EVENTS_EVENT_HPP
