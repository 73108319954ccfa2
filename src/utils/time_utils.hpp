/*
 * time_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ISO-8601 timestamp helpers shared by the device tables,
persistence and event buffers

**************************************************/

#ifndef SKYBRIDGE_UTILS_TIME_UTILS_HPP
#define SKYBRIDGE_UTILS_TIME_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace skybridge::utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Format a time point as UTC ISO-8601 with millisecond precision
 *
 * Output looks like `2024-12-01T21:04:05.123Z`.
 */
[[nodiscard]] auto toIsoString(TimePoint tp) -> std::string;

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts `YYYY-MM-DDTHH:MM:SS` with an optional fractional part and an
 * optional trailing `Z`. A space is accepted in place of `T`. Timestamps
 * without a zone are read as UTC.
 *
 * @return std::nullopt if the text is not a timestamp
 */
[[nodiscard]] auto parseIsoString(std::string_view text)
    -> std::optional<TimePoint>;

/**
 * @brief Seconds since the epoch as a floating value
 */
[[nodiscard]] auto toUnixSeconds(TimePoint tp) -> double;

}  // namespace skybridge::utils

#endif  // SKYBRIDGE_UTILS_TIME_UTILS_HPP
