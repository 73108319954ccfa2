/*
 * time_utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ISO-8601 timestamp helpers

**************************************************/

#include "time_utils.hpp"

#include <cctype>
#include <ctime>
#include <format>

namespace skybridge::utils {

namespace {

auto readNumber(std::string_view text, size_t& pos, size_t digits)
    -> std::optional<int> {
    if (pos + digits > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (size_t i = 0; i < digits; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    pos += digits;
    return value;
}

auto expect(std::string_view text, size_t& pos, char c) -> bool {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

auto toIsoString(TimePoint tp) -> std::string {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds)
            .count();
    if (millis < 0) {
        seconds -= std::chrono::seconds(1);
        millis += 1000;
    }

    std::time_t tt = Clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

auto parseIsoString(std::string_view text) -> std::optional<TimePoint> {
    size_t pos = 0;
    std::tm tm{};

    auto year = readNumber(text, pos, 4);
    if (!year || !expect(text, pos, '-')) return std::nullopt;
    auto month = readNumber(text, pos, 2);
    if (!month || !expect(text, pos, '-')) return std::nullopt;
    auto day = readNumber(text, pos, 2);
    if (!day) return std::nullopt;
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    auto hour = readNumber(text, pos, 2);
    if (!hour || !expect(text, pos, ':')) return std::nullopt;
    auto minute = readNumber(text, pos, 2);
    if (!minute || !expect(text, pos, ':')) return std::nullopt;
    auto second = readNumber(text, pos, 2);
    if (!second) return std::nullopt;

    if (*month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 ||
        *minute > 59 || *second > 60) {
        return std::nullopt;
    }

    // Fraction of a second, any number of digits
    std::chrono::microseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long micros = 0;
        int digits = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
        fraction = std::chrono::microseconds(micros);
    }

    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (text.substr(pos) == "+00:00") {
        pos = text.size();
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    tm.tm_year = *year - 1900;
    tm.tm_mon = *month - 1;
    tm.tm_mday = *day;
    tm.tm_hour = *hour;
    tm.tm_min = *minute;
    tm.tm_sec = *second;

    std::time_t tt = timegm(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<Clock::duration>(
        Clock::from_time_t(tt) + fraction);
}

auto toUnixSeconds(TimePoint tp) -> double {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

}  // namespace skybridge::utils
