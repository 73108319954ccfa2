/*
 * log_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Process-wide spdlog configuration for the bridge

**************************************************/

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "atom/type/json.hpp"

namespace skybridge::logging {

using json = nlohmann::json;

/**
 * @brief Logging configuration
 *
 * Console output always goes to stderr. stdout carries tool payloads.
 */
struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};
    std::string filePath;                  ///< Empty disables the file sink
    size_t maxFileSize{1048576 * 10};      ///< 10MB
    size_t maxFiles{5};

    [[nodiscard]] json toJson() const {
        return {{"level", level},
                {"pattern", pattern},
                {"filePath", filePath},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.filePath = j.value("filePath", cfg.filePath);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }
};

/**
 * @brief Parse a level name
 *
 * Accepts trace, debug, info, warn (warning), error (err), critical and
 * off, case-insensitively.
 */
[[nodiscard]] auto parseLevel(const std::string& name)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Install the default "skybridge" logger
 *
 * Safe to call again. The second call replaces the sinks.
 */
void setupLogging(const LoggingConfig& config);

/**
 * @brief Change the level of the default logger
 */
void setLevel(const std::string& level);

}  // namespace skybridge::logging
