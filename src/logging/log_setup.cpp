/*
 * log_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Process-wide spdlog configuration for the bridge

**************************************************/

#include "log_setup.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace skybridge::logging {

auto parseLevel(const std::string& name)
    -> std::optional<spdlog::level::level_enum> {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

void setupLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern(config.pattern);
    sinks.push_back(consoleSink);

    if (!config.filePath.empty()) {
        try {
            auto parent = std::filesystem::path(config.filePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto fileSink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.filePath, config.maxFileSize, config.maxFiles);
            fileSink->set_pattern(config.pattern);
            sinks.push_back(fileSink);
        } catch (const std::exception& e) {
            // Console logging still works without the file sink
            std::fprintf(stderr, "Failed to open log file %s: %s\n",
                         config.filePath.c_str(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("skybridge", sinks.begin(),
                                                   sinks.end());
    auto level = parseLevel(config.level);
    logger->set_level(level.value_or(spdlog::level::info));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!level) {
        spdlog::warn("Unknown log level '{}', using info", config.level);
    }
    spdlog::debug("Logging initialized (level={}, file={})", config.level,
                  config.filePath.empty() ? "<none>" : config.filePath);
}

void setLevel(const std::string& level) {
    if (auto parsed = parseLevel(level)) {
        spdlog::set_level(*parsed);
    } else {
        spdlog::warn("Ignoring unknown log level '{}'", level);
    }
}

}  // namespace skybridge::logging
