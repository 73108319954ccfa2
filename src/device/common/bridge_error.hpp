/*
 * bridge_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Error kinds and structures reported by the device bridge

**************************************************/

#ifndef SKYBRIDGE_DEVICE_COMMON_BRIDGE_ERROR_HPP
#define SKYBRIDGE_DEVICE_COMMON_BRIDGE_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include "atom/type/json.hpp"

namespace skybridge::device {

/**
 * @brief Machine-checkable error kinds surfaced to the calling layer
 */
enum class ErrorKind {
    DeviceNotFound,        ///< Resolution exhausted every source
    ConnectionFailed,      ///< Transient network/protocol failure
    DeviceNotConnected,    ///< Operation on an id absent from connected table
    UnsupportedOperation,  ///< Device type has no client mapping
    InvalidParameter,      ///< Caller-supplied argument out of contract
    Internal
};

/**
 * @brief Convert error kind to its wire tag
 */
[[nodiscard]] inline auto errorKindToString(ErrorKind kind) -> std::string {
    switch (kind) {
        case ErrorKind::DeviceNotFound:
            return "device_not_found";
        case ErrorKind::ConnectionFailed:
            return "connection_failed";
        case ErrorKind::DeviceNotConnected:
            return "device_not_connected";
        case ErrorKind::UnsupportedOperation:
            return "unsupported_operation";
        case ErrorKind::InvalidParameter:
            return "invalid_parameter";
        case ErrorKind::Internal:
            return "internal_error";
    }
    return "internal_error";
}

/**
 * @brief Check if an error kind is worth retrying by the caller
 */
[[nodiscard]] inline auto isRecoverable(ErrorKind kind) -> bool {
    switch (kind) {
        case ErrorKind::DeviceNotFound:
        case ErrorKind::ConnectionFailed:
        case ErrorKind::DeviceNotConnected:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error record with the context needed to explain a failure
 */
struct ErrorInfo {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    std::string remediation;
    std::optional<std::string> deviceId;
    std::optional<std::string> cause;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    ErrorInfo() = default;

    ErrorInfo(ErrorKind errorKind, std::string errorMessage,
              std::string hint = "")
        : kind(errorKind),
          message(std::move(errorMessage)),
          remediation(std::move(hint)) {}

    [[nodiscard]] auto toString() const -> std::string {
        std::string result = "[" + errorKindToString(kind) + "] " + message;
        if (deviceId) {
            result += " (device: " + *deviceId + ")";
        }
        if (cause) {
            result += " - " + *cause;
        }
        return result;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j;
        j["error"] = true;
        j["kind"] = errorKindToString(kind);
        j["message"] = message;
        j["remediation"] = remediation;
        if (deviceId) {
            j["device_id"] = *deviceId;
        }
        if (cause) {
            j["cause"] = *cause;
        }
        j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
        return j;
    }

    [[nodiscard]] auto isRecoverable() const -> bool {
        return skybridge::device::isRecoverable(kind);
    }
};

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_COMMON_BRIDGE_ERROR_HPP
