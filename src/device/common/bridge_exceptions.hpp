/*
 * bridge_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exception hierarchy for discovery and connection errors

**************************************************/

#ifndef SKYBRIDGE_DEVICE_COMMON_BRIDGE_EXCEPTIONS_HPP
#define SKYBRIDGE_DEVICE_COMMON_BRIDGE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "bridge_error.hpp"

namespace skybridge::device {

/**
 * @brief Base exception for all errors escalated by the bridge
 *
 * Every escalated error carries a short machine-checkable kind and a
 * human-actionable remediation hint.
 */
class BridgeException : public std::runtime_error {
public:
    explicit BridgeException(ErrorInfo info)
        : std::runtime_error(info.message), info_(std::move(info)) {}

    BridgeException(ErrorKind kind, const std::string& message,
                    const std::string& remediation = "")
        : std::runtime_error(message), info_(kind, message, remediation) {}

    [[nodiscard]] auto info() const noexcept -> const ErrorInfo& {
        return info_;
    }

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return info_.kind; }

    [[nodiscard]] auto kindName() const -> std::string {
        return errorKindToString(info_.kind);
    }

    [[nodiscard]] auto remediation() const noexcept -> const std::string& {
        return info_.remediation;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return info_.toJson();
    }

protected:
    ErrorInfo info_;
};

/**
 * @brief Resolution exhausted every source for a device id
 */
class DeviceNotFoundException : public BridgeException {
public:
    DeviceNotFoundException(const std::string& deviceId,
                            const std::string& message,
                            const std::string& remediation = "")
        : BridgeException(ErrorKind::DeviceNotFound, message, remediation) {
        info_.deviceId = deviceId;
    }
};

/**
 * @brief Activation failed after the retry policy was exhausted
 */
class ConnectionFailedException : public BridgeException {
public:
    explicit ConnectionFailedException(const std::string& message)
        : BridgeException(
              ErrorKind::ConnectionFailed, message,
              "Check that the device is powered on and reachable, then retry") {}

    ConnectionFailedException(const std::string& deviceId,
                              const std::string& message,
                              const std::string& cause)
        : BridgeException(
              ErrorKind::ConnectionFailed, message,
              "Check that the device is powered on and reachable, then retry") {
        info_.deviceId = deviceId;
        if (!cause.empty()) {
            info_.cause = cause;
        }
    }
};

/**
 * @brief Operation requested on a device that is not connected
 */
class DeviceNotConnectedException : public BridgeException {
public:
    explicit DeviceNotConnectedException(const std::string& deviceId)
        : BridgeException(ErrorKind::DeviceNotConnected,
                          "Device " + deviceId + " is not connected",
                          "Connect the device before using it") {
        info_.deviceId = deviceId;
    }
};

/**
 * @brief Device type without a client mapping
 */
class UnsupportedOperationException : public BridgeException {
public:
    explicit UnsupportedOperationException(const std::string& message)
        : BridgeException(ErrorKind::UnsupportedOperation, message,
                          "Supported device types: Telescope, Camera, "
                          "Focuser, FilterWheel") {}
};

/**
 * @brief Caller-supplied argument out of contract
 */
class InvalidParameterException : public BridgeException {
public:
    explicit InvalidParameterException(const std::string& message,
                                       const std::string& remediation = "")
        : BridgeException(ErrorKind::InvalidParameter, message, remediation) {}
};

}  // namespace skybridge::device

#endif  // SKYBRIDGE_DEVICE_COMMON_BRIDGE_EXCEPTIONS_HPP
