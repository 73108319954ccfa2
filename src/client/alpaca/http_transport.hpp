/*
 * http_transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: HTTP transport used by the Alpaca clients, discovery and
SSE ingestion

**************************************************/

#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace skybridge::client::alpaca {

/**
 * @brief Transport failure categories
 */
enum class HttpErrorCode {
    Timeout,
    ConnectionFailed,
    Cancelled,
    ProtocolError
};

struct HttpError {
    HttpErrorCode code{HttpErrorCode::ProtocolError};
    std::string message;
};

struct HttpResponse {
    long status{0};
    std::string body;

    [[nodiscard]] auto ok() const -> bool {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief Receives one line of a streaming body, without the line ending
 */
using LineHandler = std::function<void(std::string_view line)>;

/**
 * @brief Abstract HTTP transport
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto get(const std::string& url, std::chrono::milliseconds timeout)
        -> std::expected<HttpResponse, HttpError> = 0;

    /**
     * @brief PUT a form-encoded body
     */
    virtual auto put(const std::string& url, const std::string& formBody,
                     std::chrono::milliseconds timeout)
        -> std::expected<HttpResponse, HttpError> = 0;

    /**
     * @brief Open a long-lived GET and deliver the body line by line
     *
     * Lines are delivered only for a 200 response. Returns the HTTP status
     * once the server closes the stream, or HttpErrorCode::Cancelled after
     * a stop request.
     */
    virtual auto stream(const std::string& url, const LineHandler& onLine,
                        std::stop_token stop)
        -> std::expected<long, HttpError> = 0;
};

/**
 * @brief libcurl-backed transport
 *
 * Each call uses its own easy handle, so one instance is safe to share
 * between threads.
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    auto get(const std::string& url, std::chrono::milliseconds timeout)
        -> std::expected<HttpResponse, HttpError> override;

    auto put(const std::string& url, const std::string& formBody,
             std::chrono::milliseconds timeout)
        -> std::expected<HttpResponse, HttpError> override;

    auto stream(const std::string& url, const LineHandler& onLine,
                std::stop_token stop)
        -> std::expected<long, HttpError> override;
};

/**
 * @brief Percent-encode a form value
 */
[[nodiscard]] auto urlEncode(std::string_view value) -> std::string;

}  // namespace skybridge::client::alpaca
