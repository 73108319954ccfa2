/*
 * http_transport.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: libcurl HTTP transport

**************************************************/

#include "http_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <format>
#include <mutex>

namespace skybridge::client::alpaca {

namespace {

constexpr const char* USER_AGENT = "skybridge/0.1";

std::once_flag curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(curlInitFlag,
                   [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/// Owns one easy handle and its header list
class EasyHandle {
public:
    EasyHandle() : handle_(curl_easy_init()) {}
    ~EasyHandle() {
        if (headers_) {
            curl_slist_free_all(headers_);
        }
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    [[nodiscard]] auto get() const -> CURL* { return handle_; }

    void addHeader(const char* header) {
        headers_ = curl_slist_append(headers_, header);
        curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers_);
    }

private:
    CURL* handle_;
    curl_slist* headers_{nullptr};
};

auto writeCallback(char* contents, size_t size, size_t nmemb, void* userdata)
    -> size_t {
    size_t totalSize = size * nmemb;
    static_cast<std::string*>(userdata)->append(contents, totalSize);
    return totalSize;
}

auto toHttpError(CURLcode code) -> HttpError {
    HttpError error;
    error.message = curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            error.code = HttpErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            error.code = HttpErrorCode::ConnectionFailed;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            error.code = HttpErrorCode::Cancelled;
            break;
        default:
            error.code = HttpErrorCode::ProtocolError;
            break;
    }
    return error;
}

auto perform(EasyHandle& easy, const std::string& url,
             std::chrono::milliseconds timeout)
    -> std::expected<HttpResponse, HttpError> {
    HttpResponse response;
    CURL* curl = easy.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        spdlog::debug("HTTP request to {} failed: {}", url,
                      curl_easy_strerror(res));
        return std::unexpected(toHttpError(res));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

/// State shared with the streaming callbacks
struct StreamContext {
    CURL* curl{nullptr};
    const LineHandler* onLine{nullptr};
    std::stop_token stop;
    std::string pending;
    long status{0};
};

auto streamWriteCallback(char* contents, size_t size, size_t nmemb,
                         void* userdata) -> size_t {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t totalSize = size * nmemb;

    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    }
    if (ctx->status != 200 || ctx->stop.stop_requested()) {
        // Returning a short count aborts the transfer
        return 0;
    }

    ctx->pending.append(contents, totalSize);
    size_t start = 0;
    for (auto pos = ctx->pending.find('\n', start); pos != std::string::npos;
         pos = ctx->pending.find('\n', start)) {
        std::string_view line(ctx->pending.data() + start, pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        (*ctx->onLine)(line);
        start = pos + 1;
    }
    ctx->pending.erase(0, start);
    return totalSize;
}

auto streamProgressCallback(void* userdata, curl_off_t, curl_off_t,
                            curl_off_t, curl_off_t) -> int {
    auto* ctx = static_cast<StreamContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

}  // namespace

auto urlEncode(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

CurlTransport::CurlTransport() { ensureCurlInitialized(); }

CurlTransport::~CurlTransport() = default;

auto CurlTransport::get(const std::string& url,
                        std::chrono::milliseconds timeout)
    -> std::expected<HttpResponse, HttpError> {
    EasyHandle easy;
    if (!easy.get()) {
        return std::unexpected(
            HttpError{HttpErrorCode::ProtocolError, "curl_easy_init failed"});
    }
    curl_easy_setopt(easy.get(), CURLOPT_HTTPGET, 1L);
    return perform(easy, url, timeout);
}

auto CurlTransport::put(const std::string& url, const std::string& formBody,
                        std::chrono::milliseconds timeout)
    -> std::expected<HttpResponse, HttpError> {
    EasyHandle easy;
    if (!easy.get()) {
        return std::unexpected(
            HttpError{HttpErrorCode::ProtocolError, "curl_easy_init failed"});
    }
    curl_easy_setopt(easy.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(easy.get(), CURLOPT_POSTFIELDS, formBody.c_str());
    curl_easy_setopt(easy.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(formBody.size()));
    easy.addHeader("Content-Type: application/x-www-form-urlencoded");
    return perform(easy, url, timeout);
}

auto CurlTransport::stream(const std::string& url, const LineHandler& onLine,
                           std::stop_token stop)
    -> std::expected<long, HttpError> {
    EasyHandle easy;
    if (!easy.get()) {
        return std::unexpected(
            HttpError{HttpErrorCode::ProtocolError, "curl_easy_init failed"});
    }

    StreamContext ctx;
    ctx.curl = easy.get();
    ctx.onLine = &onLine;
    ctx.stop = stop;

    CURL* curl = easy.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, streamWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, streamProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    easy.addHeader("Accept: text/event-stream");

    CURLcode res = curl_easy_perform(curl);
    if (stop.stop_requested()) {
        return std::unexpected(
            HttpError{HttpErrorCode::Cancelled, "stream cancelled"});
    }
    if (ctx.status == 0) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &ctx.status);
    }
    if (res == CURLE_WRITE_ERROR && ctx.status != 200 && ctx.status != 0) {
        return ctx.status;
    }
    if (res != CURLE_OK) {
        return std::unexpected(toHttpError(res));
    }
    return ctx.status;
}

}  // namespace skybridge::client::alpaca
