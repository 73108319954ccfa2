/*
 * sse_consumer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Long-lived Server-Sent Events reader for one device

**************************************************/

#include "sse_consumer.hpp"

#include <spdlog/spdlog.h>

namespace skybridge::events {

namespace {

constexpr std::string_view DATA_PREFIX = "data:";
constexpr std::string_view PRE_OPEN = "<pre>";
constexpr std::string_view PRE_CLOSE = "</pre>";

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

// "<pre>2025-08-01 10:06:55.8: {...}</pre>" -> "{...}"
auto unwrapEnvelope(std::string_view data) -> std::optional<std::string_view> {
    if (!data.starts_with(PRE_OPEN)) {
        return data;
    }
    data.remove_prefix(PRE_OPEN.size());
    if (data.ends_with(PRE_CLOSE)) {
        data.remove_suffix(PRE_CLOSE.size());
    }
    auto sep = data.find(": ");
    if (sep == std::string_view::npos) {
        return std::nullopt;
    }
    return trim(data.substr(sep + 2));
}

}  // namespace

auto consumerStateName(ConsumerState state) -> std::string_view {
    switch (state) {
        case ConsumerState::Idle:
            return "idle";
        case ConsumerState::Connecting:
            return "connecting";
        case ConsumerState::Streaming:
            return "streaming";
        case ConsumerState::Disconnected:
            return "disconnected";
        case ConsumerState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

auto parseSseLine(std::string_view line) -> std::optional<json> {
    line = trim(line);
    if (!line.starts_with(DATA_PREFIX)) {
        return std::nullopt;
    }
    auto data = trim(line.substr(DATA_PREFIX.size()));
    if (data.empty()) {
        return std::nullopt;
    }

    auto body = unwrapEnvelope(data);
    if (!body) {
        spdlog::debug("SSE frame without timestamp separator: {:.100}", data);
        return std::nullopt;
    }

    auto parsed = json::parse(body->begin(), body->end(), nullptr, false);
    if (parsed.is_discarded()) {
        spdlog::debug("Failed to parse SSE frame: {:.100}", *body);
        return std::nullopt;
    }
    if (!parsed.is_object()) {
        spdlog::debug("Ignoring non-object SSE payload ({})",
                      parsed.type_name());
        return std::nullopt;
    }
    return parsed;
}

SSEConsumer::SSEConsumer(
    std::string deviceId, std::string url,
    std::shared_ptr<client::alpaca::HttpTransport> transport, EventSink sink,
    std::chrono::milliseconds reconnectDelay)
    : deviceId_(std::move(deviceId)),
      url_(std::move(url)),
      transport_(std::move(transport)),
      sink_(std::move(sink)),
      reconnectDelay_(reconnectDelay) {}

SSEConsumer::~SSEConsumer() { stop(); }

void SSEConsumer::start() {
    if (running()) {
        spdlog::debug("Already consuming events for {}", deviceId_);
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    state_ = ConsumerState::Idle;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
    spdlog::info("Started SSE consumer for {} ({})", deviceId_, url_);
}

void SSEConsumer::stop() {
    if (!worker_.joinable()) {
        return;
    }
    worker_.request_stop();
    worker_.join();
    state_ = ConsumerState::Cancelled;
    spdlog::info("Stopped SSE consumer for {}", deviceId_);
}

auto SSEConsumer::running() const -> bool {
    auto current = state_.load();
    return worker_.joinable() && current != ConsumerState::Cancelled;
}

void SSEConsumer::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        state_ = ConsumerState::Connecting;
        ++attempts_;
        spdlog::debug("SSE connecting to {} for {}", url_, deviceId_);

        auto result = transport_->stream(
            url_,
            [this](std::string_view line) {
                if (state_.load() != ConsumerState::Streaming) {
                    state_ = ConsumerState::Streaming;
                    spdlog::info("SSE stream open for {}", deviceId_);
                }
                handleLine(line);
            },
            stop);

        if (stop.stop_requested()) {
            break;
        }
        if (!result) {
            spdlog::error("SSE connection error for {}: {}", deviceId_,
                          result.error().message);
        } else if (*result != 200) {
            spdlog::error("SSE connection failed for {}: HTTP {}", deviceId_,
                          *result);
        } else {
            spdlog::warn("SSE stream for {} closed by peer", deviceId_);
        }

        state_ = ConsumerState::Disconnected;
        if (!waitBeforeReconnect(stop)) {
            break;
        }
    }
    state_ = ConsumerState::Cancelled;
}

void SSEConsumer::handleLine(std::string_view line) {
    auto payload = parseSseLine(line);
    if (!payload) {
        return;
    }
    try {
        sink_(deviceId_, std::move(*payload));
        ++forwarded_;
    } catch (const std::exception& e) {
        spdlog::warn("Dropping SSE event for {}: {}", deviceId_, e.what());
    }
}

auto SSEConsumer::waitBeforeReconnect(std::stop_token stop) -> bool {
    std::unique_lock lock(waitMutex_);
    waitCv_.wait_for(lock, stop, reconnectDelay_, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace skybridge::events
