/*
 * sse_consumer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Long-lived Server-Sent Events reader for one device

**************************************************/

#ifndef SKYBRIDGE_EVENTS_SSE_CONSUMER_HPP
#define SKYBRIDGE_EVENTS_SSE_CONSUMER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "atom/type/json.hpp"
#include "client/alpaca/http_transport.hpp"

namespace skybridge::events {

using json = nlohmann::json;

enum class ConsumerState { Idle, Connecting, Streaming, Disconnected, Cancelled };

[[nodiscard]] auto consumerStateName(ConsumerState state) -> std::string_view;

/**
 * @brief Extract the JSON object carried by one SSE line
 *
 * Accepts "data: <pre>2025-08-01 10:06:55.8: {...}</pre>" and
 * "data: {...}". Returns nullopt for other fields, comments, keep-alives,
 * malformed JSON and non-object payloads.
 */
[[nodiscard]] auto parseSseLine(std::string_view line) -> std::optional<json>;

/**
 * @brief Receives each parsed payload on the consumer thread
 */
using EventSink = std::function<void(const std::string& deviceId, json payload)>;

/**
 * @brief Reads one device's event feed until stopped
 *
 * State machine: Idle -> Connecting -> Streaming, then on a non-200
 * answer, a transport error or a closed stream, Disconnected and back to
 * Connecting after the reconnect delay. stop() moves to Cancelled and
 * returns only after the reader thread has exited, so the sink is never
 * called afterwards.
 */
class SSEConsumer {
public:
    SSEConsumer(std::string deviceId, std::string url,
                std::shared_ptr<client::alpaca::HttpTransport> transport,
                EventSink sink,
                std::chrono::milliseconds reconnectDelay =
                    std::chrono::seconds(5));
    ~SSEConsumer();

    SSEConsumer(const SSEConsumer&) = delete;
    SSEConsumer& operator=(const SSEConsumer&) = delete;

    /**
     * @brief Launch the reader thread; no-op while already running
     */
    void start();

    void stop();

    [[nodiscard]] auto state() const -> ConsumerState { return state_.load(); }

    [[nodiscard]] auto running() const -> bool;

    [[nodiscard]] auto deviceId() const -> const std::string& {
        return deviceId_;
    }

    [[nodiscard]] auto url() const -> const std::string& { return url_; }

    [[nodiscard]] auto eventsForwarded() const -> size_t {
        return forwarded_.load();
    }

    [[nodiscard]] auto connectAttempts() const -> size_t {
        return attempts_.load();
    }

private:
    void run(std::stop_token stop);
    void handleLine(std::string_view line);
    auto waitBeforeReconnect(std::stop_token stop) -> bool;

    std::string deviceId_;
    std::string url_;
    std::shared_ptr<client::alpaca::HttpTransport> transport_;
    EventSink sink_;
    std::chrono::milliseconds reconnectDelay_;

    std::atomic<ConsumerState> state_{ConsumerState::Idle};
    std::atomic<size_t> forwarded_{0};
    std::atomic<size_t> attempts_{0};

    std::mutex waitMutex_;
    std::condition_variable_any waitCv_;
    std::jthread worker_;
};

}  // namespace skybridge::events

#endif  // SKYBRIDGE_EVENTS_SSE_CONSUMER_HPP
