#pragma once

#include "core/Error.hpp"
#include "notify/Notifier.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace httplib {
class Server;
class Request;
class Response;
struct DataSink;
} // namespace httplib

namespace STS::Web {

struct HttpRequestContext;

// One server-sent-events block: optional "id:", "event:", one "data:" line
// per payload line, blank line terminator.
auto format_sse_event(std::string_view event_name, std::string_view payload, std::string_view event_id = {})
    -> std::string;

/**
 * Subscriber backed by an event-stream connection. deliver() only queues;
 * the connection's content provider drains the queue. A peer that stops
 * reading fills the queue and further deliveries fail until it catches up.
 */
class EventStreamChannel final : public Notify::SubscriberChannel {
public:
    explicit EventStreamChannel(std::size_t max_queued = 256);

    auto deliver(std::string const& payload) -> Expected<void> override;

    // Waits up to `timeout` for the next queued payload.
    auto next(std::chrono::milliseconds timeout) -> std::optional<std::string>;

    void close();
    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto queued() const -> std::size_t;

private:
    std::size_t             max_queued_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool                    closed_{false};
};

class EventStreamSession {
public:
    EventStreamSession(Notify::SubscriberId             id,
                       std::shared_ptr<EventStreamChannel> channel,
                       std::atomic<bool>&               should_stop);

    auto pump(httplib::DataSink& sink) -> bool;
    void cancel();

private:
    static constexpr auto kKeepAliveInterval = std::chrono::milliseconds(5000);
    static constexpr auto kWaitTimeout       = std::chrono::milliseconds(1000);

    auto stopped() const -> bool;

    Notify::SubscriberId                  id_;
    std::shared_ptr<EventStreamChannel>   channel_;
    std::atomic<bool>&                    should_stop_;
    bool                                  started_{false};
    std::atomic<bool>                     cancelled_{false};
    std::chrono::steady_clock::time_point last_write_{std::chrono::steady_clock::now()};
};

/**
 *   GET  /api/events           event stream; "hello" carries the subscriber id,
 *                              then one "notification" per broadcast
 *   POST /api/events/<id>      subscriber message, routed by its "target"
 */
class SubscriberStream {
public:
    static auto Create(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
        -> std::unique_ptr<SubscriberStream>;

    void register_routes(httplib::Server& server);

    ~SubscriberStream();

private:
    SubscriberStream(HttpRequestContext& ctx, std::atomic<bool>& should_stop);

    void handle_events_request(httplib::Request const& req, httplib::Response& res);
    void handle_inbound_request(httplib::Request const& req, httplib::Response& res);

    HttpRequestContext& ctx_;
    std::atomic<bool>&  should_stop_;
};

} // namespace STS::Web
