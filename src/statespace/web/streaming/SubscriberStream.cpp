#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"

#include <statespace/web/routing/HttpHelpers.hpp>
#include <statespace/web/streaming/SubscriberStream.hpp>

#include <nlohmann/json.hpp>

namespace STS::Web {

namespace {

void write_sse_block(httplib::DataSink& sink, std::string const& block) {
    sink.write(block.data(), block.size());
}

void write_sse_retry(httplib::DataSink& sink, int milliseconds) {
    std::string block = "retry: ";
    block.append(std::to_string(milliseconds));
    block.append("\n\n");
    write_sse_block(sink, block);
}

void write_sse_comment(httplib::DataSink& sink, std::string_view comment) {
    std::string block = ": ";
    block.append(comment.data(), comment.size());
    block.append("\n\n");
    write_sse_block(sink, block);
}

} // namespace

auto format_sse_event(std::string_view event_name, std::string_view payload, std::string_view event_id)
    -> std::string {
    std::string block;
    block.reserve(payload.size() + 64);
    if (!event_id.empty()) {
        block.append("id: ");
        block.append(event_id);
        block.append("\n");
    }
    block.append("event: ");
    block.append(event_name);
    block.append("\n");
    std::size_t start = 0U;
    while (start < payload.size()) {
        auto end = payload.find('\n', start);
        auto len = (end == std::string_view::npos ? payload.size() : end) - start;
        block.append("data: ");
        block.append(payload.data() + start, len);
        block.append("\n");
        if (end == std::string_view::npos) {
            start = payload.size();
        } else {
            start = end + 1;
        }
    }
    if (payload.empty()) {
        block.append("data: \n");
    }
    block.append("\n");
    return block;
}

EventStreamChannel::EventStreamChannel(std::size_t max_queued)
    : max_queued_(max_queued) {}

auto EventStreamChannel::deliver(std::string const& payload) -> Expected<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return std::unexpected(Error{Error::Code::DeliveryFailed, "event stream closed"});
        }
        if (max_queued_ > 0 && queue_.size() >= max_queued_) {
            return std::unexpected(Error{Error::Code::DeliveryFailed, "event stream queue full"});
        }
        queue_.push_back(payload);
    }
    cv_.notify_one();
    return {};
}

auto EventStreamChannel::next(std::chrono::milliseconds timeout) -> std::optional<std::string> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto payload = std::move(queue_.front());
    queue_.pop_front();
    return payload;
}

void EventStreamChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto EventStreamChannel::closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto EventStreamChannel::queued() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

EventStreamSession::EventStreamSession(Notify::SubscriberId                id,
                                       std::shared_ptr<EventStreamChannel> channel,
                                       std::atomic<bool>&                  should_stop)
    : id_(std::move(id))
    , channel_(std::move(channel))
    , should_stop_(should_stop) {}

auto EventStreamSession::stopped() const -> bool {
    return cancelled_.load(std::memory_order_acquire) || should_stop_.load(std::memory_order_acquire)
           || channel_->closed();
}

auto EventStreamSession::pump(httplib::DataSink& sink) -> bool {
    if (stopped()) {
        return false;
    }

    if (!started_) {
        started_ = true;
        write_sse_retry(sink, 2000);
        auto hello = nlohmann::json{{"id", id_}}.dump();
        write_sse_block(sink, format_sse_event("hello", hello));
        last_write_ = std::chrono::steady_clock::now();
        return true;
    }

    auto payload = channel_->next(kWaitTimeout);
    if (stopped()) {
        return false;
    }

    auto now = std::chrono::steady_clock::now();
    if (payload) {
        write_sse_block(sink, format_sse_event("notification", *payload));
        last_write_ = now;
    } else if (now - last_write_ >= kKeepAliveInterval) {
        write_sse_comment(sink, "keep-alive");
        last_write_ = now;
    }
    return true;
}

void EventStreamSession::cancel() {
    cancelled_.store(true, std::memory_order_release);
    channel_->close();
}

auto SubscriberStream::Create(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
    -> std::unique_ptr<SubscriberStream> {
    return std::unique_ptr<SubscriberStream>(new SubscriberStream(ctx, should_stop));
}

SubscriberStream::SubscriberStream(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
    : ctx_(ctx)
    , should_stop_(should_stop) {}

SubscriberStream::~SubscriberStream() = default;

void SubscriberStream::register_routes(httplib::Server& server) {
    server.Get("/api/events", [this](httplib::Request const& req, httplib::Response& res) {
        handle_events_request(req, res);
    });
    server.Post(R"(/api/events/([A-Za-z0-9\-]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_inbound_request(req, res);
    });
}

void SubscriberStream::handle_events_request(httplib::Request const&, httplib::Response& res) {
    auto channel = std::make_shared<EventStreamChannel>();
    auto id      = ctx_.notifier.subscribe(channel);
    auto session = std::make_shared<EventStreamSession>(id, channel, should_stop_);

    res.set_header("Cache-Control", "no-store");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [session](size_t, httplib::DataSink& sink) {
            return session->pump(sink);
        },
        [session, id, this](bool) {
            session->cancel();
            ctx_.notifier.unsubscribe(id);
        });
}

void SubscriberStream::handle_inbound_request(httplib::Request const& req, httplib::Response& res) {
    if (req.matches.size() < 2) {
        respond_bad_request(res, "invalid subscriber route");
        return;
    }
    std::string sender = req.matches[1];
    if (req.body.size() > kMaxRequestBodyBytes) {
        respond_payload_too_large(res);
        return;
    }
    auto handled = ctx_.notifier.receiveRaw(req.body, sender);
    if (!handled) {
        respond_error(res, handled.error());
        return;
    }
    write_json_response(res, nlohmann::json{{"handled", *handled}}, 202, true);
}

} // namespace STS::Web
