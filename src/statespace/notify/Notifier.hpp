#pragma once
#include "core/Error.hpp"
#include "notify/Topic.hpp"
#include "schema/SchemaValidator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace STS::Notify {

using json         = nlohmann::json;
using SubscriberId = std::string;
using HandlerId    = std::uint64_t;

struct Notification {
    NotificationTarget target;
};

/**
 * One connected subscriber. deliver() receives the serialized notification
 * and may be called from any thread; it should not block on a slow peer.
 */
class SubscriberChannel {
public:
    virtual ~SubscriberChannel() = default;

    virtual auto deliver(std::string const& payload) -> Expected<void> = 0;
};

using InboundHandler = std::function<void(json const& message, SubscriberId const& sender)>;

/**
 * Fan-out of change notifications to subscribers and routing of subscriber
 * messages to handlers by topic.
 *
 * The subscriber and handler registries each have their own lock. Deliveries
 * and handler calls run on a snapshot taken under the lock, so a channel or
 * handler may subscribe, unsubscribe or register without deadlocking.
 */
class Notifier {
public:
    struct Options {
        // Value of "$schema" in every outbound message.
        std::string         schemaUrl;
        // Incoming messages are validated against this schema when present.
        std::optional<json> incomingSchema;
        // Outbound messages are checked against this schema when present.
        std::optional<json> outgoingSchema;
    };

    Notifier();
    explicit Notifier(Options options);

    Notifier(Notifier const&)            = delete;
    Notifier& operator=(Notifier const&) = delete;

    auto subscribe(std::shared_ptr<SubscriberChannel> channel) -> SubscriberId;
    // Returns false when the id was not subscribed.
    auto unsubscribe(SubscriberId const& id) -> bool;
    [[nodiscard]] auto subscriberCount() const -> std::size_t;

    // Returns the number of subscribers the notification could not reach.
    auto broadcast(Notification const& notification) -> std::size_t;
    [[nodiscard]] auto encode(Notification const& notification) const -> json;

    auto registerHandler(InboundTopic topic, InboundHandler handler) -> HandlerId;
    auto unregisterHandler(InboundTopic topic, HandlerId id) -> bool;
    [[nodiscard]] auto handlerCount(InboundTopic topic) const -> std::size_t;

    // Runs every handler of the message's topic in registration order and
    // returns how many completed without throwing.
    auto dispatchInbound(json const& message, SubscriberId const& sender) -> Expected<std::size_t>;

    // Parses and validates a raw subscriber message, then dispatches it.
    auto receiveRaw(std::string_view text, SubscriberId const& sender) -> Expected<std::size_t>;

private:
    Options                                  options;
    std::optional<Schema::SchemaValidator>   incomingValidator;
    std::optional<Schema::SchemaValidator>   outgoingValidator;

    mutable std::mutex                                          subscribersMutex;
    std::map<SubscriberId, std::shared_ptr<SubscriberChannel>> subscribers;

    mutable std::mutex                                                        handlersMutex;
    std::map<InboundTopic, std::vector<std::pair<HandlerId, InboundHandler>>> handlers;
    HandlerId                                                                 nextHandlerId = 1;
};

} // namespace STS::Notify
