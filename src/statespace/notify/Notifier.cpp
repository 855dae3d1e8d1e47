#include "notify/Notifier.hpp"
#include "log/TaggedLogger.hpp"
#include "utils/FileUtils.hpp"

#include <algorithm>
#include <exception>

namespace STS::Notify {

Notifier::Notifier()
    : Notifier(Options{}) {}

Notifier::Notifier(Options opts)
    : options(std::move(opts)) {
    if (this->options.incomingSchema)
        this->incomingValidator.emplace(*this->options.incomingSchema);
    if (this->options.outgoingSchema)
        this->outgoingValidator.emplace(*this->options.outgoingSchema);
}

auto Notifier::subscribe(std::shared_ptr<SubscriberChannel> channel) -> SubscriberId {
    auto id = Utils::generateUuid();
    {
        std::lock_guard<std::mutex> lock(this->subscribersMutex);
        this->subscribers.emplace(id, std::move(channel));
    }
    sts_log("Subscriber " + id + " connected", "Notifier", "INFO");
    return id;
}

auto Notifier::unsubscribe(SubscriberId const& id) -> bool {
    std::lock_guard<std::mutex> lock(this->subscribersMutex);
    auto removed = this->subscribers.erase(id) > 0;
    if (removed)
        sts_log("Subscriber " + id + " disconnected", "Notifier", "INFO");
    return removed;
}

auto Notifier::subscriberCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->subscribersMutex);
    return this->subscribers.size();
}

auto Notifier::encode(Notification const& notification) const -> json {
    return json{{"$schema", this->options.schemaUrl},
                {"target", std::string{notificationTargetName(notification.target)}}};
}

auto Notifier::broadcast(Notification const& notification) -> std::size_t {
    auto message = this->encode(notification);
    if (this->outgoingValidator) {
        if (auto violation = this->outgoingValidator->validate(message)) {
            sts_log("Outgoing message rejected: " + violation->message, "Notifier", "Error");
            return this->subscriberCount();
        }
    }
    auto const payload = message.dump();

    std::vector<std::pair<SubscriberId, std::shared_ptr<SubscriberChannel>>> targets;
    {
        std::lock_guard<std::mutex> lock(this->subscribersMutex);
        targets.assign(this->subscribers.begin(), this->subscribers.end());
    }

    std::size_t failures = 0;
    for (auto const& [id, channel] : targets) {
        try {
            auto delivered = channel->deliver(payload);
            if (!delivered) {
                ++failures;
                sts_log("Delivery to " + id + " failed: " + describeError(delivered.error()), "Notifier", "Error");
            }
        } catch (std::exception const& e) {
            ++failures;
            sts_log("Delivery to " + id + " threw: " + e.what(), "Notifier", "Error");
        }
    }
    return failures;
}

auto Notifier::registerHandler(InboundTopic topic, InboundHandler handler) -> HandlerId {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    auto id = this->nextHandlerId++;
    this->handlers[topic].emplace_back(id, std::move(handler));
    return id;
}

auto Notifier::unregisterHandler(InboundTopic topic, HandlerId id) -> bool {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    auto it = this->handlers.find(topic);
    if (it == this->handlers.end())
        return false;
    auto& list   = it->second;
    auto  before = list.size();
    std::erase_if(list, [id](auto const& entry) { return entry.first == id; });
    return list.size() != before;
}

auto Notifier::handlerCount(InboundTopic topic) const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    auto it = this->handlers.find(topic);
    return it == this->handlers.end() ? 0 : it->second.size();
}

auto Notifier::dispatchInbound(json const& message, SubscriberId const& sender) -> Expected<std::size_t> {
    auto target = message.find("target");
    if (!message.is_object() || target == message.end() || !target->is_string()) {
        sts_log("Dropping message without a target from " + sender, "Notifier", "Error");
        return std::unexpected(Error{Error::Code::MalformedInput, "Message has no target"});
    }
    auto topic = parseInboundTopic(target->get<std::string>());
    if (!topic) {
        sts_log("Dropping message with unknown target " + target->get<std::string>(), "Notifier", "Error");
        return std::unexpected(Error{Error::Code::NotFound, "Unknown message target " + target->get<std::string>()});
    }

    std::vector<InboundHandler> toRun;
    {
        std::lock_guard<std::mutex> lock(this->handlersMutex);
        if (auto it = this->handlers.find(*topic); it != this->handlers.end()) {
            for (auto const& entry : it->second)
                toRun.push_back(entry.second);
        }
    }
    if (toRun.empty()) {
        sts_log("No handler registered for " + std::string{inboundTopicName(*topic)}, "Notifier", "INFO");
        return 0;
    }

    std::size_t completed = 0;
    for (auto const& handler : toRun) {
        try {
            handler(message, sender);
            ++completed;
        } catch (std::exception const& e) {
            sts_log("Handler for " + std::string{inboundTopicName(*topic)} + " threw: " + e.what(),
                    "Notifier",
                    "Error");
        }
    }
    return completed;
}

auto Notifier::receiveRaw(std::string_view text, SubscriberId const& sender) -> Expected<std::size_t> {
    json message;
    try {
        message = json::parse(text);
    } catch (json::parse_error const& e) {
        sts_log("Dropping malformed message from " + sender + ": " + e.what(), "Notifier", "Error");
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"Message is not valid JSON: "} + e.what()});
    }
    if (this->incomingValidator) {
        if (auto violation = this->incomingValidator->validate(message)) {
            sts_log("Dropping invalid message from " + sender + ": " + violation->message, "Notifier", "Error");
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "Message failed validation - /" + formatStatePath(violation->instancePath)
                                             + ": " + violation->message});
        }
    }
    return this->dispatchInbound(message, sender);
}

} // namespace STS::Notify
