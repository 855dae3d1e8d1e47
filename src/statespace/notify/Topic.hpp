#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace STS::Notify {

// What changed, as announced to subscribers in the "target" field.
enum class NotificationTarget : std::uint8_t {
    State,
    AssetCacheUpdate,
};

// Inbound message categories, selected by the "target" field of a subscriber message.
enum class InboundTopic : std::uint8_t {
    Thumbnail,
    SaveLocalAsset,
};

[[nodiscard]] constexpr auto notificationTargetName(NotificationTarget target) -> std::string_view {
    switch (target) {
    case NotificationTarget::State:
        return "state";
    case NotificationTarget::AssetCacheUpdate:
        return "asset-cache-update";
    }
    return "state";
}

[[nodiscard]] constexpr auto inboundTopicName(InboundTopic topic) -> std::string_view {
    switch (topic) {
    case InboundTopic::Thumbnail:
        return "thumbnail";
    case InboundTopic::SaveLocalAsset:
        return "save-local-asset";
    }
    return "thumbnail";
}

[[nodiscard]] constexpr auto parseInboundTopic(std::string_view name) -> std::optional<InboundTopic> {
    if (name == "thumbnail")
        return InboundTopic::Thumbnail;
    if (name == "save-local-asset")
        return InboundTopic::SaveLocalAsset;
    return std::nullopt;
}

} // namespace STS::Notify
