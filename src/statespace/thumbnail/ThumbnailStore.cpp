#include "thumbnail/ThumbnailStore.hpp"
#include "log/TaggedLogger.hpp"
#include "utils/FileUtils.hpp"

#include <cstdint>
#include <span>

namespace STS::Thumbnail {

auto decodeBase64(std::string_view input) -> std::optional<std::vector<unsigned char>> {
    auto decodeChar = [](char ch) -> std::optional<unsigned char> {
        if (ch >= 'A' && ch <= 'Z')
            return static_cast<unsigned char>(ch - 'A');
        if (ch >= 'a' && ch <= 'z')
            return static_cast<unsigned char>(26 + ch - 'a');
        if (ch >= '0' && ch <= '9')
            return static_cast<unsigned char>(52 + ch - '0');
        if (ch == '+')
            return static_cast<unsigned char>(62);
        if (ch == '/')
            return static_cast<unsigned char>(63);
        return std::nullopt;
    };

    std::vector<unsigned char> output;
    output.reserve((input.size() * 3) / 4);
    std::uint32_t value   = 0;
    int           bits    = 0;
    bool          padding = false;
    for (char ch : input) {
        if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t')
            continue;
        if (ch == '=') {
            padding = true;
            continue;
        }
        if (padding)
            return std::nullopt; // data after padding
        auto decoded = decodeChar(ch);
        if (!decoded)
            return std::nullopt;
        value = (value << 6) | *decoded;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<unsigned char>((value >> bits) & 0xFF));
        }
    }
    return output;
}

ThumbnailStore::ThumbnailStore(std::filesystem::path directory)
    : directory(std::move(directory)) {}

ThumbnailStore::~ThumbnailStore() {
    this->detach();
}

auto ThumbnailStore::latestPath() const -> std::filesystem::path {
    return this->directory / "latest-thumbnail.png";
}

auto ThumbnailStore::store(std::string_view base64Content) -> Expected<std::filesystem::path> {
    auto bytes = decodeBase64(base64Content);
    if (!bytes)
        return std::unexpected(Error{Error::Code::MalformedInput, "Thumbnail content is not valid base64"});
    auto path = this->latestPath();
    auto span = std::as_bytes(std::span(bytes->data(), bytes->size()));
    if (auto written = Utils::writeFileAtomic(path, span, false); !written)
        return std::unexpected(written.error());
    return path;
}

void ThumbnailStore::attach(Notify::Notifier& notifier) {
    this->detach();
    std::lock_guard<std::mutex> lock(this->attachMutex);
    this->attachedNotifier = &notifier;
    this->handlerId        = notifier.registerHandler(
        Notify::InboundTopic::Thumbnail, [this](Notify::json const& message, Notify::SubscriberId const& sender) {
            auto content = message.find("content");
            if (content == message.end() || !content->is_string()) {
                sts_log("Thumbnail from " + sender + " has no content", "Thumbnail", "Error");
                return;
            }
            if (auto stored = this->store(content->get_ref<std::string const&>()); !stored) {
                sts_log("Unable to store thumbnail from " + sender + ": " + describeError(stored.error()),
                        "Thumbnail",
                        "Error");
            }
        });
}

void ThumbnailStore::detach() {
    std::lock_guard<std::mutex> lock(this->attachMutex);
    if (this->attachedNotifier != nullptr && this->handlerId)
        this->attachedNotifier->unregisterHandler(Notify::InboundTopic::Thumbnail, *this->handlerId);
    this->attachedNotifier = nullptr;
    this->handlerId.reset();
}

} // namespace STS::Thumbnail
