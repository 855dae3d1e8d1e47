#pragma once
#include "core/Error.hpp"
#include "notify/Notifier.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace STS::Thumbnail {

// Standard alphabet with optional '=' padding; ASCII whitespace is skipped.
[[nodiscard]] auto decodeBase64(std::string_view input) -> std::optional<std::vector<unsigned char>>;

/**
 * Receives rendered previews from engines on the "thumbnail" topic
 * ({"target": "thumbnail", "content": "<base64 png>"}) and keeps the most
 * recent one as <directory>/latest-thumbnail.png.
 */
class ThumbnailStore {
public:
    explicit ThumbnailStore(std::filesystem::path directory);
    ~ThumbnailStore();

    ThumbnailStore(ThumbnailStore const&)            = delete;
    ThumbnailStore& operator=(ThumbnailStore const&) = delete;

    auto store(std::string_view base64Content) -> Expected<std::filesystem::path>;
    [[nodiscard]] auto latestPath() const -> std::filesystem::path;

    void attach(Notify::Notifier& notifier);
    void detach();

private:
    std::filesystem::path            directory;
    std::mutex                       attachMutex;
    Notify::Notifier*                attachedNotifier = nullptr;
    std::optional<Notify::HandlerId> handlerId;
};

} // namespace STS::Thumbnail
