#pragma once
#include "core/Error.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace STS::Net {

struct UrlView {
    std::string scheme;
    std::string host;
    std::string path;
    int         port{0};
    bool        tls{false};
};

auto parseUrl(std::string_view url) -> std::optional<UrlView>;
auto buildAbsoluteUrl(UrlView const& url) -> std::string;

// Appends `relative` to `base`, inserting exactly one '/' between them.
auto joinUrl(std::string_view base, std::string_view relative) -> std::string;

/**
 * Retrieves the body of a remote resource. Implementations must be safe to
 * call from several download workers at once.
 */
class UrlFetcher {
public:
    virtual ~UrlFetcher() = default;

    // The raw response body, or AssetFetch / MalformedInput on failure. Any
    // status other than 200 is a failure.
    virtual auto fetch(std::string const& url) -> Expected<std::string> = 0;
};

class HttpUrlFetcher final : public UrlFetcher {
public:
    struct Options {
        std::chrono::seconds timeout{30};
        bool                 verifyCertificates = true;
        bool                 followRedirects    = true;
    };

    HttpUrlFetcher();
    explicit HttpUrlFetcher(Options options);

    auto fetch(std::string const& url) -> Expected<std::string> override;

private:
    Options options;
};

} // namespace STS::Net
