#include "core/StatePath.hpp"

namespace STS {

auto parseStatePath(std::string_view text) -> Expected<StatePath> {
    StatePath   segments;
    std::string current;
    bool        quoted = false;

    auto flushUnquoted = [&]() {
        if (!current.empty())
            segments.push_back(std::move(current));
        current.clear();
    };

    for (char ch : text) {
        if (quoted) {
            if (ch == PathQuote) {
                quoted = false;
                // A quoted span is a segment even when empty: "" addresses the empty key.
                segments.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == PathQuote) {
            flushUnquoted();
            quoted = true;
        } else if (ch == PathSeparator) {
            flushUnquoted();
        } else {
            current.push_back(ch);
        }
    }

    if (quoted) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Unterminated quote in path"});
    }
    flushUnquoted();
    return segments;
}

auto parseRequestPath(std::string_view requestPath, std::string_view routePrefix) -> Expected<StatePath> {
    if (!requestPath.starts_with(routePrefix)) {
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "Request path does not start with " + std::string{routePrefix}});
    }
    requestPath.remove_prefix(routePrefix.size());
    return parseStatePath(requestPath);
}

auto formatStatePath(StatePath const& path) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0)
            out.push_back(PathSeparator);
        auto const& segment = path[i];
        if (segment.empty() || segment.find(PathSeparator) != std::string::npos) {
            out.push_back(PathQuote);
            out.append(segment);
            out.push_back(PathQuote);
        } else {
            out.append(segment);
        }
    }
    return out;
}

} // namespace STS
