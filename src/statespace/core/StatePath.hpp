#pragma once
#include "core/Error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace STS {

/*
 * A location inside the state document as an ordered list of segments. The
 * root is the empty list. Segments may contain '/', so the textual form wraps
 * such segments in double quotes: state/"a/b"/c -> ["a/b", "c"].
 */
using StatePath = std::vector<std::string>;

inline constexpr char PathSeparator = '/';
inline constexpr char PathQuote     = '"';

// Splits on unquoted separators; quoted spans become single segments. Empty
// unquoted segments (doubled or trailing slashes) are dropped. An unterminated
// quote is malformed input.
[[nodiscard]] auto parseStatePath(std::string_view text) -> Expected<StatePath>;

// Same as parseStatePath after removing `routePrefix` from the front of
// `requestPath`. A request path that does not start with the prefix is an
// InvalidPath error.
[[nodiscard]] auto parseRequestPath(std::string_view requestPath, std::string_view routePrefix)
    -> Expected<StatePath>;

// Inverse of parseStatePath for display and error messages.
[[nodiscard]] auto formatStatePath(StatePath const& path) -> std::string;

} // namespace STS
