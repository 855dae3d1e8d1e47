#pragma once
#include "core/Error.hpp"
#include "core/StatePath.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace STS::Tree {

using json = nlohmann::json;

// Decimal index of a sequence element, no sign and no leading zeros.
[[nodiscard]] auto parseIndex(std::string const& segment) -> std::optional<std::size_t>;

// Node at `path`, or nullptr when any segment is missing. Mapping nodes are
// addressed by key, sequence nodes by decimal index.
[[nodiscard]] auto find(json const& root, StatePath const& path) -> json const*;
[[nodiscard]] auto find(json& root, StatePath const& path) -> json*;

/*
 * Writes `value` at `path`, creating missing intermediate mappings. The empty
 * path replaces the root. Walking through an existing scalar (or a sequence
 * with an out-of-range index) is an InvalidPath error and leaves `root`
 * untouched. A sequence accepts an index equal to its size as an append.
 */
[[nodiscard]] auto assign(json& root, StatePath const& path, json value) -> Expected<void>;

// Removes the node at a non-empty path. Returns false when the node or any of
// its parents does not exist, which is not an error.
auto erase(json& root, StatePath const& path) -> bool;

// Deletes every mapping entry named `key` at any depth, descending through
// mappings and sequences. Returns the number of entries removed.
auto eraseKeyEverywhere(json& root, std::string const& key) -> std::size_t;

// Every node (root included) for which `predicate` holds, in depth-first
// pre-order.
[[nodiscard]] auto collect(json const& root, std::function<bool(json const&)> const& predicate)
    -> std::vector<json const*>;

} // namespace STS::Tree
