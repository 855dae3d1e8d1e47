#pragma once
#include "core/Error.hpp"
#include "core/StatePath.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace STS::History {

using json = nlohmann::json;

struct DiffOp {
    enum class Kind : std::uint8_t {
        Add,     // `after` appears at `path`
        Remove,  // `before` disappears from `path`
        Replace, // `before` at `path` becomes `after`
    };

    Kind      kind;
    StatePath path;
    json      before;
    json      after;
};

/**
 * Structural edit script between two documents.
 *
 * Mappings are compared key by key. Sequences of equal length are compared
 * element by element; sequences whose length changed, and values whose type
 * changed, are replaced whole. No operation's path is a prefix of another's,
 * so operations are independent of each other.
 *
 * applyForward turns the `from` document into `to`; applyInverse turns `to`
 * back into `from`. The inverse script is the reversed list with Add and
 * Remove swapped and the two sides of every Replace exchanged.
 */
class StateDiff {
public:
    StateDiff() = default;

    [[nodiscard]] static auto between(json const& from, json const& to) -> StateDiff;

    [[nodiscard]] auto empty() const -> bool { return this->ops.empty(); }
    [[nodiscard]] auto operations() const -> std::vector<DiffOp> const& { return this->ops; }
    [[nodiscard]] auto inverse() const -> StateDiff;

    // Both leave `document` unmodified when an operation does not fit it.
    [[nodiscard]] auto applyForward(json& document) const -> Expected<void>;
    [[nodiscard]] auto applyInverse(json& document) const -> Expected<void>;

    // Rough serialized size of the script, used by journal retention.
    [[nodiscard]] auto approximateBytes() const -> std::size_t;

    [[nodiscard]] auto toJson() const -> json;

private:
    std::vector<DiffOp> ops;
};

[[nodiscard]] auto diffKindName(DiffOp::Kind kind) -> char const*;

} // namespace STS::History
