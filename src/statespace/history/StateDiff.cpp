#include "history/StateDiff.hpp"
#include "core/DocumentTree.hpp"

#include <algorithm>
#include <utility>

namespace STS::History {

namespace {

class DiffCollector {
public:
    explicit DiffCollector(std::vector<DiffOp>& out)
        : ops(out) {}

    void compare(json const& from, json const& to) {
        if (from.is_object() && to.is_object()) {
            this->compareObjects(from, to);
            return;
        }
        if (from.is_array() && to.is_array() && from.size() == to.size()) {
            for (std::size_t i = 0; i < from.size(); ++i) {
                this->currentPath.push_back(std::to_string(i));
                this->compare(from[i], to[i]);
                this->currentPath.pop_back();
            }
            return;
        }
        // 1 and 1.0 compare equal; the type check keeps the stored representation exact.
        // Signed and unsigned integers of the same value are the same number.
        bool const sameKind = from.type() == to.type() || (from.is_number_integer() && to.is_number_integer());
        if (!sameKind || from != to)
            this->ops.push_back(DiffOp{DiffOp::Kind::Replace, this->currentPath, from, to});
    }

private:
    std::vector<DiffOp>& ops;
    StatePath            currentPath;

    void compareObjects(json const& from, json const& to) {
        for (auto const& [key, oldValue] : from.items()) {
            this->currentPath.push_back(key);
            auto it = to.find(key);
            if (it == to.end())
                this->ops.push_back(DiffOp{DiffOp::Kind::Remove, this->currentPath, oldValue, json{}});
            else
                this->compare(oldValue, *it);
            this->currentPath.pop_back();
        }
        for (auto const& [key, newValue] : to.items()) {
            if (from.contains(key))
                continue;
            this->currentPath.push_back(key);
            this->ops.push_back(DiffOp{DiffOp::Kind::Add, this->currentPath, json{}, newValue});
            this->currentPath.pop_back();
        }
    }
};

auto mismatch(DiffOp const& op, char const* reason) -> Error {
    return Error{Error::Code::InvalidPath,
                 std::string{diffKindName(op.kind)} + " at '/" + formatStatePath(op.path) + "' " + reason};
}

auto applyOne(json& document, DiffOp const& op) -> Expected<void> {
    if (op.kind == DiffOp::Kind::Replace) {
        json* node = Tree::find(document, op.path);
        if (node == nullptr)
            return std::unexpected(mismatch(op, "targets a missing node"));
        if (*node != op.before)
            return std::unexpected(mismatch(op, "does not match the current value"));
        *node = op.after;
        return {};
    }

    if (op.path.empty())
        return std::unexpected(mismatch(op, "cannot address the root"));
    StatePath parentPath(op.path.begin(), op.path.end() - 1);
    json*     parent = Tree::find(document, parentPath);
    if (parent == nullptr || !parent->is_object())
        return std::unexpected(mismatch(op, "has no parent mapping"));

    auto const& key = op.path.back();
    auto        it  = parent->find(key);
    if (op.kind == DiffOp::Kind::Add) {
        if (it != parent->end())
            return std::unexpected(mismatch(op, "targets an existing key"));
        parent->emplace(key, op.after);
        return {};
    }
    if (it == parent->end())
        return std::unexpected(mismatch(op, "targets a missing key"));
    if (*it != op.before)
        return std::unexpected(mismatch(op, "does not match the current value"));
    parent->erase(it);
    return {};
}

auto applyAll(json& document, std::vector<DiffOp> const& ops) -> Expected<void> {
    json working = document;
    for (auto const& op : ops) {
        if (auto applied = applyOne(working, op); !applied)
            return applied;
    }
    document = std::move(working);
    return {};
}

} // namespace

auto diffKindName(DiffOp::Kind kind) -> char const* {
    switch (kind) {
    case DiffOp::Kind::Add:
        return "add";
    case DiffOp::Kind::Remove:
        return "remove";
    case DiffOp::Kind::Replace:
        return "replace";
    }
    return "unknown";
}

auto StateDiff::between(json const& from, json const& to) -> StateDiff {
    StateDiff     diff;
    DiffCollector collector{diff.ops};
    collector.compare(from, to);
    return diff;
}

auto StateDiff::inverse() const -> StateDiff {
    StateDiff reversed;
    reversed.ops.reserve(this->ops.size());
    for (auto it = this->ops.rbegin(); it != this->ops.rend(); ++it) {
        DiffOp op = *it;
        switch (op.kind) {
        case DiffOp::Kind::Add:
            op.kind = DiffOp::Kind::Remove;
            break;
        case DiffOp::Kind::Remove:
            op.kind = DiffOp::Kind::Add;
            break;
        case DiffOp::Kind::Replace:
            break;
        }
        std::swap(op.before, op.after);
        reversed.ops.push_back(std::move(op));
    }
    return reversed;
}

auto StateDiff::applyForward(json& document) const -> Expected<void> {
    return applyAll(document, this->ops);
}

auto StateDiff::applyInverse(json& document) const -> Expected<void> {
    return applyAll(document, this->inverse().ops);
}

auto StateDiff::approximateBytes() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& op : this->ops) {
        for (auto const& segment : op.path)
            total += segment.size() + 1;
        if (!op.before.is_null())
            total += op.before.dump().size();
        if (!op.after.is_null())
            total += op.after.dump().size();
    }
    return total;
}

auto StateDiff::toJson() const -> json {
    json out = json::array();
    for (auto const& op : this->ops) {
        json entry{{"op", diffKindName(op.kind)}, {"path", "/" + formatStatePath(op.path)}};
        if (op.kind != DiffOp::Kind::Add)
            entry["before"] = op.before;
        if (op.kind != DiffOp::Kind::Remove)
            entry["after"] = op.after;
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace STS::History
