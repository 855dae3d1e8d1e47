#include "core/DocumentTree.hpp"

#include <charconv>
#include <utility>

namespace STS::Tree {

namespace {

template <typename Json>
auto findImpl(Json& root, StatePath const& path) -> Json* {
    Json* node = &root;
    for (auto const& segment : path) {
        if (node->is_object()) {
            auto it = node->find(segment);
            if (it == node->end())
                return nullptr;
            node = &*it;
        } else if (node->is_array()) {
            auto index = parseIndex(segment);
            if (!index || *index >= node->size())
                return nullptr;
            node = &(*node)[*index];
        } else {
            return nullptr;
        }
    }
    return node;
}

auto traverseError(json const& node, StatePath const& path, std::size_t depth) -> Error {
    StatePath prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(depth));
    return Error{Error::Code::InvalidPath,
                 "Cannot write through " + std::string{node.type_name()} + " at '/" + formatStatePath(prefix) + "'"};
}

} // namespace

auto parseIndex(std::string const& segment) -> std::optional<std::size_t> {
    if (segment.empty() || (segment.size() > 1 && segment.front() == '0'))
        return std::nullopt;
    std::size_t value = 0;
    auto        end   = segment.data() + segment.size();
    auto        res   = std::from_chars(segment.data(), end, value);
    if (res.ec != std::errc{} || res.ptr != end)
        return std::nullopt;
    return value;
}

auto find(json const& root, StatePath const& path) -> json const* {
    return findImpl(root, path);
}

auto find(json& root, StatePath const& path) -> json* {
    return findImpl(root, path);
}

auto assign(json& root, StatePath const& path, json value) -> Expected<void> {
    if (path.empty()) {
        root = std::move(value);
        return {};
    }

    // Validate the walk before creating anything so a failure leaves no
    // half-built intermediate mappings behind.
    json const* cursor = &root;
    for (std::size_t i = 0; i + 1 < path.size() && cursor != nullptr; ++i) {
        if (cursor->is_object()) {
            auto it = cursor->find(path[i]);
            cursor  = it == cursor->end() ? nullptr : &*it;
        } else if (cursor->is_array()) {
            auto index = parseIndex(path[i]);
            if (!index || *index >= cursor->size())
                return std::unexpected(traverseError(*cursor, path, i));
            cursor = &(*cursor)[*index];
        } else {
            return std::unexpected(traverseError(*cursor, path, i));
        }
    }
    if (cursor != nullptr && !cursor->is_object()) {
        if (!cursor->is_array())
            return std::unexpected(traverseError(*cursor, path, path.size() - 1));
        auto index = parseIndex(path.back());
        if (!index || *index > cursor->size())
            return std::unexpected(traverseError(*cursor, path, path.size() - 1));
    }

    json* node = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        if (node->is_array()) {
            node = &(*node)[*parseIndex(path[i])];
        } else {
            auto it = node->find(path[i]);
            if (it == node->end())
                it = node->emplace(path[i], json::object()).first;
            node = &*it;
        }
    }
    if (node->is_array()) {
        auto index = *parseIndex(path.back());
        if (index == node->size())
            node->push_back(std::move(value));
        else
            (*node)[index] = std::move(value);
    } else {
        (*node)[path.back()] = std::move(value);
    }
    return {};
}

auto erase(json& root, StatePath const& path) -> bool {
    if (path.empty())
        return false;
    StatePath parentPath(path.begin(), path.end() - 1);
    json*     parent = find(root, parentPath);
    if (parent == nullptr)
        return false;
    if (parent->is_object())
        return parent->erase(path.back()) > 0;
    if (parent->is_array()) {
        auto index = parseIndex(path.back());
        if (!index || *index >= parent->size())
            return false;
        parent->erase(*index);
        return true;
    }
    return false;
}

auto eraseKeyEverywhere(json& root, std::string const& key) -> std::size_t {
    std::size_t        removed = 0;
    std::vector<json*> stack{&root};
    while (!stack.empty()) {
        json* node = stack.back();
        stack.pop_back();
        if (node->is_object()) {
            removed += node->erase(key);
            for (auto& [_, child] : node->items())
                stack.push_back(&child);
        } else if (node->is_array()) {
            for (auto& child : *node)
                stack.push_back(&child);
        }
    }
    return removed;
}

auto collect(json const& root, std::function<bool(json const&)> const& predicate) -> std::vector<json const*> {
    std::vector<json const*> found;
    std::vector<json const*> stack{&root};
    while (!stack.empty()) {
        json const* node = stack.back();
        stack.pop_back();
        if (predicate(*node))
            found.push_back(node);
        if (node->is_object()) {
            std::vector<json const*> children;
            for (auto const& [_, child] : node->items())
                children.push_back(&child);
            stack.insert(stack.end(), children.rbegin(), children.rend());
        } else if (node->is_array()) {
            for (auto it = node->rbegin(); it != node->rend(); ++it)
                stack.push_back(&*it);
        }
    }
    return found;
}

} // namespace STS::Tree
