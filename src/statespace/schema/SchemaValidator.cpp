#include "schema/SchemaValidator.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <regex>
#include <sstream>
#include <utility>

namespace STS::Schema {

namespace {

constexpr std::size_t MaxRefDepth = 64;

auto shortDump(json const& value) -> std::string {
    auto text = value.dump();
    if (text.size() > 80) {
        text.resize(77);
        text.append("...");
    }
    return text;
}

auto isCount(json const& value) -> bool {
    return value.is_number_integer() && value.get<std::int64_t>() >= 0;
}

auto matchesType(json const& instance, std::string const& type) -> bool {
    if (type == "object")
        return instance.is_object();
    if (type == "array")
        return instance.is_array();
    if (type == "string")
        return instance.is_string();
    if (type == "boolean")
        return instance.is_boolean();
    if (type == "null")
        return instance.is_null();
    if (type == "number")
        return instance.is_number();
    if (type == "integer") {
        if (instance.is_number_integer())
            return true;
        if (instance.is_number_float()) {
            auto v = instance.get<double>();
            return std::isfinite(v) && std::floor(v) == v;
        }
        return false;
    }
    return false;
}

// Number of unicode code points in a UTF-8 string; maxLength counts characters.
auto utf8Length(std::string const& text) -> std::size_t {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

auto unescapePointerToken(std::string token) -> std::string {
    std::string out;
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '0') {
                out.push_back('~');
                ++i;
                continue;
            }
            if (token[i + 1] == '1') {
                out.push_back('/');
                ++i;
                continue;
            }
        }
        out.push_back(token[i]);
    }
    return out;
}

class Walker {
public:
    explicit Walker(json const& rootSchema)
        : rootSchema(rootSchema) {}

    auto check(json const& instance, json const& schema) -> std::optional<SchemaViolation> {
        return this->walk(instance, schema, 0);
    }

private:
    json const& rootSchema;
    StatePath   path;

    auto fail(std::string message) const -> std::optional<SchemaViolation> {
        return SchemaViolation{this->path, std::move(message)};
    }

    auto resolveRef(std::string const& ref) const -> json const* {
        if (ref.empty() || ref.front() != '#')
            return nullptr;
        json const* node = &this->rootSchema;
        std::string_view pointer{ref};
        pointer.remove_prefix(1);
        while (!pointer.empty()) {
            if (pointer.front() != '/')
                return nullptr;
            pointer.remove_prefix(1);
            auto slash = pointer.find('/');
            auto token = unescapePointerToken(std::string{pointer.substr(0, slash)});
            if (node->is_object()) {
                auto it = node->find(token);
                if (it == node->end())
                    return nullptr;
                node = &*it;
            } else if (node->is_array()) {
                std::size_t index = 0;
                std::istringstream iss(token);
                if (!(iss >> index) || index >= node->size())
                    return nullptr;
                node = &(*node)[index];
            } else {
                return nullptr;
            }
            if (slash == std::string_view::npos)
                break;
            pointer.remove_prefix(slash);
        }
        return node;
    }

    // Runs `schema` against `instance` without leaking the path of a nested failure.
    auto passes(json const& instance, json const& schema, std::size_t depth) -> bool {
        auto saved  = this->path;
        auto result = this->walk(instance, schema, depth);
        this->path  = std::move(saved);
        return !result.has_value();
    }

    auto walkChild(json const& child, std::string segment, json const& schema, std::size_t depth)
        -> std::optional<SchemaViolation> {
        this->path.push_back(std::move(segment));
        auto result = this->walk(child, schema, depth);
        if (!result)
            this->path.pop_back();
        return result;
    }

    auto walk(json const& instance, json const& schema, std::size_t depth) -> std::optional<SchemaViolation> {
        if (schema.is_boolean()) {
            if (schema.get<bool>())
                return std::nullopt;
            return this->fail("False schema does not allow " + shortDump(instance));
        }
        if (!schema.is_object())
            return std::nullopt;

        if (auto it = schema.find("$ref"); it != schema.end() && it->is_string()) {
            if (depth >= MaxRefDepth)
                return this->fail("Schema reference depth exceeded at " + it->get<std::string>());
            auto const* target = this->resolveRef(it->get<std::string>());
            if (target == nullptr)
                return this->fail("Unresolvable schema reference " + it->get<std::string>());
            // draft-07: siblings of $ref are ignored.
            return this->walk(instance, *target, depth + 1);
        }

        if (auto v = this->checkType(instance, schema))
            return v;
        if (auto v = this->checkEnumConst(instance, schema))
            return v;
        if (auto v = this->checkCombinators(instance, schema, depth))
            return v;

        if (instance.is_object()) {
            if (auto v = this->checkObject(instance, schema, depth))
                return v;
        } else if (instance.is_array()) {
            if (auto v = this->checkArray(instance, schema, depth))
                return v;
        } else if (instance.is_string()) {
            if (auto v = this->checkString(instance, schema))
                return v;
        } else if (instance.is_number()) {
            if (auto v = this->checkNumber(instance, schema))
                return v;
        }
        return std::nullopt;
    }

    auto checkType(json const& instance, json const& schema) -> std::optional<SchemaViolation> {
        auto it = schema.find("type");
        if (it == schema.end())
            return std::nullopt;
        if (it->is_string()) {
            if (!matchesType(instance, it->get<std::string>()))
                return this->fail(shortDump(instance) + " is not of type '" + it->get<std::string>() + "'");
            return std::nullopt;
        }
        if (it->is_array()) {
            for (auto const& candidate : *it) {
                if (candidate.is_string() && matchesType(instance, candidate.get<std::string>()))
                    return std::nullopt;
            }
            return this->fail(shortDump(instance) + " is not of type " + shortDump(*it));
        }
        return std::nullopt;
    }

    auto checkEnumConst(json const& instance, json const& schema) -> std::optional<SchemaViolation> {
        if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
            bool found = false;
            for (auto const& candidate : *it) {
                if (candidate == instance) {
                    found = true;
                    break;
                }
            }
            if (!found)
                return this->fail(shortDump(instance) + " is not one of " + shortDump(*it));
        }
        if (auto it = schema.find("const"); it != schema.end()) {
            if (*it != instance)
                return this->fail(shortDump(*it) + " was expected");
        }
        return std::nullopt;
    }

    auto checkCombinators(json const& instance, json const& schema, std::size_t depth)
        -> std::optional<SchemaViolation> {
        if (auto it = schema.find("allOf"); it != schema.end() && it->is_array()) {
            for (auto const& sub : *it) {
                if (auto v = this->walk(instance, sub, depth))
                    return v;
            }
        }
        if (auto it = schema.find("anyOf"); it != schema.end() && it->is_array()) {
            bool any = false;
            for (auto const& sub : *it) {
                if (this->passes(instance, sub, depth)) {
                    any = true;
                    break;
                }
            }
            if (!any)
                return this->fail(shortDump(instance) + " is not valid under any of the given schemas");
        }
        if (auto it = schema.find("oneOf"); it != schema.end() && it->is_array()) {
            std::size_t matches = 0;
            for (auto const& sub : *it) {
                if (this->passes(instance, sub, depth))
                    ++matches;
            }
            if (matches == 0)
                return this->fail(shortDump(instance) + " is not valid under any of the given schemas");
            if (matches > 1)
                return this->fail(shortDump(instance) + " is valid under each of " + std::to_string(matches)
                                  + " schemas");
        }
        if (auto it = schema.find("not"); it != schema.end()) {
            if (this->passes(instance, *it, depth))
                return this->fail(shortDump(instance) + " should not be valid under " + shortDump(*it));
        }
        return std::nullopt;
    }

    auto checkObject(json const& instance, json const& schema, std::size_t depth)
        -> std::optional<SchemaViolation> {
        if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            for (auto const& name : *it) {
                if (name.is_string() && !instance.contains(name.get<std::string>()))
                    return this->fail("'" + name.get<std::string>() + "' is a required property");
            }
        }
        if (auto it = schema.find("minProperties"); it != schema.end() && isCount(*it)) {
            if (instance.size() < it->get<std::size_t>())
                return this->fail(shortDump(instance) + " does not have enough properties");
        }
        if (auto it = schema.find("maxProperties"); it != schema.end() && isCount(*it)) {
            if (instance.size() > it->get<std::size_t>())
                return this->fail(shortDump(instance) + " has too many properties");
        }

        json const* properties = nullptr;
        if (auto it = schema.find("properties"); it != schema.end() && it->is_object())
            properties = &*it;
        json const* patternProperties = nullptr;
        if (auto it = schema.find("patternProperties"); it != schema.end() && it->is_object())
            patternProperties = &*it;
        json const* additional = nullptr;
        if (auto it = schema.find("additionalProperties"); it != schema.end())
            additional = &*it;

        for (auto const& [key, value] : instance.items()) {
            bool matched = false;
            if (properties != nullptr) {
                if (auto prop = properties->find(key); prop != properties->end()) {
                    matched = true;
                    if (auto v = this->walkChild(value, key, *prop, depth))
                        return v;
                }
            }
            if (patternProperties != nullptr) {
                for (auto const& [pattern, sub] : patternProperties->items()) {
                    auto found = this->searchPattern(pattern, key);
                    if (!found)
                        return this->fail("Invalid pattern '" + pattern + "' in schema");
                    if (!*found)
                        continue;
                    matched = true;
                    if (auto v = this->walkChild(value, key, sub, depth))
                        return v;
                }
            }
            if (!matched && additional != nullptr) {
                if (additional->is_boolean() && !additional->get<bool>())
                    return this->fail("Additional properties are not allowed ('" + key + "' was unexpected)");
                if (additional->is_object()) {
                    if (auto v = this->walkChild(value, key, *additional, depth))
                        return v;
                }
            }
        }
        return std::nullopt;
    }

    auto checkArray(json const& instance, json const& schema, std::size_t depth)
        -> std::optional<SchemaViolation> {
        if (auto it = schema.find("minItems"); it != schema.end() && isCount(*it)) {
            if (instance.size() < it->get<std::size_t>())
                return this->fail(shortDump(instance) + " is too short");
        }
        if (auto it = schema.find("maxItems"); it != schema.end() && isCount(*it)) {
            if (instance.size() > it->get<std::size_t>())
                return this->fail(shortDump(instance) + " is too long");
        }
        if (auto it = schema.find("uniqueItems"); it != schema.end() && it->is_boolean() && it->get<bool>()) {
            for (std::size_t i = 0; i < instance.size(); ++i) {
                for (std::size_t j = i + 1; j < instance.size(); ++j) {
                    if (instance[i] == instance[j])
                        return this->fail(shortDump(instance) + " has non-unique elements");
                }
            }
        }
        if (auto it = schema.find("items"); it != schema.end()) {
            if (it->is_array()) {
                auto const count = std::min(it->size(), instance.size());
                for (std::size_t i = 0; i < count; ++i) {
                    if (auto v = this->walkChild(instance[i], std::to_string(i), (*it)[i], depth))
                        return v;
                }
                if (auto extra = schema.find("additionalItems"); extra != schema.end()) {
                    for (std::size_t i = count; i < instance.size(); ++i) {
                        if (auto v = this->walkChild(instance[i], std::to_string(i), *extra, depth))
                            return v;
                    }
                }
            } else {
                for (std::size_t i = 0; i < instance.size(); ++i) {
                    if (auto v = this->walkChild(instance[i], std::to_string(i), *it, depth))
                        return v;
                }
            }
        }
        return std::nullopt;
    }

    auto checkString(json const& instance, json const& schema) -> std::optional<SchemaViolation> {
        auto const& text = instance.get_ref<std::string const&>();
        if (auto it = schema.find("minLength"); it != schema.end() && isCount(*it)) {
            if (utf8Length(text) < it->get<std::size_t>())
                return this->fail(shortDump(instance) + " is too short");
        }
        if (auto it = schema.find("maxLength"); it != schema.end() && isCount(*it)) {
            if (utf8Length(text) > it->get<std::size_t>())
                return this->fail(shortDump(instance) + " is too long");
        }
        if (auto it = schema.find("pattern"); it != schema.end() && it->is_string()) {
            auto found = this->searchPattern(it->get<std::string>(), text);
            if (!found)
                return this->fail("Invalid pattern '" + it->get<std::string>() + "' in schema");
            if (!*found)
                return this->fail(shortDump(instance) + " does not match '" + it->get<std::string>() + "'");
        }
        return std::nullopt;
    }

    auto checkNumber(json const& instance, json const& schema) -> std::optional<SchemaViolation> {
        auto const value = instance.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() && it->is_number()) {
            if (value < it->get<double>())
                return this->fail(shortDump(instance) + " is less than the minimum of " + it->dump());
        }
        if (auto it = schema.find("maximum"); it != schema.end() && it->is_number()) {
            if (value > it->get<double>())
                return this->fail(shortDump(instance) + " is greater than the maximum of " + it->dump());
        }
        if (auto it = schema.find("exclusiveMinimum"); it != schema.end() && it->is_number()) {
            if (value <= it->get<double>())
                return this->fail(shortDump(instance) + " is less than or equal to the minimum of " + it->dump());
        }
        if (auto it = schema.find("exclusiveMaximum"); it != schema.end() && it->is_number()) {
            if (value >= it->get<double>())
                return this->fail(shortDump(instance) + " is greater than or equal to the maximum of "
                                  + it->dump());
        }
        if (auto it = schema.find("multipleOf"); it != schema.end() && it->is_number()) {
            auto const divisor = it->get<double>();
            if (divisor > 0.0) {
                auto const quotient = value / divisor;
                if (std::fabs(quotient - std::round(quotient)) > 1e-9)
                    return this->fail(shortDump(instance) + " is not a multiple of " + it->dump());
            }
        }
        return std::nullopt;
    }

    // nullopt when the pattern itself does not compile.
    auto searchPattern(std::string const& pattern, std::string const& text) -> std::optional<bool> {
        try {
            std::regex re(pattern, std::regex::ECMAScript);
            return std::regex_search(text, re);
        } catch (std::regex_error const& e) {
            sts_log("Invalid schema pattern " + pattern + ": " + e.what(), "Schema", "Error");
            return std::nullopt;
        }
    }
};

} // namespace

SchemaValidator::SchemaValidator(json schema)
    : root(std::move(schema)) {}

auto SchemaValidator::validate(json const& instance) const -> std::optional<SchemaViolation> {
    Walker walker{this->root};
    return walker.check(instance, this->root);
}

auto validateInstance(json const& schema, json const& instance) -> std::optional<SchemaViolation> {
    Walker walker{schema};
    return walker.check(instance, schema);
}

auto violationToError(SchemaViolation const& violation) -> Error {
    return Error{Error::Code::SchemaValidation,
                 "Schema validation failed - /" + formatStatePath(violation.instancePath) + ": " + violation.message};
}

} // namespace STS::Schema
