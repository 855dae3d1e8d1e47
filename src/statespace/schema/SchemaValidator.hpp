#pragma once
#include "core/Error.hpp"
#include "core/StatePath.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace STS::Schema {

using json = nlohmann::json;

struct SchemaViolation {
    StatePath   instancePath;
    std::string message;
};

/**
 * Validates JSON instances against a draft-07 style JSON Schema.
 *
 * Supported keywords: type, enum, const, properties, required,
 * additionalProperties, patternProperties, items (single schema or tuple),
 * minItems, maxItems, uniqueItems, minLength, maxLength, pattern, minimum,
 * maximum, exclusiveMinimum, exclusiveMaximum, multipleOf, minProperties,
 * maxProperties, allOf, anyOf, oneOf, not and local $ref pointers ("#",
 * "#/definitions/...", "#/$defs/..."). Unknown keywords are ignored. Only
 * the first violation found is reported.
 */
class SchemaValidator {
public:
    explicit SchemaValidator(json schema);

    [[nodiscard]] auto validate(json const& instance) const -> std::optional<SchemaViolation>;
    [[nodiscard]] auto schema() const -> json const& { return this->root; }

private:
    json root;
};

// One-shot helper for callers that do not keep a validator around.
[[nodiscard]] auto validateInstance(json const& schema, json const& instance) -> std::optional<SchemaViolation>;

// "Schema validation failed - <path>: <message>" as an Error.
[[nodiscard]] auto violationToError(SchemaViolation const& violation) -> Error;

} // namespace STS::Schema
