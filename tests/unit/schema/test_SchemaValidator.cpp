#include "schema/SchemaValidator.hpp"

#include <doctest/doctest.h>

using namespace STS;
using namespace STS::Schema;

namespace {

auto violates(char const* schema, char const* instance) -> std::optional<SchemaViolation> {
    return validateInstance(json::parse(schema), json::parse(instance));
}

} // namespace

TEST_SUITE("SchemaValidator") {

TEST_CASE("type keyword accepts single names and lists") {
    CHECK_FALSE(violates(R"({"type": "string"})", R"("x")").has_value());
    CHECK(violates(R"({"type": "string"})", "1").has_value());
    CHECK_FALSE(violates(R"({"type": "integer"})", "3").has_value());
    CHECK(violates(R"({"type": "integer"})", "3.5").has_value());
    CHECK_FALSE(violates(R"({"type": "number"})", "3").has_value());
    CHECK_FALSE(violates(R"({"type": ["string", "null"]})", "null").has_value());
    CHECK(violates(R"({"type": ["string", "null"]})", "false").has_value());
}

TEST_CASE("required and additionalProperties report the offending key") {
    auto schema = R"({
        "type": "object",
        "properties": {"version": {"type": "string"}},
        "required": ["version"],
        "additionalProperties": false
    })";

    auto missing = violates(schema, "{}");
    REQUIRE(missing.has_value());
    CHECK(missing->message.find("'version' is a required property") != std::string::npos);

    auto extra = violates(schema, R"({"version": "1", "bogus": 1})");
    REQUIRE(extra.has_value());
    CHECK(extra->message.find("'bogus'") != std::string::npos);

    CHECK_FALSE(violates(schema, R"({"version": "1"})").has_value());
}

TEST_CASE("violation path points at the nested instance") {
    auto schema = R"({
        "type": "object",
        "properties": {
            "impressions": {
                "type": "object",
                "additionalProperties": {
                    "type": "object",
                    "properties": {"hidden": {"type": "boolean"}}
                }
            }
        }
    })";
    auto violation = violates(schema, R"({"impressions": {"abc": {"hidden": "yes"}}})");
    REQUIRE(violation.has_value());
    CHECK(violation->instancePath == StatePath{"impressions", "abc", "hidden"});

    auto error = violationToError(*violation);
    CHECK(error.code == Error::Code::SchemaValidation);
    REQUIRE(error.message.has_value());
    CHECK(error.message->starts_with("Schema validation failed - /impressions/abc/hidden: "));
}

TEST_CASE("string and number constraints") {
    CHECK(violates(R"({"minLength": 2})", R"("a")").has_value());
    CHECK(violates(R"({"maxLength": 2})", R"("abc")").has_value());
    CHECK_FALSE(violates(R"({"pattern": "^[0-9]+\\.[0-9]+\\.[0-9]+$"})", R"("0.2.0")").has_value());
    CHECK(violates(R"({"pattern": "^[0-9]+\\.[0-9]+\\.[0-9]+$"})", R"("v1")").has_value());

    CHECK(violates(R"({"minimum": 0})", "-1").has_value());
    CHECK_FALSE(violates(R"({"minimum": 0})", "0").has_value());
    CHECK(violates(R"({"exclusiveMinimum": 0})", "0").has_value());
    CHECK(violates(R"({"maximum": 1})", "1.5").has_value());
    CHECK(violates(R"({"exclusiveMaximum": 1})", "1").has_value());
    CHECK_FALSE(violates(R"({"multipleOf": 0.5})", "2.5").has_value());
    CHECK(violates(R"({"multipleOf": 2})", "3").has_value());
}

TEST_CASE("array constraints") {
    CHECK(violates(R"({"minItems": 1})", "[]").has_value());
    CHECK(violates(R"({"maxItems": 1})", "[1, 2]").has_value());
    CHECK(violates(R"({"uniqueItems": true})", "[1, 1]").has_value());
    CHECK_FALSE(violates(R"({"uniqueItems": true})", "[1, 2]").has_value());

    auto item = violates(R"({"items": {"type": "number"}})", R"([1, "two"])");
    REQUIRE(item.has_value());
    CHECK(item->instancePath == StatePath{"1"});

    CHECK(violates(R"({"items": [{"type": "string"}, {"type": "number"}]})", R"(["a", "b"])").has_value());
}

TEST_CASE("enum and const") {
    CHECK_FALSE(violates(R"({"enum": ["state", "asset-cache-update"]})", R"("state")").has_value());
    CHECK(violates(R"({"enum": ["state"]})", R"("other")").has_value());
    CHECK(violates(R"({"const": 3})", "4").has_value());
}

TEST_CASE("combinators") {
    auto anyOf = R"({"anyOf": [{"type": "string"}, {"type": "number"}]})";
    CHECK_FALSE(violates(anyOf, "1").has_value());
    CHECK(violates(anyOf, "true").has_value());

    auto oneOf = R"({"oneOf": [{"type": "integer"}, {"type": "number"}]})";
    CHECK(violates(oneOf, "1").has_value());
    CHECK_FALSE(violates(oneOf, "1.5").has_value());

    CHECK(violates(R"({"allOf": [{"type": "number"}, {"minimum": 5}]})", "3").has_value());

    auto negated = violates(R"({"not": {"type": "string"}})", R"("x")");
    REQUIRE(negated.has_value());
    CHECK(negated->message.find("should not be valid under") != std::string::npos);
}

TEST_CASE("local references resolve through definitions") {
    auto schema = R"({
        "definitions": {"Color": {"type": "array", "items": {"type": "number"}, "minItems": 3}},
        "type": "object",
        "properties": {"color": {"$ref": "#/definitions/Color"}}
    })";
    CHECK_FALSE(violates(schema, R"({"color": [1, 0, 0]})").has_value());
    CHECK(violates(schema, R"({"color": [1, 0]})").has_value());

    auto unresolved = violates(R"({"$ref": "#/definitions/Missing"})", "1");
    REQUIRE(unresolved.has_value());
    CHECK(unresolved->message.find("Unresolvable") != std::string::npos);
}

TEST_CASE("boolean schemas and unknown keywords") {
    CHECK_FALSE(violates("true", "1").has_value());
    CHECK(violates("false", "1").has_value());
    CHECK_FALSE(violates(R"({"x-unknown": 1})", "1").has_value());
}

TEST_CASE("validator object is reusable") {
    SchemaValidator validator{json::parse(R"({"type": "object", "required": ["version"]})")};
    CHECK_FALSE(validator.validate(json{{"version", "0.2.0"}}).has_value());
    CHECK(validator.validate(json::object()).has_value());
    CHECK(validator.schema().contains("required"));
}

} // TEST_SUITE
