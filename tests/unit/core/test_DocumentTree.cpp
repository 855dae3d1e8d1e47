#include "core/DocumentTree.hpp"

#include <doctest/doctest.h>

using namespace STS;
using json = nlohmann::json;

TEST_SUITE("DocumentTree") {

TEST_CASE("parseIndex accepts plain decimal only") {
    CHECK(Tree::parseIndex("0") == std::optional<std::size_t>{0});
    CHECK(Tree::parseIndex("12") == std::optional<std::size_t>{12});
    CHECK_FALSE(Tree::parseIndex("").has_value());
    CHECK_FALSE(Tree::parseIndex("01").has_value());
    CHECK_FALSE(Tree::parseIndex("-1").has_value());
    CHECK_FALSE(Tree::parseIndex("1a").has_value());
}

TEST_CASE("find walks mappings and sequences") {
    auto doc = json::parse(R"({"a": {"b": [10, {"c": true}]}})");

    auto const* node = Tree::find(doc, StatePath{"a", "b", "1", "c"});
    REQUIRE(node != nullptr);
    CHECK(*node == true);

    CHECK(Tree::find(doc, StatePath{}) == &doc);
    CHECK(Tree::find(doc, StatePath{"a", "missing"}) == nullptr);
    CHECK(Tree::find(doc, StatePath{"a", "b", "2"}) == nullptr);
    CHECK(Tree::find(doc, StatePath{"a", "b", "0", "deeper"}) == nullptr);
}

TEST_CASE("assign creates intermediate mappings") {
    json doc = json::object();
    REQUIRE(Tree::assign(doc, StatePath{"widgets", "a", "color"}, "red").has_value());
    CHECK(doc == json::parse(R"({"widgets": {"a": {"color": "red"}}})"));
}

TEST_CASE("assign on the root replaces the document") {
    json doc = json::parse(R"({"old": 1})");
    REQUIRE(Tree::assign(doc, StatePath{}, json{{"new", 2}}).has_value());
    CHECK(doc == json{{"new", 2}});
}

TEST_CASE("assign into sequences replaces or appends") {
    auto doc = json::parse(R"({"items": [1, 2]})");
    REQUIRE(Tree::assign(doc, StatePath{"items", "0"}, 5).has_value());
    REQUIRE(Tree::assign(doc, StatePath{"items", "2"}, 7).has_value());
    CHECK(doc["items"] == json::array({5, 2, 7}));

    auto gap = Tree::assign(doc, StatePath{"items", "9"}, 0);
    REQUIRE_FALSE(gap.has_value());
    CHECK(gap.error().code == Error::Code::InvalidPath);
}

TEST_CASE("assign through a scalar fails without side effects") {
    auto doc    = json::parse(R"({"name": "x"})");
    auto before = doc;

    auto result = Tree::assign(doc, StatePath{"name", "inner", "deep"}, 1);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::InvalidPath);
    REQUIRE(result.error().message.has_value());
    CHECK(result.error().message->find("/name") != std::string::npos);
    CHECK(doc == before);
}

TEST_CASE("assign leaves no partial mappings when a later step fails") {
    auto doc    = json::parse(R"({"a": {"list": [1]}})");
    auto before = doc;
    CHECK_FALSE(Tree::assign(doc, StatePath{"a", "list", "x", "y"}, 1).has_value());
    CHECK(doc == before);
}

TEST_CASE("erase removes keys and sequence elements") {
    auto doc = json::parse(R"({"a": {"b": 1, "c": 2}, "list": [1, 2, 3]})");
    CHECK(Tree::erase(doc, StatePath{"a", "b"}));
    CHECK(Tree::erase(doc, StatePath{"list", "1"}));
    CHECK(doc == json::parse(R"({"a": {"c": 2}, "list": [1, 3]})"));

    CHECK_FALSE(Tree::erase(doc, StatePath{"a", "missing"}));
    CHECK_FALSE(Tree::erase(doc, StatePath{"nothing", "here"}));
    CHECK_FALSE(Tree::erase(doc, StatePath{}));
}

TEST_CASE("eraseKeyEverywhere reaches every depth") {
    auto doc = json::parse(R"({
        "tag": 1,
        "a": {"tag": 2, "b": {"tag": 3, "keep": true}},
        "list": [{"tag": 4}, {"other": 5}]
    })");
    CHECK(Tree::eraseKeyEverywhere(doc, "tag") == 4);
    CHECK(doc == json::parse(R"({"a": {"b": {"keep": true}}, "list": [{}, {"other": 5}]})"));
    CHECK(Tree::eraseKeyEverywhere(doc, "tag") == 0);
}

TEST_CASE("collect visits nodes in pre-order") {
    auto doc = json::parse(R"({"a": [{"id": 1}, {"id": 2}], "b": {"id": 3}})");
    auto found = Tree::collect(doc, [](json const& node) { return node.is_object() && node.contains("id"); });
    REQUIRE(found.size() == 3);
    CHECK((*found[0])["id"] == 1);
    CHECK((*found[1])["id"] == 2);
    CHECK((*found[2])["id"] == 3);
}

} // TEST_SUITE
