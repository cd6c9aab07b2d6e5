#include <doctest/doctest.h>

#include "element/AttributeStore.hpp"

#include <string>
#include <vector>

using namespace SD;

TEST_SUITE("element.attribute_store") {

TEST_CASE("names keep insertion order") {
    AttributeStore store;
    store.set("id", "a");
    store.set("x", "1");
    store.set("xlink:href", "#b");
    CHECK(store.names() == std::vector<std::string>{"id", "x", "xlink:href"});

    store.set("id", "c");
    CHECK(store.names() == std::vector<std::string>{"id", "x", "xlink:href"});
    CHECK(store.text("id") == "c");
    CHECK(store.size() == 3);
}

TEST_CASE("erase drops the name and keeps lookups valid") {
    AttributeStore store;
    store.set("a", "1");
    store.set("b", "2");
    store.set("c", "3");
    CHECK(store.erase("a"));
    CHECK_FALSE(store.erase("a"));
    CHECK_FALSE(store.contains("a"));
    CHECK(store.text("b") == "2");
    CHECK(store.text("c") == "3");

    store.set("a", "4");
    CHECK(store.names() == std::vector<std::string>{"b", "c", "a"});
    CHECK(store.text("a") == "4");
}

TEST_CASE("null values have no text") {
    AttributeStore store;
    store.set("opacity", std::monostate{});
    CHECK(store.contains("opacity"));
    CHECK_FALSE(store.text("opacity").has_value());
    CHECK_FALSE(store.text("missing").has_value());
    CHECK(store.get("missing") == nullptr);
}

TEST_CASE("getTyped materializes a default for a missing name") {
    AttributeStore store;
    bool coerced = false;
    auto style   = store.getTyped<Style>("style", [&](std::string_view text) {
        coerced = true;
        return Style::fromText(text);
    });
    REQUIRE(style.has_value());
    CHECK(style->get().empty());
    CHECK_FALSE(coerced);

    auto const* stored = store.get("style");
    REQUIRE(stored != nullptr);
    CHECK(std::holds_alternative<Style>(*stored));
}

TEST_CASE("getTyped materializes a default over a null value") {
    AttributeStore store;
    store.set("transform", std::monostate{});
    auto transform = store.getTyped<TransformList>("transform", &TransformList::fromText);
    REQUIRE(transform.has_value());
    CHECK(transform->get().empty());
    CHECK(std::holds_alternative<TransformList>(*store.get("transform")));
}

TEST_CASE("getTyped coerces raw text once and caches the result") {
    AttributeStore store;
    store.set("d", "M 0 0 10 10");

    int  calls = 0;
    auto parse = [&](std::string_view text) {
        ++calls;
        return PathData::parse(text);
    };

    auto first = store.getTyped<PathData>("d", parse);
    REQUIRE(first.has_value());
    CHECK(first->get().size() == 2);
    CHECK(std::holds_alternative<PathData>(*store.get("d")));

    auto second = store.getTyped<PathData>("d", parse);
    REQUIRE(second.has_value());
    CHECK(&second->get() == &first->get());
    CHECK(calls == 1);
    CHECK(store.text("d") == "M 0 0 10 10 ");
}

TEST_CASE("getTyped returns coercion errors unchanged") {
    AttributeStore store;
    store.set("style", "fill red");
    auto style = store.getTyped<Style>("style", &Style::fromText);
    REQUIRE_FALSE(style.has_value());
    CHECK(style.error().code == Error::Code::MalformedStyle);
    CHECK(style.error().message == Style::fromText("fill red").error().message);

    auto const* stored = store.get("style");
    REQUIRE(stored != nullptr);
    CHECK(std::get<std::string>(*stored) == "fill red");
}

TEST_CASE("getTyped returns the stored object") {
    AttributeStore store;
    store.set("style", "fill:red");

    auto style = store.getTyped<Style>("style", &Style::fromText);
    REQUIRE(style.has_value());
    style->get().set("stroke", "blue");
    CHECK(store.text("style") == "fill:red;stroke:blue");

    auto again = store.getTyped<Style>("style", &Style::fromText);
    REQUIRE(again.has_value());
    CHECK(again->get().get("stroke") == "blue");

    auto created = store.getTyped<TransformList>("transform", &TransformList::fromText);
    REQUIRE(created.has_value());
    CHECK_FALSE(created->get().append(Transform{TransformKind::Rotate, {45.0f}}).has_value());
    CHECK(store.text("transform") == "rotate(45)");
}

TEST_CASE("typed values keep their position in the order") {
    AttributeStore store;
    store.set("id", "p");
    store.set("d", "M 1 1");
    store.set("fill", "red");
    REQUIRE(store.getTyped<PathData>("d", &PathData::parse).has_value());
    CHECK(store.names() == std::vector<std::string>{"id", "d", "fill"});
}

} // TEST_SUITE
