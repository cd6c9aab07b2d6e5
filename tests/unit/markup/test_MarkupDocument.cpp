#include <doctest/doctest.h>

#include "markup/MarkupDocument.hpp"

#include <string>

using namespace SD;

namespace {

auto countOf(std::string const& text, std::string const& needle) -> std::size_t {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
        ++count;
    return count;
}

} // namespace

TEST_SUITE("markup.document") {

TEST_CASE("parse") {
    SUBCASE("well formed markup exposes the root") {
        auto document = MarkupDocument::parse(R"(<svg xmlns="http://www.w3.org/2000/svg"><rect x="1"/><g/></svg>)");
        REQUIRE(document.has_value());
        CHECK(document->namespaceUri() == kSvgNamespace);

        auto root = document->root();
        REQUIRE(root.has_value());
        CHECK(root->name() == "svg");
        CHECK_FALSE(root->parent().has_value());

        auto children = root->children();
        REQUIRE(children.size() == 2);
        CHECK(children[0].name() == "rect");
        CHECK(children[0].attribute("x") == "1");
        CHECK_FALSE(children[0].attribute("y").has_value());
        CHECK(children[1].name() == "g");
    }

    SUBCASE("documents without a namespace keep the configured one") {
        auto document = MarkupDocument::parse("<svg/>");
        REQUIRE(document.has_value());
        CHECK(document->namespaceUri() == kSvgNamespace);
        CHECK(document->root()->namespaceUri().empty());
    }

    SUBCASE("malformed markup is rejected") {
        auto document = MarkupDocument::parse("<svg><rect></svg>");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().code == Error::Code::InvalidMarkup);
        REQUIRE(document.error().message.has_value());
        CHECK(document.error().message->starts_with("cannot parse markup"));
    }
}

TEST_CASE("createElement") {
    MarkupDocument document;
    CHECK_FALSE(document.root().has_value());

    SUBCASE("an empty name is rejected") {
        auto node = document.createElement("", kSvgNamespace);
        REQUIRE_FALSE(node.has_value());
        CHECK(node.error().code == Error::Code::InvalidMarkup);
    }

    SUBCASE("created elements are detached until appended") {
        auto node = document.createElement("svg", kSvgNamespace);
        REQUIRE(node.has_value());
        CHECK(node->namespaceUri() == kSvgNamespace);
        CHECK_FALSE(node->parent().has_value());
        CHECK_FALSE(document.root().has_value());

        CHECK_FALSE(document.appendRoot(*node).has_value());
        REQUIRE(document.root().has_value());
        CHECK(*document.root() == *node);
    }

    SUBCASE("detached elements are released with the document") {
        auto node = document.createElement("orphan", kSvgNamespace);
        REQUIRE(node.has_value());
        CHECK_FALSE(document.setAttribute(*node, "x", {}, "1").has_value());
    }
}

TEST_CASE("namespaced attributes") {
    MarkupDocument document;
    auto           root = document.createElement("svg", kSvgNamespace);
    REQUIRE(root.has_value());
    REQUIRE_FALSE(document.appendRoot(*root).has_value());

    auto first  = document.createElement("use", kSvgNamespace);
    auto second = document.createElement("use", kSvgNamespace);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK_FALSE(document.setAttribute(*root, "href", kXLinkNamespace, "root.svg").has_value());
    CHECK_FALSE(document.setAttribute(*first, "href", kXLinkNamespace, "a.svg").has_value());
    CHECK_FALSE(document.setAttribute(*second, "href", kXLinkNamespace, "b.svg").has_value());
    CHECK_FALSE(document.setAttribute(*second, "width", kSvgNamespace, "4").has_value());
    CHECK_FALSE(document.appendChild(*root, *first).has_value());
    CHECK_FALSE(document.appendChild(*root, *second).has_value());

    auto attributes = second->attributes();
    REQUIRE(attributes.size() == 2);
    CHECK(attributes[0].qualifiedName == "xlink:href");
    CHECK(attributes[0].localName == "href");
    CHECK(attributes[0].namespaceUri == kXLinkNamespace);
    CHECK(attributes[1].qualifiedName == "width");
    CHECK(attributes[1].namespaceUri.empty());

    auto text = document.toString();
    REQUIRE(text.has_value());
    CHECK(countOf(*text, "xmlns:xlink=") == 1);
    CHECK(countOf(*text, "xmlns=\"http://www.w3.org/2000/svg\"") == 1);
    CHECK(text->find("xlink:href=\"a.svg\"") != std::string::npos);
    CHECK(text->find("xlink:href=\"b.svg\"") != std::string::npos);
}

TEST_CASE("subtrees built before attachment declare each namespace once") {
    MarkupDocument document;
    auto           root  = document.createElement("svg", kSvgNamespace);
    auto           group = document.createElement("g", kSvgNamespace);
    auto           use   = document.createElement("use", kSvgNamespace);
    REQUIRE(root.has_value());
    REQUIRE(group.has_value());
    REQUIRE(use.has_value());

    CHECK_FALSE(document.setAttribute(*root, "href", kXLinkNamespace, "#root").has_value());
    CHECK_FALSE(document.setAttribute(*use, "href", kXLinkNamespace, "#shape").has_value());
    REQUIRE_FALSE(document.appendChild(*group, *use).has_value());
    REQUIRE_FALSE(document.appendRoot(*root).has_value());
    REQUIRE_FALSE(document.appendChild(*root, *group).has_value());

    CHECK(group->namespaceUri() == kSvgNamespace);
    CHECK(use->namespaceUri() == kSvgNamespace);
    CHECK(use->attribute("href", kXLinkNamespace) == "#shape");

    auto text = document.toString();
    REQUIRE(text.has_value());
    CHECK(countOf(*text, "xmlns=") == 1);
    CHECK(countOf(*text, "xmlns:xlink=") == 1);
    CHECK(text->find("<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\"") != std::string::npos);
    CHECK(text->find("<use xlink:href=\"#shape\"/>") != std::string::npos);
}

TEST_CASE("foreign namespaces get a generated prefix") {
    MarkupDocument document;
    auto           root = document.createElement("svg", kSvgNamespace);
    REQUIRE(root.has_value());
    CHECK_FALSE(document.setAttribute(*root, "label", "http://example.com/ns", "x").has_value());
    REQUIRE_FALSE(document.appendRoot(*root).has_value());

    CHECK(root->attribute("label", "http://example.com/ns") == "x");
    auto attributes = root->attributes();
    REQUIRE(attributes.size() == 1);
    CHECK(attributes[0].qualifiedName == "ns:label");
}

TEST_CASE("attachment rules") {
    MarkupDocument document;
    auto           root  = document.createElement("svg", kSvgNamespace);
    auto           child = document.createElement("g", kSvgNamespace);
    REQUIRE(root.has_value());
    REQUIRE(child.has_value());
    REQUIRE_FALSE(document.appendRoot(*root).has_value());
    REQUIRE_FALSE(document.appendChild(*root, *child).has_value());

    SUBCASE("an attached element cannot be appended again") {
        auto error = document.appendChild(*root, *child);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidMarkup);
        CHECK(root->children().size() == 1);
    }

    SUBCASE("a document has one root") {
        auto other = document.createElement("svg", kSvgNamespace);
        REQUIRE(other.has_value());
        auto error = document.appendRoot(*other);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidMarkup);
    }

    REQUIRE(child->parent().has_value());
    CHECK(*child->parent() == *root);
}

TEST_CASE("toString honours the formatting option") {
    MarkupOptions options;
    options.formatOutput = false;
    MarkupDocument document{options};
    auto           root  = document.createElement("svg", kSvgNamespace);
    auto           child = document.createElement("g", kSvgNamespace);
    REQUIRE(root.has_value());
    REQUIRE(child.has_value());
    REQUIRE_FALSE(document.appendRoot(*root).has_value());
    REQUIRE_FALSE(document.appendChild(*root, *child).has_value());

    auto text = document.toString();
    REQUIRE(text.has_value());
    CHECK(text->starts_with("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"));
    CHECK(text->find("<svg xmlns=\"http://www.w3.org/2000/svg\"><g/></svg>") != std::string::npos);
}

} // TEST_SUITE
