#pragma once
#include "core/Error.hpp"
#include "element/AttributeStore.hpp"
#include "markup/MarkupDocument.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SD {

/**
 * A node of the vector-graphics object tree: a markup name, its attributes
 * and its owned children.
 *
 * Markup I/O:
 * - readMarkup stores every attribute of a markup node as raw text under its
 *   qualified name, except "style" and "transform", which are parsed on read.
 * - writeMarkup creates a markup element named after this element, writes the
 *   non-null attributes in insertion order ("xlink:" names go to the xlink
 *   namespace), writes the children in order beneath it and appends it to the
 *   given parent, or makes it the document root.
 */
class Element {
public:
    explicit Element(std::string name);
    Element(std::string name, std::string_view id);

    Element(Element const&)            = delete;
    Element& operator=(Element const&) = delete;
    Element(Element&&) noexcept            = default;
    Element& operator=(Element&&) noexcept = default;

    static auto fromMarkup(MarkupNode const& node) -> Expected<Element>;

    auto name() const noexcept -> std::string const& { return name_; }
    auto attributes() noexcept -> AttributeStore& { return attributes_; }
    auto attributes() const noexcept -> AttributeStore const& { return attributes_; }

    auto setAttribute(std::string_view name, AttributeValue value) -> void;
    auto attribute(std::string_view name) const -> std::optional<std::string>;
    auto id() const -> std::optional<std::string> { return attribute("id"); }

    // Typed accessors return the stored value; an absent attribute yields (and stores) an empty value.
    auto style() -> AttributeRef<Style>;
    auto setStyle(Style style) -> void;
    auto transform() -> AttributeRef<TransformList>;
    auto setTransform(TransformList transform) -> void;
    auto path(std::string_view name = "d") -> AttributeRef<PathData>;
    auto setPath(PathData path, std::string_view name = "d") -> void;

    auto addChild(std::unique_ptr<Element> child) -> Element&;
    auto addChild(Element child) -> Element&;
    auto children() const noexcept -> std::vector<std::unique_ptr<Element>> const& { return children_; }
    auto childCount() const noexcept -> std::size_t { return children_.size(); }

    auto readMarkup(MarkupNode const& node) -> std::optional<Error>;
    auto writeMarkup(MarkupDocument& document, std::optional<MarkupNode> parent = std::nullopt) const -> std::optional<Error>;

private:
    std::string                           name_;
    AttributeStore                        attributes_;
    std::vector<std::unique_ptr<Element>> children_;
};

} // namespace SD
