#include "element/Element.hpp"

#include "log/TaggedLogger.hpp"

namespace {

using SD::AttributeValue;
using SD::Error;
using SD::MarkupDocument;
using SD::MarkupNode;

constexpr std::string_view kStyleAttribute     = "style";
constexpr std::string_view kTransformAttribute = "transform";
constexpr std::string_view kXLinkQualifier     = "xlink:";

auto writeStyle(MarkupDocument& document, MarkupNode node, AttributeValue const& value) -> std::optional<Error> {
    if (auto const* style = std::get_if<SD::Style>(&value))
        return document.setAttribute(node, kStyleAttribute, document.namespaceUri(), style->toString());
    return document.setAttribute(node, kStyleAttribute, document.namespaceUri(), SD::attributeText(value));
}

auto writeTransform(MarkupDocument& document, MarkupNode node, AttributeValue const& value) -> std::optional<Error> {
    return document.setAttribute(node, kTransformAttribute, document.namespaceUri(), SD::attributeText(value));
}

} // namespace

namespace SD {

Element::Element(std::string name)
    : name_(std::move(name)) {}

Element::Element(std::string name, std::string_view id)
    : name_(std::move(name)) {
    attributes_.set("id", std::string(id));
}

auto Element::fromMarkup(MarkupNode const& node) -> Expected<Element> {
    Element element{node.name()};
    if (auto error = element.readMarkup(node))
        return std::unexpected(*error);
    return element;
}

auto Element::setAttribute(std::string_view name, AttributeValue value) -> void {
    attributes_.set(name, std::move(value));
}

auto Element::attribute(std::string_view name) const -> std::optional<std::string> {
    return attributes_.text(name);
}

auto Element::style() -> AttributeRef<Style> {
    return attributes_.getTyped<Style>(kStyleAttribute, &Style::fromText);
}

auto Element::setStyle(Style style) -> void {
    attributes_.set(kStyleAttribute, std::move(style));
}

auto Element::transform() -> AttributeRef<TransformList> {
    return attributes_.getTyped<TransformList>(kTransformAttribute, &TransformList::fromText);
}

auto Element::setTransform(TransformList transform) -> void {
    attributes_.set(kTransformAttribute, std::move(transform));
}

auto Element::path(std::string_view name) -> AttributeRef<PathData> {
    return attributes_.getTyped<PathData>(name, &PathData::parse);
}

auto Element::setPath(PathData path, std::string_view name) -> void {
    attributes_.set(name, std::move(path));
}

auto Element::addChild(std::unique_ptr<Element> child) -> Element& {
    children_.push_back(std::move(child));
    return *children_.back();
}

auto Element::addChild(Element child) -> Element& {
    return this->addChild(std::make_unique<Element>(std::move(child)));
}

auto Element::readMarkup(MarkupNode const& node) -> std::optional<Error> {
    for (auto const& attribute : node.attributes()) {
        if (attribute.qualifiedName == kStyleAttribute) {
            auto style = Style::fromText(attribute.value);
            if (!style)
                return style.error();
            this->setStyle(std::move(*style));
        } else if (attribute.qualifiedName == kTransformAttribute) {
            auto transform = TransformList::fromText(attribute.value);
            if (!transform)
                return transform.error();
            this->setTransform(std::move(*transform));
        } else {
            attributes_.set(attribute.qualifiedName, attribute.value);
        }
    }
    return std::nullopt;
}

auto Element::writeMarkup(MarkupDocument& document, std::optional<MarkupNode> parent) const -> std::optional<Error> {
    auto created = document.createElement(name_, document.namespaceUri());
    if (!created)
        return created.error();
    MarkupNode const node = *created;

    for (auto const& attributeName : attributes_.names()) {
        auto const* value = attributes_.get(attributeName);
        if (value == nullptr || isNull(*value))
            continue;

        std::optional<Error> error;
        std::string_view const name{attributeName};
        if (name == kStyleAttribute) {
            error = writeStyle(document, node, *value);
        } else if (name == kTransformAttribute) {
            error = writeTransform(document, node, *value);
        } else if (name.starts_with(kXLinkQualifier)) {
            error = document.setAttribute(node, name.substr(kXLinkQualifier.size()), kXLinkNamespace, attributeText(*value));
        } else {
            error = document.setAttribute(node, name, document.namespaceUri(), attributeText(*value));
        }
        if (error) {
            sd_log("Element::writeMarkup <" + name_ + "> attribute '" + attributeName + "' failed", "Element", "ERROR");
            return error;
        }
    }

    for (auto const& child : children_)
        if (auto error = child->writeMarkup(document, node))
            return error;

    if (parent)
        return document.appendChild(*parent, node);
    return document.appendRoot(node);
}

} // namespace SD
