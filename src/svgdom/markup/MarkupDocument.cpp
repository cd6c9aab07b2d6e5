#include "markup/MarkupDocument.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <mutex>

#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlmemory.h>

namespace {

using SD::Error;

auto xmlText(std::string_view text) -> std::string {
    return std::string(text);
}

auto toXml(std::string const& text) -> xmlChar const* {
    return reinterpret_cast<xmlChar const*>(text.c_str());
}

auto fromXml(xmlChar const* text) -> std::string {
    if (text == nullptr)
        return {};
    return std::string(reinterpret_cast<char const*>(text));
}

// Takes ownership of a libxml2 allocated string.
auto takeXml(xmlChar* text) -> std::string {
    auto result = fromXml(text);
    if (text != nullptr)
        xmlFree(text);
    return result;
}

auto markupError(std::string message) -> Error {
    sd_log("Markup: " + message, "Markup", "ERROR");
    return Error{Error::Code::InvalidMarkup, std::move(message)};
}

auto lastParserMessage() -> std::string {
    auto const* error = xmlGetLastError();
    if (error == nullptr || error->message == nullptr)
        return "unknown parser error";
    std::string message(error->message);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();
    return message + " (line " + std::to_string(error->line) + ")";
}

// Points every reference to `from` in the subtree at `to`.
void retargetNamespace(xmlNodePtr node, xmlNsPtr from, xmlNsPtr to) {
    if (node->ns == from)
        node->ns = to;
    for (xmlAttrPtr attr = node->properties; attr != nullptr; attr = attr->next)
        if (attr->ns == from)
            attr->ns = to;
    for (xmlNodePtr child = node->children; child != nullptr; child = child->next)
        if (child->type == XML_ELEMENT_NODE)
            retargetNamespace(child, from, to);
}

// Drops declarations in the subtree that repeat a prefix and URI already in
// scope at the declaring element's parent.
void removeRedundantNamespaces(xmlDocPtr doc, xmlNodePtr node) {
    xmlNodePtr parent = node->parent;
    if (parent == nullptr || parent->type != XML_ELEMENT_NODE)
        return;

    xmlNsPtr* link = &node->nsDef;
    while (*link != nullptr) {
        xmlNsPtr ns      = *link;
        xmlNsPtr inScope = xmlSearchNs(doc, parent, ns->prefix);
        if (inScope == nullptr || !xmlStrEqual(inScope->href, ns->href)) {
            link = &ns->next;
            continue;
        }
        retargetNamespace(node, ns, inScope);
        *link    = ns->next;
        ns->next = nullptr;
        xmlFreeNs(ns);
    }

    for (xmlNodePtr child = node->children; child != nullptr; child = child->next)
        if (child->type == XML_ELEMENT_NODE)
            removeRedundantNamespaces(doc, child);
}

void initializeParser() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

} // namespace

namespace SD {

/*
 * MarkupNode
 */

auto MarkupNode::name() const -> std::string {
    return fromXml(node_->name);
}

auto MarkupNode::namespaceUri() const -> std::string {
    if (node_->ns == nullptr)
        return {};
    return fromXml(node_->ns->href);
}

auto MarkupNode::attributes() const -> std::vector<MarkupAttribute> {
    std::vector<MarkupAttribute> result;
    for (xmlAttrPtr attr = node_->properties; attr != nullptr; attr = attr->next) {
        MarkupAttribute attribute;
        attribute.localName = fromXml(attr->name);
        if (attr->ns != nullptr) {
            attribute.namespaceUri = fromXml(attr->ns->href);
            if (attr->ns->prefix != nullptr)
                attribute.qualifiedName = fromXml(attr->ns->prefix) + ":" + attribute.localName;
        }
        if (attribute.qualifiedName.empty())
            attribute.qualifiedName = attribute.localName;
        attribute.value = takeXml(xmlNodeListGetString(node_->doc, attr->children, 1));
        result.push_back(std::move(attribute));
    }
    return result;
}

auto MarkupNode::attribute(std::string_view localName, std::string_view namespaceUri) const -> std::optional<std::string> {
    auto const name = xmlText(localName);
    xmlChar*   value = nullptr;
    if (namespaceUri.empty()) {
        value = xmlGetNoNsProp(node_, toXml(name));
    } else {
        auto const uri = xmlText(namespaceUri);
        value          = xmlGetNsProp(node_, toXml(name), toXml(uri));
    }
    if (value == nullptr)
        return std::nullopt;
    return takeXml(value);
}

auto MarkupNode::children() const -> std::vector<MarkupNode> {
    std::vector<MarkupNode> result;
    for (xmlNodePtr child = node_->children; child != nullptr; child = child->next)
        if (child->type == XML_ELEMENT_NODE)
            result.emplace_back(child);
    return result;
}

auto MarkupNode::parent() const -> std::optional<MarkupNode> {
    if (node_->parent == nullptr || node_->parent->type != XML_ELEMENT_NODE)
        return std::nullopt;
    return MarkupNode{node_->parent};
}

/*
 * MarkupDocument
 */

void MarkupDocument::DocDeleter::operator()(xmlDoc* doc) const noexcept {
    xmlFreeDoc(doc);
}

MarkupDocument::MarkupDocument(MarkupOptions options)
    : options_(std::move(options)) {
    initializeParser();
    doc_.reset(xmlNewDoc(reinterpret_cast<xmlChar const*>("1.0")));
}

MarkupDocument::MarkupDocument(xmlDoc* doc, MarkupOptions options)
    : doc_(doc), options_(std::move(options)) {}

MarkupDocument::~MarkupDocument() {
    this->release();
}

MarkupDocument::MarkupDocument(MarkupDocument&& other) noexcept
    : doc_(std::move(other.doc_)), detached_(std::move(other.detached_)), options_(std::move(other.options_)) {
    other.detached_.clear();
}

MarkupDocument& MarkupDocument::operator=(MarkupDocument&& other) noexcept {
    if (this == &other)
        return *this;
    this->release();
    doc_      = std::move(other.doc_);
    detached_ = std::move(other.detached_);
    options_  = std::move(other.options_);
    other.detached_.clear();
    return *this;
}

auto MarkupDocument::release() noexcept -> void {
    for (xmlNodePtr node : detached_)
        if (node->parent == nullptr)
            xmlFreeNode(node);
    detached_.clear();
    doc_.reset();
}

auto MarkupDocument::parse(std::string_view text, MarkupOptions options) -> Expected<MarkupDocument> {
    initializeParser();
    xmlResetLastError();
    xmlDoc* doc = xmlReadMemory(text.data(), static_cast<int>(text.size()), nullptr, nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (doc == nullptr)
        return std::unexpected(markupError("cannot parse markup: " + lastParserMessage()));

    if (xmlNodePtr root = xmlDocGetRootElement(doc); root != nullptr && root->ns != nullptr)
        options.namespaceUri = fromXml(root->ns->href);
    return MarkupDocument{doc, std::move(options)};
}

auto MarkupDocument::root() const -> std::optional<MarkupNode> {
    xmlNodePtr node = xmlDocGetRootElement(doc_.get());
    if (node == nullptr)
        return std::nullopt;
    return MarkupNode{node};
}

auto MarkupDocument::createElement(std::string_view name, std::string_view namespaceUri) -> Expected<MarkupNode> {
    if (name.empty())
        return std::unexpected(markupError("element name must not be empty"));

    auto const elementName = xmlText(name);
    xmlNodePtr node        = xmlNewDocNode(doc_.get(), nullptr, toXml(elementName), nullptr);
    if (node == nullptr)
        return std::unexpected(markupError("cannot create element '" + elementName + "'"));
    detached_.push_back(node);

    if (!namespaceUri.empty()) {
        auto const uri = xmlText(namespaceUri);
        xmlNsPtr   ns  = xmlNewNs(node, toXml(uri), nullptr);
        if (ns == nullptr)
            return std::unexpected(markupError("cannot declare namespace '" + uri + "' on '" + elementName + "'"));
        xmlSetNs(node, ns);
    }
    return MarkupNode{node};
}

auto MarkupDocument::namespaceFor(xmlNodePtr node, std::string_view namespaceUri) -> xmlNsPtr {
    auto const uri = xmlText(namespaceUri);
    if (xmlNsPtr existing = xmlSearchNsByHref(doc_.get(), node, toXml(uri)); existing != nullptr && existing->prefix != nullptr)
        return existing;

    std::string prefix = namespaceUri == kXLinkNamespace ? std::string(kXLinkPrefix) : std::string("ns");
    std::string candidate = prefix;
    for (int suffix = 1; xmlSearchNs(doc_.get(), node, toXml(candidate)) != nullptr; ++suffix)
        candidate = prefix + std::to_string(suffix);
    return xmlNewNs(node, toXml(uri), toXml(candidate));
}

auto MarkupDocument::setAttribute(MarkupNode node, std::string_view localName, std::string_view namespaceUri, std::string_view value)
        -> std::optional<Error> {
    auto const name = xmlText(localName);
    auto const text = xmlText(value);

    if (namespaceUri.empty() || namespaceUri == options_.namespaceUri) {
        if (xmlSetProp(node.native(), toXml(name), toXml(text)) == nullptr)
            return markupError("cannot set attribute '" + name + "'");
        return std::nullopt;
    }

    xmlNsPtr ns = this->namespaceFor(node.native(), namespaceUri);
    if (ns == nullptr)
        return markupError("cannot declare namespace '" + std::string(namespaceUri) + "'");
    if (xmlSetNsProp(node.native(), ns, toXml(name), toXml(text)) == nullptr)
        return markupError("cannot set attribute '" + name + "' in namespace '" + std::string(namespaceUri) + "'");
    return std::nullopt;
}

auto MarkupDocument::attach(xmlNodePtr node) -> std::optional<Error> {
    detached_.erase(std::remove(detached_.begin(), detached_.end(), node), detached_.end());
    removeRedundantNamespaces(doc_.get(), node);
    if (xmlDOMWrapReconcileNamespaces(nullptr, node, 0) < 0)
        return markupError("cannot reconcile namespaces of '" + fromXml(node->name) + "'");
    return std::nullopt;
}

auto MarkupDocument::appendChild(MarkupNode parent, MarkupNode child) -> std::optional<Error> {
    if (child.native()->parent != nullptr)
        return markupError("element '" + child.name() + "' already has a parent");
    if (xmlAddChild(parent.native(), child.native()) == nullptr)
        return markupError("cannot append '" + child.name() + "' to '" + parent.name() + "'");
    return this->attach(child.native());
}

auto MarkupDocument::appendRoot(MarkupNode node) -> std::optional<Error> {
    if (xmlDocGetRootElement(doc_.get()) != nullptr)
        return markupError("document already has a root element");
    if (node.native()->parent != nullptr)
        return markupError("element '" + node.name() + "' already has a parent");
    xmlDocSetRootElement(doc_.get(), node.native());
    return this->attach(node.native());
}

auto MarkupDocument::toString() const -> Expected<std::string> {
    xmlChar* buffer = nullptr;
    int      size   = 0;
    xmlDocDumpFormatMemoryEnc(doc_.get(), &buffer, &size, options_.encoding.c_str(), options_.formatOutput ? 1 : 0);
    if (buffer == nullptr)
        return std::unexpected(markupError("cannot serialize document"));
    std::string result(reinterpret_cast<char const*>(buffer), static_cast<std::size_t>(size));
    xmlFree(buffer);
    return result;
}

} // namespace SD
