#pragma once
#include "core/Error.hpp"
#include "markup/Namespaces.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libxml/tree.h>

namespace SD {

struct MarkupOptions {
    std::string namespaceUri = std::string(kSvgNamespace); // namespace of created elements
    bool        formatOutput = true;
    std::string encoding     = "UTF-8";
};

struct MarkupAttribute {
    std::string qualifiedName; // "xlink:href"
    std::string localName;     // "href"
    std::string namespaceUri;  // empty for unqualified attributes
    std::string value;
};

/**
 * Non-owning handle to an element of a MarkupDocument. Valid as long as the
 * owning document is alive.
 */
class MarkupNode {
public:
    explicit MarkupNode(xmlNodePtr node) noexcept
        : node_(node) {}

    auto name() const -> std::string;
    auto namespaceUri() const -> std::string;
    auto attributes() const -> std::vector<MarkupAttribute>;
    auto attribute(std::string_view localName, std::string_view namespaceUri = {}) const -> std::optional<std::string>;
    auto children() const -> std::vector<MarkupNode>;
    auto parent() const -> std::optional<MarkupNode>;
    auto native() const noexcept -> xmlNodePtr { return node_; }

    bool operator==(MarkupNode const& other) const = default;

private:
    xmlNodePtr node_;
};

/**
 * Owning wrapper around a libxml2 document.
 *
 * Elements are created detached and become part of the tree through
 * appendChild or appendRoot. Detached elements still owned by the document
 * are released with it. Namespace declarations are reconciled whenever a
 * subtree is attached so each namespace is declared once along a branch.
 */
class MarkupDocument {
public:
    explicit MarkupDocument(MarkupOptions options = MarkupOptions{});
    ~MarkupDocument();

    MarkupDocument(MarkupDocument const&)            = delete;
    MarkupDocument& operator=(MarkupDocument const&) = delete;
    MarkupDocument(MarkupDocument&& other) noexcept;
    MarkupDocument& operator=(MarkupDocument&& other) noexcept;

    static auto parse(std::string_view text, MarkupOptions options = MarkupOptions{}) -> Expected<MarkupDocument>;

    auto namespaceUri() const noexcept -> std::string const& { return options_.namespaceUri; }
    auto root() const -> std::optional<MarkupNode>;

    auto createElement(std::string_view name, std::string_view namespaceUri) -> Expected<MarkupNode>;

    // An empty namespace, or the document namespace, sets an unqualified attribute.
    auto setAttribute(MarkupNode node, std::string_view localName, std::string_view namespaceUri, std::string_view value)
            -> std::optional<Error>;

    auto appendChild(MarkupNode parent, MarkupNode child) -> std::optional<Error>;
    auto appendRoot(MarkupNode node) -> std::optional<Error>;

    auto toString() const -> Expected<std::string>;

private:
    struct DocDeleter {
        void operator()(xmlDoc* doc) const noexcept;
    };

    MarkupDocument(xmlDoc* doc, MarkupOptions options);

    auto release() noexcept -> void;
    auto attach(xmlNodePtr node) -> std::optional<Error>;
    auto namespaceFor(xmlNodePtr node, std::string_view namespaceUri) -> xmlNsPtr;

    std::unique_ptr<xmlDoc, DocDeleter> doc_;
    std::vector<xmlNodePtr>             detached_;
    MarkupOptions                       options_;
};

} // namespace SD
