#pragma once
#include "path/PathData.hpp"
#include "type/Style.hpp"
#include "type/TransformList.hpp"

#include <string>
#include <variant>

namespace SD {

/**
 * Value held by an attribute: null (skipped on write), the raw text read from
 * markup, or an object coerced from that text on demand.
 */
using AttributeValue = std::variant<std::monostate, std::string, Style, TransformList, PathData>;

[[nodiscard]] auto isNull(AttributeValue const& value) noexcept -> bool;

// Generic text form used when writing markup.
[[nodiscard]] auto attributeText(AttributeValue const& value) -> std::string;

} // namespace SD
