#pragma once
#include <string_view>
#include <vector>

namespace SD {

// Separators between path tokens: space, tab, CR, LF and comma.
[[nodiscard]] constexpr auto isPathSeparator(char c) noexcept -> bool {
    return c == ' ' || c == ',' || c == '\t' || c == '\r' || c == '\n';
}

/**
 * Splits path data on separators. Runs of separators produce no empty
 * tokens. Numbers packed without a separator ("10-20") stay in one token.
 */
[[nodiscard]] auto tokenizePathData(std::string_view text) -> std::vector<std::string_view>;

} // namespace SD
