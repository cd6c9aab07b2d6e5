#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace SD {

/**
 * Locale independent number conversion shared by the attribute grammars.
 * parseNumber accepts an optional sign, a decimal point and an exponent;
 * the whole token must be consumed and the value must be finite.
 * formatNumber writes the shortest text that parses back to the same value.
 */
[[nodiscard]] auto parseNumber(std::string_view token) -> std::optional<float>;
[[nodiscard]] auto formatNumber(float value) -> std::string;

} // namespace SD
