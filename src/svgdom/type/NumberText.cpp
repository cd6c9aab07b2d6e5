#include "type/NumberText.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

namespace SD {

auto parseNumber(std::string_view token) -> std::optional<float> {
    // from_chars does not take a leading '+'
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && (token.front() == '+' || token.front() == '-'))
            return std::nullopt;
    }
    if (token.empty())
        return std::nullopt;

    float       value = 0.0f;
    auto const* begin = token.data();
    auto const* end   = begin + token.size();
    auto [ptr, ec]    = std::from_chars(begin, end, value, std::chars_format::general);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    if (!std::isfinite(value))
        return std::nullopt;
    return value;
}

auto formatNumber(float value) -> std::string {
    std::array<char, 32> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{})
        return "0";
    return std::string(buffer.data(), ptr);
}

} // namespace SD
