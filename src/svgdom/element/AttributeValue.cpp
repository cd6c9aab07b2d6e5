#include "element/AttributeValue.hpp"

#include <type_traits>

namespace SD {

auto isNull(AttributeValue const& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

auto attributeText(AttributeValue const& value) -> std::string {
    return std::visit(
            [](auto const& held) -> std::string {
                using T = std::decay_t<decltype(held)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return {};
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return held;
                } else {
                    return held.toString();
                }
            },
            value);
}

} // namespace SD
