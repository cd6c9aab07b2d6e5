#include "type/Style.hpp"

#include <algorithm>

namespace {

auto trim(std::string_view text) -> std::string_view {
    constexpr std::string_view whitespace = " \t\r\n";
    auto const                 first      = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

namespace SD {

auto Style::fromText(std::string_view text) -> Expected<Style> {
    Style       style;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto const next        = text.find(';', pos);
        auto const end         = next == std::string_view::npos ? text.size() : next;
        auto const declaration = trim(text.substr(pos, end - pos));

        if (!declaration.empty()) {
            auto const colon = declaration.find(':');
            if (colon == std::string_view::npos)
                return std::unexpected(Error{Error::Code::MalformedStyle,
                                             "declaration '" + std::string(declaration) + "' has no ':' in style \""
                                                     + std::string(text) + "\""});
            auto const name = trim(declaration.substr(0, colon));
            if (name.empty())
                return std::unexpected(Error{Error::Code::MalformedStyle,
                                             "declaration '" + std::string(declaration) + "' has no property name in style \""
                                                     + std::string(text) + "\""});
            style.set(name, trim(declaration.substr(colon + 1)));
        }

        if (next == std::string_view::npos)
            break;
        pos = next + 1;
    }
    return style;
}

auto Style::toString() const -> std::string {
    std::string result;
    for (auto const& [name, value] : declarations_) {
        if (!result.empty())
            result.push_back(';');
        result.append(name);
        result.push_back(':');
        result.append(value);
    }
    return result;
}

auto Style::get(std::string_view name) const -> std::optional<std::string> {
    auto it = std::ranges::find(declarations_, name, [](auto const& entry) -> std::string_view { return entry.first; });
    if (it == declarations_.end())
        return std::nullopt;
    return it->second;
}

auto Style::set(std::string_view name, std::string_view value) -> void {
    auto it = std::ranges::find(declarations_, name, [](auto const& entry) -> std::string_view { return entry.first; });
    if (it != declarations_.end()) {
        it->second.assign(value);
        return;
    }
    declarations_.emplace_back(std::string(name), std::string(value));
}

auto Style::erase(std::string_view name) -> bool {
    auto it = std::ranges::find(declarations_, name, [](auto const& entry) -> std::string_view { return entry.first; });
    if (it == declarations_.end())
        return false;
    declarations_.erase(it);
    return true;
}

} // namespace SD
