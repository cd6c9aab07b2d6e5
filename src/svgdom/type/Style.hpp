#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace SD {

/**
 * Inline style declarations ("fill:red;stroke:blue"). Declaration order is
 * kept; setting an existing property replaces its value in place.
 */
class Style {
public:
    Style() = default;

    static auto fromText(std::string_view text) -> Expected<Style>;

    // Canonical form: name:value pairs joined by ';'.
    auto toString() const -> std::string;

    auto get(std::string_view name) const -> std::optional<std::string>;
    auto set(std::string_view name, std::string_view value) -> void;
    auto erase(std::string_view name) -> bool;

    auto size() const noexcept -> std::size_t { return declarations_.size(); }
    auto empty() const noexcept -> bool { return declarations_.empty(); }
    auto declarations() const noexcept -> std::vector<std::pair<std::string, std::string>> const& { return declarations_; }

    bool operator==(Style const& other) const = default;

private:
    std::vector<std::pair<std::string, std::string>> declarations_;
};

} // namespace SD
