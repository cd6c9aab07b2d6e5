#pragma once
#include "core/Error.hpp"
#include "path/PathSegment.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace SD {

/**
 * Parsed path data: the ordered segments of a "d" attribute.
 *
 * Text form:
 * - Command letters M Z L H V C S Q T A, uppercase absolute and lowercase relative.
 * - Operands and commands are separated by single runs of space, tab, CR, LF or comma.
 * - Coordinate pairs following a moveto without a new letter are linetos.
 *
 * toString() writes the canonical form: consecutive segments of the same command
 * share one letter, and every letter and operand is followed by one space.
 */
class PathData {
public:
    using const_iterator = std::vector<PathSegment>::const_iterator;

    PathData() = default;
    explicit PathData(std::vector<PathSegment> segments);

    static auto parse(std::string_view text) -> Expected<PathData>;

    auto toString() const -> std::string;

    // Copies by writing the canonical text and parsing it again.
    auto clone() const -> Expected<PathData>;

    auto size() const noexcept -> std::size_t { return segments_.size(); }
    auto empty() const noexcept -> bool { return segments_.empty(); }
    auto segments() const noexcept -> std::span<PathSegment const> { return segments_; }
    auto begin() const noexcept -> const_iterator { return segments_.begin(); }
    auto end() const noexcept -> const_iterator { return segments_.end(); }

    auto operator[](std::size_t index) const -> PathSegment const& { return segments_[index]; }
    auto at(std::size_t index) const -> Expected<PathSegment>;

    auto append(PathSegment segment) -> void;
    auto replace(std::size_t index, PathSegment segment) -> std::optional<Error>;

    bool operator==(PathData const& other) const = default;

private:
    std::vector<PathSegment> segments_;
};

} // namespace SD
