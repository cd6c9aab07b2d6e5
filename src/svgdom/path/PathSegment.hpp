#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace SD {

enum class SegmentType {
    MoveTo = 0,
    LineTo,
    HLineTo,
    VLineTo,
    CurveTo,
    SmoothCurveTo,
    QuadraticBezierTo,
    SmoothQuadraticBezierTo,
    ArcTo,
    ClosePath
};

[[nodiscard]] constexpr auto segmentArity(SegmentType type) -> std::size_t {
    switch (type) {
    case SegmentType::MoveTo:
    case SegmentType::LineTo:
    case SegmentType::SmoothQuadraticBezierTo:
        return 2;
    case SegmentType::HLineTo:
    case SegmentType::VLineTo:
        return 1;
    case SegmentType::CurveTo:
        return 6;
    case SegmentType::SmoothCurveTo:
    case SegmentType::QuadraticBezierTo:
        return 4;
    case SegmentType::ArcTo:
        return 7;
    case SegmentType::ClosePath:
        return 0;
    }
    return 0;
}

// Uppercase letter for the command; lowercase is the relative form.
[[nodiscard]] constexpr auto segmentLetter(SegmentType type) -> char {
    switch (type) {
    case SegmentType::MoveTo:
        return 'M';
    case SegmentType::LineTo:
        return 'L';
    case SegmentType::HLineTo:
        return 'H';
    case SegmentType::VLineTo:
        return 'V';
    case SegmentType::CurveTo:
        return 'C';
    case SegmentType::SmoothCurveTo:
        return 'S';
    case SegmentType::QuadraticBezierTo:
        return 'Q';
    case SegmentType::SmoothQuadraticBezierTo:
        return 'T';
    case SegmentType::ArcTo:
        return 'A';
    case SegmentType::ClosePath:
        return 'Z';
    }
    return '?';
}

[[nodiscard]] auto segmentTypeName(SegmentType type) -> std::string_view;

struct SegmentCommand {
    SegmentType type;
    bool        absolute;
};

// Maps a command letter to its segment type; nullopt for letters outside the path grammar.
[[nodiscard]] auto commandFromLetter(char letter) -> std::optional<SegmentCommand>;

/**
 * One drawing command of a path. The operand count always matches
 * segmentArity(type); segments are never modified after construction.
 */
class PathSegment {
public:
    static auto create(SegmentType type, bool absolute, std::vector<float> operands) -> Expected<PathSegment>;

    auto type() const noexcept -> SegmentType { return type_; }
    auto isAbsolute() const noexcept -> bool { return absolute_; }
    auto operands() const noexcept -> std::span<float const> { return operands_; }
    auto operand(std::size_t index) const -> float { return operands_.at(index); }
    auto letter() const noexcept -> char;

    bool operator==(PathSegment const& other) const = default;

private:
    PathSegment(SegmentType type, bool absolute, std::vector<float> operands);

    SegmentType        type_;
    bool               absolute_;
    std::vector<float> operands_;
};

} // namespace SD
