#include "path/PathSegment.hpp"

#include <cctype>
#include <string>

namespace SD {

auto segmentTypeName(SegmentType type) -> std::string_view {
    switch (type) {
    case SegmentType::MoveTo:
        return "MoveTo";
    case SegmentType::LineTo:
        return "LineTo";
    case SegmentType::HLineTo:
        return "HLineTo";
    case SegmentType::VLineTo:
        return "VLineTo";
    case SegmentType::CurveTo:
        return "CurveTo";
    case SegmentType::SmoothCurveTo:
        return "SmoothCurveTo";
    case SegmentType::QuadraticBezierTo:
        return "QuadraticBezierTo";
    case SegmentType::SmoothQuadraticBezierTo:
        return "SmoothQuadraticBezierTo";
    case SegmentType::ArcTo:
        return "ArcTo";
    case SegmentType::ClosePath:
        return "ClosePath";
    }
    return "Unknown";
}

auto commandFromLetter(char letter) -> std::optional<SegmentCommand> {
    bool const absolute = std::isupper(static_cast<unsigned char>(letter)) != 0;
    switch (std::toupper(static_cast<unsigned char>(letter))) {
    case 'M':
        return SegmentCommand{SegmentType::MoveTo, absolute};
    case 'Z':
        return SegmentCommand{SegmentType::ClosePath, absolute};
    case 'L':
        return SegmentCommand{SegmentType::LineTo, absolute};
    case 'H':
        return SegmentCommand{SegmentType::HLineTo, absolute};
    case 'V':
        return SegmentCommand{SegmentType::VLineTo, absolute};
    case 'C':
        return SegmentCommand{SegmentType::CurveTo, absolute};
    case 'S':
        return SegmentCommand{SegmentType::SmoothCurveTo, absolute};
    case 'Q':
        return SegmentCommand{SegmentType::QuadraticBezierTo, absolute};
    case 'T':
        return SegmentCommand{SegmentType::SmoothQuadraticBezierTo, absolute};
    case 'A':
        return SegmentCommand{SegmentType::ArcTo, absolute};
    default:
        return std::nullopt;
    }
}

PathSegment::PathSegment(SegmentType type, bool absolute, std::vector<float> operands)
    : type_(type), absolute_(absolute), operands_(std::move(operands)) {}

auto PathSegment::create(SegmentType type, bool absolute, std::vector<float> operands) -> Expected<PathSegment> {
    auto const arity = segmentArity(type);
    if (operands.size() != arity) {
        return std::unexpected(Error{Error::Code::MalformedPath,
                                     std::string(segmentTypeName(type)) + " expects " + std::to_string(arity)
                                             + " operands, got " + std::to_string(operands.size())});
    }
    return PathSegment{type, absolute, std::move(operands)};
}

auto PathSegment::letter() const noexcept -> char {
    auto const upper = segmentLetter(type_);
    return absolute_ ? upper : static_cast<char>(std::tolower(static_cast<unsigned char>(upper)));
}

} // namespace SD
