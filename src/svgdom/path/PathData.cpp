#include "path/PathData.hpp"

#include "log/TaggedLogger.hpp"
#include "path/PathTokenizer.hpp"
#include "type/NumberText.hpp"

#include <cctype>
#include <string>

namespace {

using SD::Error;
using SD::Expected;
using SD::PathData;
using SD::PathSegment;
using SD::SegmentCommand;
using SD::SegmentType;

auto quoted(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size() + 2);
    result.push_back('"');
    result.append(text.data(), text.size());
    result.push_back('"');
    return result;
}

auto malformed(std::string_view reason, std::string_view source) -> std::unexpected<Error> {
    std::string message(reason);
    message.append(" in path data ");
    message.append(quoted(source));
    sd_log("PathData::parse failed: " + message, "PathData", "ERROR");
    return std::unexpected(Error{Error::Code::MalformedPath, std::move(message)});
}

auto isCommandToken(std::string_view token) -> bool {
    return !token.empty() && std::isalpha(static_cast<unsigned char>(token.front())) != 0;
}

// Consecutive segments of the same command share one letter, and coordinate
// pairs after a moveto read back as linetos. Repeated movetos and closepaths
// therefore collapse on the next parse.
auto needsLetter(PathSegment const* previous, PathSegment const& current) -> bool {
    if (previous == nullptr)
        return true;
    if (previous->isAbsolute() != current.isAbsolute())
        return true;
    if (previous->type() == current.type())
        return false;
    return !(previous->type() == SegmentType::MoveTo && current.type() == SegmentType::LineTo);
}

} // namespace

namespace SD {

PathData::PathData(std::vector<PathSegment> segments)
    : segments_(std::move(segments)) {}

auto PathData::parse(std::string_view text) -> Expected<PathData> {
    auto const tokens = tokenizePathData(text);

    std::vector<PathSegment>      segments;
    std::optional<SegmentCommand> current;
    std::size_t                   i = 0;

    while (i < tokens.size()) {
        auto const       token = tokens[i];
        std::string_view inlineOperand;

        if (isCommandToken(token)) {
            auto command = commandFromLetter(token.front());
            if (!command)
                return malformed("unrecognized command '" + std::string(1, token.front()) + "'", text);
            current       = command;
            inlineOperand = token.substr(1);
            if (inlineOperand.empty())
                ++i;
        } else if (!current) {
            return malformed("path data must start with a command", text);
        } else if (current->type == SegmentType::MoveTo) {
            current->type = SegmentType::LineTo;
        }

        auto const arity = segmentArity(current->type);
        if (arity == 0 && (!inlineOperand.empty() || (i < tokens.size() && !isCommandToken(tokens[i])))) {
            auto const stray = inlineOperand.empty() ? tokens[i] : inlineOperand;
            return malformed("unexpected operand '" + std::string(stray) + "' after closepath", text);
        }

        std::vector<float> operands;
        operands.reserve(arity);
        for (std::size_t j = 0; j < arity; ++j) {
            if (i + j >= tokens.size())
                return malformed(std::string(segmentTypeName(current->type)) + " expects " + std::to_string(arity)
                                         + " operands, got " + std::to_string(j),
                                 text);
            auto const operandText = (j == 0 && !inlineOperand.empty()) ? inlineOperand : tokens[i + j];
            auto const value       = parseNumber(operandText);
            if (!value)
                return malformed("invalid number '" + std::string(operandText) + "'", text);
            operands.push_back(*value);
        }

        auto segment = PathSegment::create(current->type, current->absolute, std::move(operands));
        if (!segment)
            return std::unexpected(segment.error());
        segments.push_back(std::move(*segment));
        i += arity;
    }

    return PathData{std::move(segments)};
}

auto PathData::toString() const -> std::string {
    std::string        builder;
    PathSegment const* previous = nullptr;
    for (auto const& segment : segments_) {
        if (needsLetter(previous, segment)) {
            builder.push_back(segment.letter());
            builder.push_back(' ');
        }
        for (float operand : segment.operands()) {
            builder.append(formatNumber(operand));
            builder.push_back(' ');
        }
        previous = &segment;
    }
    return builder;
}

auto PathData::clone() const -> Expected<PathData> {
    return PathData::parse(this->toString());
}

auto PathData::at(std::size_t index) const -> Expected<PathSegment> {
    if (index >= segments_.size())
        return std::unexpected(Error{Error::Code::NotFound,
                                     "segment index " + std::to_string(index) + " out of range (size "
                                             + std::to_string(segments_.size()) + ")"});
    return segments_[index];
}

auto PathData::append(PathSegment segment) -> void {
    segments_.push_back(std::move(segment));
}

auto PathData::replace(std::size_t index, PathSegment segment) -> std::optional<Error> {
    if (index >= segments_.size())
        return Error{Error::Code::NotFound,
                     "segment index " + std::to_string(index) + " out of range (size " + std::to_string(segments_.size())
                             + ")"};
    segments_[index] = std::move(segment);
    return std::nullopt;
}

} // namespace SD
