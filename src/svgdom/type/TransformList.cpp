#include "type/TransformList.hpp"

#include "type/NumberText.hpp"

#include <cctype>

namespace {

using SD::Error;
using SD::TransformKind;

auto isSeparator(char c) -> bool {
    return c == ' ' || c == ',' || c == '\t' || c == '\r' || c == '\n';
}

auto acceptsArgumentCount(TransformKind kind, std::size_t count) -> bool {
    switch (kind) {
    case TransformKind::Matrix:
        return count == 6;
    case TransformKind::Translate:
    case TransformKind::Scale:
        return count == 1 || count == 2;
    case TransformKind::Rotate:
        return count == 1 || count == 3;
    case TransformKind::SkewX:
    case TransformKind::SkewY:
        return count == 1;
    }
    return false;
}

auto malformed(std::string reason, std::string_view source) -> std::unexpected<Error> {
    reason.append(" in transform \"");
    reason.append(source.data(), source.size());
    reason.push_back('"');
    return std::unexpected(Error{Error::Code::MalformedTransform, std::move(reason)});
}

} // namespace

namespace SD {

auto transformKindName(TransformKind kind) -> std::string_view {
    switch (kind) {
    case TransformKind::Matrix:
        return "matrix";
    case TransformKind::Translate:
        return "translate";
    case TransformKind::Scale:
        return "scale";
    case TransformKind::Rotate:
        return "rotate";
    case TransformKind::SkewX:
        return "skewX";
    case TransformKind::SkewY:
        return "skewY";
    }
    return "unknown";
}

auto transformKindFromName(std::string_view name) -> std::optional<TransformKind> {
    if (name == "matrix")
        return TransformKind::Matrix;
    if (name == "translate")
        return TransformKind::Translate;
    if (name == "scale")
        return TransformKind::Scale;
    if (name == "rotate")
        return TransformKind::Rotate;
    if (name == "skewX")
        return TransformKind::SkewX;
    if (name == "skewY")
        return TransformKind::SkewY;
    return std::nullopt;
}

auto TransformList::fromText(std::string_view text) -> Expected<TransformList> {
    TransformList list;
    std::size_t   pos  = 0;
    auto const    size = text.size();

    while (true) {
        while (pos < size && isSeparator(text[pos]))
            ++pos;
        if (pos == size)
            break;

        auto const nameStart = pos;
        while (pos < size && std::isalpha(static_cast<unsigned char>(text[pos])))
            ++pos;
        auto const name = text.substr(nameStart, pos - nameStart);
        auto const kind = transformKindFromName(name);
        if (!kind)
            return malformed("unknown transform '" + std::string(name.empty() ? text.substr(nameStart, 1) : name) + "'", text);

        while (pos < size && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        if (pos == size || text[pos] != '(')
            return malformed("expected '(' after '" + std::string(name) + "'", text);
        auto const close = text.find(')', pos);
        if (close == std::string_view::npos)
            return malformed("unterminated argument list for '" + std::string(name) + "'", text);

        auto const         body = text.substr(pos + 1, close - pos - 1);
        std::vector<float> arguments;
        std::size_t        cursor = 0;
        while (cursor < body.size()) {
            while (cursor < body.size() && isSeparator(body[cursor]))
                ++cursor;
            auto const start = cursor;
            while (cursor < body.size() && !isSeparator(body[cursor]))
                ++cursor;
            if (cursor == start)
                continue;
            auto const token = body.substr(start, cursor - start);
            auto const value = parseNumber(token);
            if (!value)
                return malformed("invalid number '" + std::string(token) + "'", text);
            arguments.push_back(*value);
        }

        if (auto error = list.append(Transform{*kind, std::move(arguments)}))
            return malformed(*error->message, text);
        pos = close + 1;
    }
    return list;
}

auto TransformList::toString() const -> std::string {
    std::string result;
    for (auto const& transform : transforms_) {
        if (!result.empty())
            result.push_back(' ');
        result.append(transformKindName(transform.kind));
        result.push_back('(');
        for (std::size_t i = 0; i < transform.arguments.size(); ++i) {
            if (i > 0)
                result.push_back(',');
            result.append(formatNumber(transform.arguments[i]));
        }
        result.push_back(')');
    }
    return result;
}

auto TransformList::append(Transform transform) -> std::optional<Error> {
    if (!acceptsArgumentCount(transform.kind, transform.arguments.size()))
        return Error{Error::Code::MalformedTransform,
                     std::string(transformKindName(transform.kind)) + " does not take "
                             + std::to_string(transform.arguments.size()) + " arguments"};
    transforms_.push_back(std::move(transform));
    return std::nullopt;
}

} // namespace SD
