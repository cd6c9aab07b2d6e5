#include "path/PathJson.hpp"

#include "type/NumberText.hpp"

#include <charconv>
#include <system_error>

#include <nlohmann/json.hpp>

namespace SD {

namespace {

using Json = nlohmann::json;

// The double nearest the operand's shortest text, so the JSON value prints
// the same digits as the canonical path text.
auto operandToJson(float operand) -> double {
    auto const text   = formatNumber(operand);
    double     result = 0.0;
    auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return static_cast<double>(operand);
    return result;
}

auto segmentToJson(PathSegment const& segment) -> Json {
    Json operands = Json::array();
    for (float operand : segment.operands())
        operands.push_back(operandToJson(operand));

    Json entry;
    entry["command"]  = std::string(1, segment.letter());
    entry["type"]     = std::string(segmentTypeName(segment.type()));
    entry["absolute"] = segment.isAbsolute();
    entry["operands"] = std::move(operands);
    return entry;
}

} // namespace

auto PathJsonExporter::Export(PathData const& path, PathJsonOptions const& options) -> std::string {
    Json segments = Json::array();
    for (auto const& segment : path)
        segments.push_back(segmentToJson(segment));

    Json root;
    if (options.includeCanonical)
        root["canonical"] = path.toString();
    root["segments"] = std::move(segments);
    return root.dump(options.indent);
}

} // namespace SD
