#include "path/PathTokenizer.hpp"

namespace SD {

auto tokenizePathData(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    std::size_t                   pos  = 0;
    auto const                    size = text.size();

    while (pos < size) {
        while (pos < size && isPathSeparator(text[pos]))
            ++pos;
        auto const start = pos;
        while (pos < size && !isPathSeparator(text[pos]))
            ++pos;
        if (pos > start)
            tokens.push_back(text.substr(start, pos - start));
    }
    return tokens;
}

} // namespace SD
