#pragma once
#include "path/PathData.hpp"

#include <string>

namespace SD {

struct PathJsonOptions {
    int  indent          = 2; // -1 for compact output
    bool includeCanonical = true;
};

/**
 * Structured dump of a parsed path:
 * {"canonical": "...", "segments": [{"command": "M", "type": "MoveTo", "absolute": true, "operands": [0, 0]}]}
 */
class PathJsonExporter {
public:
    static auto Export(PathData const& path, PathJsonOptions const& options = PathJsonOptions{}) -> std::string;
};

} // namespace SD
