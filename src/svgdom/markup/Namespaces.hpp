#pragma once
#include <string_view>

namespace SD {

inline constexpr std::string_view kSvgNamespace   = "http://www.w3.org/2000/svg";
inline constexpr std::string_view kXLinkNamespace = "http://www.w3.org/1999/xlink";
inline constexpr std::string_view kXLinkPrefix    = "xlink";

} // namespace SD
