#pragma once

#include <string>
#include <string_view>

namespace crawl_summary::log {

// Drops parameters (";charset=..."), trims and lowercases. Empty or "-" becomes "unknown".
std::string canonicalizeMimeType(std::string_view mimeType);

} // namespace crawl_summary::log
