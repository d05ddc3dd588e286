#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace crawl_summary::common {

using Timestamp = std::chrono::system_clock::time_point;

// Parses "YYYY-MM-DDTHH:MM:SS[.fff]Z" (UTC). Fractions beyond milliseconds are truncated.
std::optional<Timestamp> parseIsoTimestamp(std::string_view text);

// Formats as "YYYY-MM-DDTHH:MM:SS.fffZ"
std::string formatIsoTimestamp(Timestamp time);

} // namespace crawl_summary::common
