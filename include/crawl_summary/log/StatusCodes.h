#pragma once

#include <string>

namespace crawl_summary::log {

/**
 * Human-readable label for a crawl.log fetch status.
 * Positive values are HTTP status codes; zero, one and negative values are
 * crawler-internal outcomes (DNS results, connection failures, scope and
 * robots.txt exclusions).
 * @param code Fetch status as logged
 * @return Description, "Unknown status code <code>" when not recognised
 */
std::string describeStatusCode(int code);

} // namespace crawl_summary::log
