#pragma once

#include <nlohmann/json.hpp>
#include "CrawlSummary.h"
#include "Grouping.h"

namespace crawl_summary::summary {

// Absent labels and unset times are omitted rather than written as null
nlohmann::ordered_json toJson(const Stats& stats);

// Keys: totals, statusCodes, mimeTypes, sizeHisto, registeredDomains, seeds
nlohmann::ordered_json toJson(const CrawlSummary& summary);

// Group key -> summary object, keys ascending
nlohmann::ordered_json toJson(const GroupedSummary& grouped);

} // namespace crawl_summary::summary
