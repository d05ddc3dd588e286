#pragma once

#include <nlohmann/json.hpp>
#include "SummaryConfig.h"
#include "common/PublicSuffixList.h"

namespace crawl_summary {

// Explicit path if configured, else the system list if installed, else built-in rules.
// Throws common::PublicSuffixListError if an explicitly configured list cannot be loaded.
common::PublicSuffixList loadPublicSuffixList(const SummaryConfig& config);

/**
 * Summarizes config.logPath in three phases: read every discovery edge, resolve
 * seeds in memory, then read the log again folding each record into the summary.
 *
 * Throws log::CrawlLogError when the log cannot be read and
 * summary::SeedIntegrityError when the second pass meets a record the first
 * pass did not register. Nothing is returned in either case.
 */
nlohmann::ordered_json summarizeCrawlLog(const SummaryConfig& config, const common::PublicSuffixList& suffixes);

} // namespace crawl_summary
