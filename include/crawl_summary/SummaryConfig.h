#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include "../Logger.h"
#include "summary/Grouping.h"
#include "summary/SeedResolver.h"

namespace crawl_summary {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SummaryConfig {
    // Heritrix crawl.log to summarize
    std::string logPath;

    // Partitioning of the output
    summary::GroupBy groupBy = summary::GroupBy::NONE;

    // Limit status code, mime type and registered domain lists to the top N (0 = no limit)
    size_t topN = 0;

    // Ceiling on compression steps per discovery key during seed resolution
    size_t maxResolveDepth = summary::SeedResolver::kDefaultMaxDepth;

    // public_suffix_list.dat to load; empty = system list if present, else built-in rules
    std::string publicSuffixListPath;

    // Diagnostics
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;

    // -h / --help was given
    bool showHelp = false;
};

/**
 * Builds the configuration from environment variables (CRAWL_SUMMARY_LOG_LEVEL,
 * CRAWL_SUMMARY_LOG_FILE, PUBLIC_SUFFIX_LIST) overridden by command-line options.
 * Throws ConfigError on unknown options, bad values or a missing log path.
 */
SummaryConfig loadConfig(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace crawl_summary
