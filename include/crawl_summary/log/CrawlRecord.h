#pragma once

#include <cstdint>
#include <string>
#include "../common/TimeFormat.h"

namespace crawl_summary::log {

// One fetch as recorded in a Heritrix crawl.log line
struct CrawlRecord {
    common::Timestamp timestamp;
    int statusCode = 0;
    int64_t size = 0;
    std::string url;
    // Hop path as logged; "-" or empty marks a seed
    std::string discoveryPath;
    // Via URL, empty when not logged
    std::string parentUrl;
    std::string mimeType;
    // Content digest, empty when not logged
    std::string digest;
};

} // namespace crawl_summary::log
