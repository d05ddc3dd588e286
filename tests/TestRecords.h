#pragma once

#include <chrono>
#include <string>
#include "crawl_summary/log/CrawlRecord.h"

namespace test_support {

inline crawl_summary::common::Timestamp at(int64_t epochMillis) {
    return crawl_summary::common::Timestamp(std::chrono::milliseconds(epochMillis));
}

inline crawl_summary::log::CrawlRecord makeRecord(const std::string& url,
                                                  const std::string& discoveryPath = "-",
                                                  const std::string& parentUrl = "",
                                                  int statusCode = 200,
                                                  int64_t size = 1000,
                                                  const std::string& digest = "",
                                                  const std::string& mimeType = "text/html",
                                                  int64_t epochMillis = 1488371696789) {
    crawl_summary::log::CrawlRecord record;
    record.timestamp = at(epochMillis);
    record.statusCode = statusCode;
    record.size = size;
    record.url = url;
    record.discoveryPath = discoveryPath;
    record.parentUrl = parentUrl;
    record.mimeType = mimeType;
    record.digest = digest;
    return record;
}

} // namespace test_support
