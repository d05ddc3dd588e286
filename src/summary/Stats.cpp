#include "../../include/crawl_summary/summary/Stats.h"

namespace crawl_summary::summary {

void Stats::add(const log::CrawlRecord& record) {
    const uint64_t size = record.size > 0 ? static_cast<uint64_t>(record.size) : 0;

    ++count_;
    bytes_ += size;

    if (record.digest.empty() || digests_.insert(record.digest).second) {
        ++uniqueCount_;
        uniqueBytes_ += size;
    }

    if (!firstTime_ || record.timestamp < *firstTime_) {
        firstTime_ = record.timestamp;
    }
    if (!lastTime_ || record.timestamp > *lastTime_) {
        lastTime_ = record.timestamp;
    }
}

} // namespace crawl_summary::summary
