#include "../../include/crawl_summary/summary/CrawlSummary.h"
#include "../../include/crawl_summary/summary/SizeBucketer.h"
#include "../../include/crawl_summary/log/MimeTypes.h"
#include "../../include/crawl_summary/log/StatusCodes.h"

namespace crawl_summary::summary {

namespace {

template <typename BucketMap>
void keepLargest(BucketMap& buckets, size_t n) {
    if (buckets.size() <= n) {
        return;
    }
    auto ranked = rankByCount(buckets);
    std::vector<typename BucketMap::key_type> dropped;
    dropped.reserve(ranked.size() - n);
    for (size_t i = n; i < ranked.size(); ++i) {
        dropped.push_back(ranked[i]->first);
    }
    for (const auto& key : dropped) {
        buckets.erase(key);
    }
}

} // namespace

void CrawlSummary::add(const log::CrawlRecord& record) {
    // Attribution first: an unknown key must not leave a half-counted record behind
    const DiscoveryKey key = DiscoveryKey::of(record);
    auto seed = seeds_->seedFor(key);
    if (!seed) {
        throw SeedIntegrityError(key);
    }

    const std::string mimeType = log::canonicalizeMimeType(record.mimeType);
    const int64_t bucket = sizeBucket(record.size);
    const std::string domain = domains_->resolve(record.url);

    auto status = statusCodes_.find(record.statusCode);
    if (status == statusCodes_.end()) {
        status = statusCodes_.emplace(record.statusCode, Stats(log::describeStatusCode(record.statusCode))).first;
    }
    status->second.add(record);

    auto size = sizeHisto_.find(bucket);
    if (size == sizeHisto_.end()) {
        size = sizeHisto_.emplace(bucket, Stats(humanSize(bucket))).first;
    }
    size->second.add(record);

    mimeTypes_[mimeType].add(record);
    registeredDomains_[domain].add(record);
    seedStats_[*seed].add(record);
    totals_.add(record);
}

void CrawlSummary::limitToTopN(size_t n) {
    if (n == 0) {
        return;
    }
    keepLargest(statusCodes_, n);
    keepLargest(mimeTypes_, n);
    keepLargest(registeredDomains_, n);
}

} // namespace crawl_summary::summary
