#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "Stats.h"
#include "SeedResolver.h"
#include "RegisteredDomain.h"
#include "../log/CrawlRecord.h"

namespace crawl_summary::summary {

// A record's discovery key is missing from the resolved seed map
class SeedIntegrityError : public std::runtime_error {
public:
    explicit SeedIntegrityError(DiscoveryKey key)
        : std::runtime_error("Did not find seed for " + key.toString()), key_(std::move(key)) {}

    const DiscoveryKey& key() const { return key_; }

private:
    DiscoveryKey key_;
};

// Buckets ordered by descending count, ties by ascending key
template <typename BucketMap>
std::vector<typename BucketMap::const_iterator> rankByCount(const BucketMap& buckets) {
    std::vector<typename BucketMap::const_iterator> ranked;
    ranked.reserve(buckets.size());
    for (auto it = buckets.cbegin(); it != buckets.cend(); ++it) {
        ranked.push_back(it);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a->second.count() != b->second.count()) {
            return a->second.count() > b->second.count();
        }
        return a->first < b->first;
    });
    return ranked;
}

/**
 * Crawl statistics broken down by status code, mime type, size bucket,
 * registered domain and seed. The seed resolver must already be resolved
 * and must have seen every record passed to add().
 */
class CrawlSummary {
public:
    CrawlSummary(const SeedResolver& seeds, const RegisteredDomainResolver& domains)
        : seeds_(&seeds), domains_(&domains) {}

    // Throws SeedIntegrityError if the record's key is unknown to the seed resolver
    void add(const log::CrawlRecord& record);

    template <typename RecordRange>
    void addAll(RecordRange&& records) {
        for (const auto& record : records) {
            add(record);
        }
    }

    // Keeps only the n largest status code, mime type and registered domain buckets
    void limitToTopN(size_t n);

    const Stats& totals() const { return totals_; }
    const std::map<int, Stats>& statusCodes() const { return statusCodes_; }
    const std::unordered_map<std::string, Stats>& mimeTypes() const { return mimeTypes_; }
    const std::map<int64_t, Stats>& sizeHisto() const { return sizeHisto_; }
    const std::unordered_map<std::string, Stats>& registeredDomains() const { return registeredDomains_; }
    const std::unordered_map<std::string, Stats>& seeds() const { return seedStats_; }

private:
    const SeedResolver* seeds_;
    const RegisteredDomainResolver* domains_;

    Stats totals_;
    std::map<int, Stats> statusCodes_;
    std::unordered_map<std::string, Stats> mimeTypes_;
    std::map<int64_t, Stats> sizeHisto_;
    std::unordered_map<std::string, Stats> registeredDomains_;
    std::unordered_map<std::string, Stats> seedStats_;
};

} // namespace crawl_summary::summary
