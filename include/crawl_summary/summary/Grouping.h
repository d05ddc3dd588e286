#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "CrawlSummary.h"

namespace crawl_summary::summary {

enum class GroupBy {
    NONE,
    HOST,
    REGISTERED_DOMAIN,
    SEED
};

// Accepts "none", "host", "registered-domain" (or "rdomain") and "seed"
std::optional<GroupBy> parseGroupBy(std::string_view name);

std::string_view groupByName(GroupBy groupBy);

// Partition key of a record. GroupBy::NONE yields "".
// Throws SeedIntegrityError for GroupBy::SEED when the record's key is unknown.
std::string groupKey(GroupBy groupBy, const log::CrawlRecord& record,
                     const SeedResolver& seeds, const RegisteredDomainResolver& domains);

// One independent CrawlSummary per distinct group key
class GroupedSummary {
public:
    GroupedSummary(GroupBy groupBy, const SeedResolver& seeds, const RegisteredDomainResolver& domains)
        : groupBy_(groupBy), seeds_(seeds), domains_(domains) {}

    void add(const log::CrawlRecord& record);

    template <typename RecordRange>
    void addAll(RecordRange&& records) {
        for (const auto& record : records) {
            add(record);
        }
    }

    void limitToTopN(size_t n);

    GroupBy groupBy() const { return groupBy_; }
    const std::map<std::string, CrawlSummary>& groups() const { return groups_; }

private:
    GroupBy groupBy_;
    const SeedResolver& seeds_;
    const RegisteredDomainResolver& domains_;
    std::map<std::string, CrawlSummary> groups_;
};

} // namespace crawl_summary::summary
