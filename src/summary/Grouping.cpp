#include "../../include/crawl_summary/summary/Grouping.h"
#include "../../include/crawl_summary/common/UrlUtils.h"

namespace crawl_summary::summary {

std::optional<GroupBy> parseGroupBy(std::string_view name) {
    const std::string lower = common::toLowerAscii(name);
    if (lower == "none") return GroupBy::NONE;
    if (lower == "host") return GroupBy::HOST;
    if (lower == "registered-domain" || lower == "rdomain") return GroupBy::REGISTERED_DOMAIN;
    if (lower == "seed") return GroupBy::SEED;
    return std::nullopt;
}

std::string_view groupByName(GroupBy groupBy) {
    switch (groupBy) {
        case GroupBy::NONE: return "none";
        case GroupBy::HOST: return "host";
        case GroupBy::REGISTERED_DOMAIN: return "registered-domain";
        case GroupBy::SEED: return "seed";
    }
    return "none";
}

std::string groupKey(GroupBy groupBy, const log::CrawlRecord& record,
                     const SeedResolver& seeds, const RegisteredDomainResolver& domains) {
    switch (groupBy) {
        case GroupBy::NONE:
            return "";
        case GroupBy::HOST:
            return common::hostOf(record.url);
        case GroupBy::REGISTERED_DOMAIN:
            return domains.resolve(record.url);
        case GroupBy::SEED: {
            const DiscoveryKey key = DiscoveryKey::of(record);
            auto seed = seeds.seedFor(key);
            if (!seed) {
                throw SeedIntegrityError(key);
            }
            return *seed;
        }
    }
    return "";
}

void GroupedSummary::add(const log::CrawlRecord& record) {
    const std::string key = groupKey(groupBy_, record, seeds_, domains_);
    auto it = groups_.find(key);
    if (it == groups_.end()) {
        it = groups_.try_emplace(key, seeds_, domains_).first;
    }
    it->second.add(record);
}

void GroupedSummary::limitToTopN(size_t n) {
    for (auto& entry : groups_) {
        entry.second.limitToTopN(n);
    }
}

} // namespace crawl_summary::summary
