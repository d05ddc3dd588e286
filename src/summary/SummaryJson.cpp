#include "../../include/crawl_summary/summary/SummaryJson.h"
#include "../../include/crawl_summary/common/TimeFormat.h"

#include <cstddef>
#include <string>

namespace crawl_summary::summary {

using nlohmann::ordered_json;

namespace {

// Callers supply unique keys in output order, so entries are appended to the
// underlying vector without ordered_map's linear key search.
ordered_json::object_t& entriesOf(ordered_json& out, size_t expected) {
    auto& entries = out.get_ref<ordered_json::object_t&>();
    entries.reserve(expected);
    return entries;
}

template <typename BucketMap>
ordered_json byCount(const BucketMap& buckets) {
    ordered_json out = ordered_json::object();
    auto& entries = entriesOf(out, buckets.size());
    for (const auto& it : rankByCount(buckets)) {
        entries.emplace_back(it->first, toJson(it->second));
    }
    return out;
}

// std::map keys are already in ascending numeric order
template <typename NumericBucketMap>
ordered_json byKey(const NumericBucketMap& buckets) {
    ordered_json out = ordered_json::object();
    auto& entries = entriesOf(out, buckets.size());
    for (const auto& [key, stats] : buckets) {
        entries.emplace_back(std::to_string(key), toJson(stats));
    }
    return out;
}

} // namespace

ordered_json toJson(const Stats& stats) {
    ordered_json j;
    j["count"] = stats.count();
    j["uniqueCount"] = stats.uniqueCount();
    j["bytes"] = stats.bytes();
    j["uniqueBytes"] = stats.uniqueBytes();
    if (stats.firstTime()) j["firstTime"] = common::formatIsoTimestamp(*stats.firstTime());
    if (stats.lastTime()) j["lastTime"] = common::formatIsoTimestamp(*stats.lastTime());
    if (stats.label()) j["label"] = *stats.label();
    return j;
}

ordered_json toJson(const CrawlSummary& summary) {
    ordered_json j;
    j["totals"] = toJson(summary.totals());
    j["statusCodes"] = byKey(summary.statusCodes());
    j["mimeTypes"] = byCount(summary.mimeTypes());
    j["sizeHisto"] = byKey(summary.sizeHisto());
    j["registeredDomains"] = byCount(summary.registeredDomains());
    j["seeds"] = byCount(summary.seeds());
    return j;
}

ordered_json toJson(const GroupedSummary& grouped) {
    ordered_json j = ordered_json::object();
    auto& entries = entriesOf(j, grouped.groups().size());
    for (const auto& [key, summary] : grouped.groups()) {
        entries.emplace_back(key, toJson(summary));
    }
    return j;
}

} // namespace crawl_summary::summary
