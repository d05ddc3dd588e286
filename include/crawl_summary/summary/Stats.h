#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include "../common/TimeFormat.h"
#include "../log/CrawlRecord.h"

namespace crawl_summary::summary {

// Volume, duplication and timing counters for one dimension value
class Stats {
public:
    Stats() = default;
    explicit Stats(std::string label) : label_(std::move(label)) {}

    // Fold one record in. Records without a digest always count as unique.
    void add(const log::CrawlRecord& record);

    uint64_t count() const { return count_; }
    uint64_t uniqueCount() const { return uniqueCount_; }
    uint64_t bytes() const { return bytes_; }
    uint64_t uniqueBytes() const { return uniqueBytes_; }
    const std::optional<common::Timestamp>& firstTime() const { return firstTime_; }
    const std::optional<common::Timestamp>& lastTime() const { return lastTime_; }
    const std::optional<std::string>& label() const { return label_; }

private:
    uint64_t count_ = 0;
    uint64_t uniqueCount_ = 0;
    uint64_t bytes_ = 0;
    uint64_t uniqueBytes_ = 0;
    std::optional<common::Timestamp> firstTime_;
    std::optional<common::Timestamp> lastTime_;
    std::optional<std::string> label_;
    std::unordered_set<std::string> digests_;
};

} // namespace crawl_summary::summary
