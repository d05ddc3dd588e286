#include "../include/crawl_summary/SummaryPipeline.h"
#include "../include/crawl_summary/log/CrawlLogReader.h"
#include "../include/crawl_summary/summary/CrawlSummary.h"
#include "../include/crawl_summary/summary/Grouping.h"
#include "../include/crawl_summary/summary/RegisteredDomain.h"
#include "../include/crawl_summary/summary/SeedResolver.h"
#include "../include/crawl_summary/summary/SummaryJson.h"
#include "../include/Logger.h"

#include <filesystem>

namespace crawl_summary {

common::PublicSuffixList loadPublicSuffixList(const SummaryConfig& config) {
    if (!config.publicSuffixListPath.empty()) {
        return common::PublicSuffixList::fromFile(config.publicSuffixListPath);
    }

    std::error_code ec;
    if (std::filesystem::exists(common::PublicSuffixList::kSystemListPath, ec)) {
        try {
            return common::PublicSuffixList::fromFile(common::PublicSuffixList::kSystemListPath);
        } catch (const common::PublicSuffixListError& e) {
            LOG_WARNING(std::string(e.what()) + ", using built-in public suffix rules");
        }
    } else {
        LOG_DEBUG("No system public suffix list, using built-in rules");
    }
    return common::PublicSuffixList::builtIn();
}

nlohmann::ordered_json summarizeCrawlLog(const SummaryConfig& config, const common::PublicSuffixList& suffixes) {
    summary::RegisteredDomainResolver domains(suffixes);
    summary::SeedResolver seeds(config.maxResolveDepth);

    {
        LOG_INFO("Pass 1: collecting discovery paths from " + config.logPath);
        log::CrawlLogReader reader(config.logPath);
        seeds.addAll(reader);
        LOG_INFO_STREAM("Pass 1 done: " << reader.recordsRead() << " records, "
                        << reader.malformedLines() << " malformed lines, "
                        << seeds.size() << " distinct discovery keys");
    }

    summary::ResolveReport report = seeds.resolveAll();
    if (report.pathological > 0) {
        LOG_WARNING_STREAM(report.pathological << " discovery keys hit the resolution ceiling of "
                           << seeds.maxDepth() << " and were attributed to non-seed ancestors");
    }

    LOG_INFO("Pass 2: summarizing " + config.logPath + " (group by " +
             std::string(summary::groupByName(config.groupBy)) + ")");
    log::CrawlLogReader reader(config.logPath);

    nlohmann::ordered_json document;
    if (config.groupBy == summary::GroupBy::NONE) {
        summary::CrawlSummary crawlSummary(seeds, domains);
        crawlSummary.addAll(reader);
        crawlSummary.limitToTopN(config.topN);
        document = summary::toJson(crawlSummary);
    } else {
        summary::GroupedSummary grouped(config.groupBy, seeds, domains);
        grouped.addAll(reader);
        grouped.limitToTopN(config.topN);
        LOG_INFO_STREAM("Built " << grouped.groups().size() << " group summaries");
        document = summary::toJson(grouped);
    }

    LOG_INFO_STREAM("Pass 2 done: " << reader.recordsRead() << " records summarized");
    return document;
}

} // namespace crawl_summary
