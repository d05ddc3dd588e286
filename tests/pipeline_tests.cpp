#include <catch2/catch_test_macros.hpp>
#include "crawl_summary/SummaryPipeline.h"
#include "crawl_summary/log/CrawlLogReader.h"

#include <filesystem>
#include <fstream>
#include <vector>

using namespace crawl_summary;

namespace {

const std::string kSampleLog = std::string(TEST_DATA_DIR) + "/sample-crawl.log";

SummaryConfig sampleConfig() {
    SummaryConfig config;
    config.logPath = kSampleLog;
    return config;
}

std::vector<std::string> keysOf(const nlohmann::ordered_json& j) {
    std::vector<std::string> keys;
    for (const auto& item : j.items()) keys.push_back(item.key());
    return keys;
}

} // namespace

TEST_CASE("summarizeCrawlLog summarizes the sample crawl", "[SummaryPipeline]") {
    const auto suffixes = common::PublicSuffixList::builtIn();
    const auto j = summarizeCrawlLog(sampleConfig(), suffixes);

    SECTION("Totals") {
        const auto& totals = j.at("totals");
        REQUIRE(totals.at("count") == 9);
        REQUIRE(totals.at("uniqueCount") == 8);
        REQUIRE(totals.at("bytes") == 6030);
        REQUIRE(totals.at("uniqueBytes") == 4530);
        REQUIRE(totals.at("firstTime") == "2017-03-01T12:00:00.000Z");
        REQUIRE(totals.at("lastTime") == "2017-03-01T12:00:09.000Z");
    }

    SECTION("Seeds, including the one inferred for an orphan") {
        const auto& seeds = j.at("seeds");
        REQUIRE(keysOf(seeds) == std::vector<std::string>{
            "http://a.example/", "http://news.c.example.com/missing", "http://orphan.example.org/"});
        REQUIRE(seeds.at("http://a.example/").at("count") == 6);
        REQUIRE(seeds.at("http://news.c.example.com/missing").at("count") == 2);
        REQUIRE(seeds.at("http://orphan.example.org/").at("count") == 1);
    }

    SECTION("Status codes") {
        REQUIRE(keysOf(j.at("statusCodes")) == std::vector<std::string>{"-9998", "1", "200", "301", "404"});
        REQUIRE(j.at("statusCodes").at("200").at("count") == 5);
    }

    SECTION("Mime types") {
        REQUIRE(j.at("mimeTypes").at("text/html").at("count") == 6);
        REQUIRE(j.at("mimeTypes").at("unknown").at("count") == 1);
    }

    SECTION("Size histogram") {
        REQUIRE(keysOf(j.at("sizeHisto")) == std::vector<std::string>{"0", "512", "4096", "32768"});
        REQUIRE(j.at("sizeHisto").at("0").at("count") == 2);
        REQUIRE(j.at("sizeHisto").at("4096").at("count") == 3);
        REQUIRE(j.at("sizeHisto").at("32768").at("count") == 3);
    }

    SECTION("Registered domains") {
        const auto& domains = j.at("registeredDomains");
        REQUIRE(domains.at("a.example").at("count") == 4);
        REQUIRE(domains.at("example.com").at("count") == 2);
        REQUIRE(domains.at("example.co.uk").at("count") == 1);
        REQUIRE(domains.at("example.org").at("count") == 1);
        REQUIRE(domains.at("dns").at("count") == 1);
    }
}

TEST_CASE("summarizeCrawlLog groups and trims", "[SummaryPipeline]") {
    const auto suffixes = common::PublicSuffixList::builtIn();

    SECTION("Grouped by registered domain") {
        auto config = sampleConfig();
        config.groupBy = summary::GroupBy::REGISTERED_DOMAIN;
        const auto j = summarizeCrawlLog(config, suffixes);
        REQUIRE(keysOf(j) == std::vector<std::string>{"a.example", "dns", "example.co.uk", "example.com", "example.org"});
        REQUIRE(j.at("example.com").at("totals").at("count") == 2);
    }

    SECTION("Top two status codes") {
        auto config = sampleConfig();
        config.topN = 2;
        const auto j = summarizeCrawlLog(config, suffixes);
        REQUIRE(j.at("statusCodes").size() == 2);
        REQUIRE(j.at("statusCodes").contains("200"));
        REQUIRE(j.at("totals").at("count") == 9);
    }

    SECTION("A low depth ceiling still produces a summary") {
        auto config = sampleConfig();
        config.maxResolveDepth = 1;
        const auto j = summarizeCrawlLog(config, suffixes);
        REQUIRE(j.at("totals").at("count") == 9);
    }
}

TEST_CASE("summarizeCrawlLog reports unreadable logs", "[SummaryPipeline]") {
    SummaryConfig config;
    config.logPath = "/nonexistent/crawl.log";
    REQUIRE_THROWS_AS(summarizeCrawlLog(config, common::PublicSuffixList::builtIn()), log::CrawlLogError);
}

TEST_CASE("loadPublicSuffixList honours an explicit list", "[SummaryPipeline]") {
    SECTION("Missing explicit list is an error") {
        SummaryConfig config;
        config.publicSuffixListPath = "/nonexistent/public_suffix_list.dat";
        REQUIRE_THROWS_AS(loadPublicSuffixList(config), common::PublicSuffixListError);
    }

    SECTION("Explicit list is loaded") {
        auto path = std::filesystem::temp_directory_path() / "crawl_summary_test_psl.dat";
        {
            std::ofstream out(path);
            out << "// test rules\n"
                << "org\n"
                << "example.org\n";
        }
        SummaryConfig config;
        config.publicSuffixListPath = path.string();
        auto suffixes = loadPublicSuffixList(config);
        REQUIRE(suffixes.ruleCount() == 2);
        REQUIRE(suffixes.registrableDomain("www.customer.example.org") == std::optional<std::string>("customer.example.org"));
        std::filesystem::remove(path);
    }

    SECTION("Without a configured list some rules are always available") {
        SummaryConfig config;
        auto suffixes = loadPublicSuffixList(config);
        REQUIRE(suffixes.ruleCount() > 0);
        REQUIRE(suffixes.registrableDomain("www.example.com") == std::optional<std::string>("example.com"));
    }
}
