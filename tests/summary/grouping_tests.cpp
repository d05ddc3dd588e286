#include <catch2/catch_test_macros.hpp>
#include "crawl_summary/summary/Grouping.h"
#include "TestRecords.h"

#include <vector>

using namespace crawl_summary::summary;
using crawl_summary::common::PublicSuffixList;
using crawl_summary::log::CrawlRecord;
using test_support::makeRecord;

TEST_CASE("parseGroupBy accepts strategy names", "[Grouping]") {
    REQUIRE(parseGroupBy("none") == GroupBy::NONE);
    REQUIRE(parseGroupBy("host") == GroupBy::HOST);
    REQUIRE(parseGroupBy("Registered-Domain") == GroupBy::REGISTERED_DOMAIN);
    REQUIRE(parseGroupBy("rdomain") == GroupBy::REGISTERED_DOMAIN);
    REQUIRE(parseGroupBy("SEED") == GroupBy::SEED);
    REQUIRE_FALSE(parseGroupBy("mime").has_value());

    REQUIRE(groupByName(GroupBy::REGISTERED_DOMAIN) == "registered-domain");
    REQUIRE(parseGroupBy(groupByName(GroupBy::SEED)) == GroupBy::SEED);
}

TEST_CASE("GroupedSummary partitions records by key", "[Grouping]") {
    const std::vector<CrawlRecord> records = {
        makeRecord("http://www.example.com/", "-", "", 200, 100, "sha1:A"),
        makeRecord("http://img.example.com/logo.png", "E", "http://www.example.com/", 200, 5000, "sha1:B", "image/png"),
        makeRecord("http://other.example.org/", "L", "http://www.example.com/", 404, 50, "sha1:C"),
        makeRecord("https://second.example.net/", "-", "", 200, 700, "sha1:D"),
    };

    SeedResolver seeds;
    seeds.addAll(records);
    seeds.resolveAll();
    const PublicSuffixList suffixes = PublicSuffixList::builtIn();
    RegisteredDomainResolver domains(suffixes);

    SECTION("By host") {
        GroupedSummary grouped(GroupBy::HOST, seeds, domains);
        grouped.addAll(records);
        REQUIRE(grouped.groupBy() == GroupBy::HOST);
        REQUIRE(grouped.groups().size() == 4);
        REQUIRE(grouped.groups().at("img.example.com").totals().bytes() == 5000);
    }

    SECTION("By registered domain") {
        GroupedSummary grouped(GroupBy::REGISTERED_DOMAIN, seeds, domains);
        grouped.addAll(records);
        REQUIRE(grouped.groups().size() == 3);
        REQUIRE(grouped.groups().at("example.com").totals().count() == 2);
        REQUIRE(grouped.groups().at("example.org").totals().count() == 1);
        REQUIRE(grouped.groups().at("example.net").totals().count() == 1);
    }

    SECTION("By seed") {
        GroupedSummary grouped(GroupBy::SEED, seeds, domains);
        grouped.addAll(records);
        REQUIRE(grouped.groups().size() == 2);
        const auto& first = grouped.groups().at("http://www.example.com/");
        REQUIRE(first.totals().count() == 3);
        REQUIRE(first.registeredDomains().size() == 2);
        REQUIRE(grouped.groups().at("https://second.example.net/").totals().count() == 1);
    }

    SECTION("Top-N applies inside every group") {
        GroupedSummary grouped(GroupBy::SEED, seeds, domains);
        grouped.addAll(records);
        grouped.limitToTopN(1);
        const auto& first = grouped.groups().at("http://www.example.com/");
        REQUIRE(first.statusCodes().size() == 1);
        REQUIRE(first.statusCodes().count(200) == 1);
        REQUIRE(first.mimeTypes().size() == 1);
        REQUIRE(first.totals().count() == 3);
    }

    SECTION("Group keys") {
        REQUIRE(groupKey(GroupBy::NONE, records[1], seeds, domains).empty());
        REQUIRE(groupKey(GroupBy::HOST, records[1], seeds, domains) == "img.example.com");
        REQUIRE(groupKey(GroupBy::REGISTERED_DOMAIN, records[1], seeds, domains) == "example.com");
        REQUIRE(groupKey(GroupBy::SEED, records[1], seeds, domains) == "http://www.example.com/");
    }

    SECTION("Unknown records fail seed grouping") {
        const auto stranger = makeRecord("http://stranger.example/", "L", "http://www.example.com/");
        REQUIRE_THROWS_AS(groupKey(GroupBy::SEED, stranger, seeds, domains), SeedIntegrityError);
    }
}
