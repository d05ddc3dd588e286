#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "crawl_summary/log/MimeTypes.h"
#include "crawl_summary/log/StatusCodes.h"

using namespace crawl_summary::log;

TEST_CASE("canonicalizeMimeType normalizes content types", "[MimeTypes]") {
    REQUIRE(canonicalizeMimeType("text/html") == "text/html");
    REQUIRE(canonicalizeMimeType("text/html;charset=UTF-8") == "text/html");
    REQUIRE(canonicalizeMimeType("Text/HTML ; charset=utf-8") == "text/html");
    REQUIRE(canonicalizeMimeType("  application/pdf ") == "application/pdf");

    auto missing = GENERATE(as<std::string>{}, "", "-", "   ", ";charset=utf-8");
    REQUIRE(canonicalizeMimeType(missing) == "unknown");
}

TEST_CASE("describeStatusCode labels crawler and HTTP codes", "[StatusCodes]") {
    SECTION("Crawler-internal codes") {
        REQUIRE(describeStatusCode(1) == "Successful DNS lookup");
        REQUIRE(describeStatusCode(-1) == "DNS lookup failed");
        REQUIRE(describeStatusCode(-9998) == "Robots.txt rules precluded fetch");
    }

    SECTION("HTTP codes") {
        REQUIRE(describeStatusCode(200) == "OK");
        REQUIRE(describeStatusCode(301) == "Moved Permanently");
        REQUIRE(describeStatusCode(404) == "Not Found");
    }

    SECTION("Unknown codes") {
        REQUIRE(describeStatusCode(799) == "Unknown status code 799");
        REQUIRE(describeStatusCode(-12345) == "Unknown status code -12345");
    }
}
