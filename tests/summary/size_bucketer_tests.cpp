#include <catch2/catch_test_macros.hpp>
#include "crawl_summary/summary/SizeBucketer.h"

#include <limits>

using namespace crawl_summary::summary;

TEST_CASE("sizeBucket uses powers of eight", "[SizeBucketer]") {
    SECTION("Empty and negative sizes") {
        REQUIRE(sizeBucket(0) == 0);
        REQUIRE(sizeBucket(-5) == 0);
    }

    SECTION("Known boundaries") {
        REQUIRE(sizeBucket(1) == 8);
        REQUIRE(sizeBucket(2) == 64);
        REQUIRE(sizeBucket(7) == 64);
        REQUIRE(sizeBucket(8) == 64);
        REQUIRE(sizeBucket(9) == 512);
        REQUIRE(sizeBucket(64) == 512);
        REQUIRE(sizeBucket(65) == 4096);
        REQUIRE(sizeBucket(100) == 4096);
        REQUIRE(sizeBucket(1000) == 32768);
        REQUIRE(sizeBucket(4096) == 32768);
        REQUIRE(sizeBucket(123456) == 2097152);
        REQUIRE(sizeBucket(1000000) == 16777216);
    }

    SECTION("Huge sizes saturate") {
        REQUIRE(sizeBucket(std::numeric_limits<int64_t>::max()) == std::numeric_limits<int64_t>::max());
    }
}

TEST_CASE("sizeBucket never decreases and always exceeds the size", "[SizeBucketer]") {
    int64_t previous = 0;
    for (int64_t size = 1; size <= 70000; ++size) {
        const int64_t bucket = sizeBucket(size);
        REQUIRE(bucket >= previous);
        REQUIRE(bucket > size);
        previous = bucket;
    }
}

TEST_CASE("humanSize labels buckets in binary units", "[SizeBucketer]") {
    REQUIRE(humanSize(0) == "0 B");
    REQUIRE(humanSize(512) == "512 B");
    REQUIRE(humanSize(1023) == "1023 B");
    REQUIRE(humanSize(1024) == "1 KiB");
    REQUIRE(humanSize(4096) == "4 KiB");
    REQUIRE(humanSize(32768) == "32 KiB");
    REQUIRE(humanSize(262144) == "256 KiB");
    REQUIRE(humanSize(2097152) == "2 MiB");
    REQUIRE(humanSize(8LL * 1024 * 1024 * 1024) == "8 GiB");
}
