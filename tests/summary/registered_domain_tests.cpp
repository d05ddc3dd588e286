#include <catch2/catch_test_macros.hpp>
#include "crawl_summary/summary/RegisteredDomain.h"

using namespace crawl_summary::summary;
using crawl_summary::common::PublicSuffixList;

TEST_CASE("RegisteredDomainResolver maps URLs to registered domains", "[RegisteredDomain]") {
    const PublicSuffixList suffixes = PublicSuffixList::builtIn();
    RegisteredDomainResolver resolver(suffixes);

    SECTION("Subdomains collapse to the registered domain") {
        REQUIRE(resolver.resolve("http://www.example.com/") == "example.com");
        REQUIRE(resolver.resolve("https://a.b.c.example.org/path?q") == "example.org");
        REQUIRE(resolver.resolve("https://news.bbc.co.uk/sport") == "bbc.co.uk");
        REQUIRE(resolver.resolve("http://www.kb.dk/") == "kb.dk");
    }

    SECTION("Host case, userinfo and port are ignored") {
        REQUIRE(resolver.resolve("HTTP://WWW.Example.COM/Index.html") == "example.com");
        REQUIRE(resolver.resolve("http://user:pw@shop.example.com:8080/") == "example.com");
    }

    SECTION("DNS and WHOIS lookups get fixed labels") {
        REQUIRE(resolver.resolve("dns:www.example.com") == RegisteredDomainResolver::kDnsLabel);
        REQUIRE(resolver.resolve("DNS:www.example.com") == RegisteredDomainResolver::kDnsLabel);
        REQUIRE(resolver.resolve("whois://whois.arin.net/192.0.2.1") == RegisteredDomainResolver::kWhoisLabel);
        REQUIRE(resolver.resolve("whois:example.com") == RegisteredDomainResolver::kWhoisLabel);
    }

    SECTION("IP literals and hosts outside any public suffix are kept") {
        REQUIRE(resolver.resolve("http://192.168.1.10:8080/") == "192.168.1.10");
        REQUIRE(resolver.resolve("http://localhost/") == "localhost");
    }

    SECTION("URLs the parser rejects still yield a host") {
        REQUIRE(resolver.resolve("http://www.example.com/a b") == "example.com");
    }

    SECTION("URLs without a usable host") {
        REQUIRE(resolver.resolve("not a url at all") == RegisteredDomainResolver::kUnknownLabel);
        REQUIRE(resolver.resolve("") == RegisteredDomainResolver::kUnknownLabel);
    }
}

TEST_CASE("RegisteredDomainResolver uses the list it is given", "[RegisteredDomain]") {
    PublicSuffixList suffixes;
    suffixes.addRule("com");
    suffixes.addRule("example.com");
    RegisteredDomainResolver resolver(suffixes);

    REQUIRE(resolver.resolve("http://www.customer.example.com/") == "customer.example.com");
    REQUIRE(resolver.resolve("http://www.example.org/") == "www.example.org");
}
