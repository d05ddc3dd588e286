#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>

namespace crawl_summary::common {

struct PublicSuffixListError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Rule set in the format of publicsuffix.org's public_suffix_list.dat:
 * one rule per line, "//" comments, "*.foo" wildcard rules and "!bar.foo"
 * exception rules. Hosts matched by no rule are not under a public suffix
 * (there is no implicit "*" rule).
 */
class PublicSuffixList {
public:
    // Debian/Ubuntu location of the list shipped by the publicsuffix package
    static constexpr const char* kSystemListPath = "/usr/share/publicsuffix/public_suffix_list.dat";

    PublicSuffixList() = default;

    // Compact rule set covering the common generic and country-code suffixes
    static PublicSuffixList builtIn();

    // Throws PublicSuffixListError if the file cannot be read or holds no rules
    static PublicSuffixList fromFile(const std::string& path);

    static PublicSuffixList fromStream(std::istream& in);

    // Adds one rule; blank lines and comments are ignored
    void addRule(std::string_view rule);

    size_t ruleCount() const { return exact_.size() + wildcard_.size() + exception_.size(); }

    // Longest public suffix of host, if any rule matches
    std::optional<std::string> publicSuffix(std::string_view host) const;

    // Public suffix plus one label. nullopt when host is itself a public suffix
    // or is not under one.
    std::optional<std::string> registrableDomain(std::string_view host) const;

private:
    std::unordered_set<std::string> exact_;
    std::unordered_set<std::string> wildcard_;   // stored without the leading "*."
    std::unordered_set<std::string> exception_;  // stored without the leading "!"
};

} // namespace crawl_summary::common
