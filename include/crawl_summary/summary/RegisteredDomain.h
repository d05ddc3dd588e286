#pragma once

#include <string>
#include <string_view>
#include "../common/PublicSuffixList.h"

namespace crawl_summary::summary {

/**
 * Maps a URL to its registered ("top private") domain. Never throws:
 * - crawler lookups that fetch nothing from the URL's host ("dns:" and
 *   "whois:" records) map to their scheme name;
 * - IP literals, single-label hosts and hosts under no known public suffix
 *   are returned unchanged;
 * - URLs with no usable host map to "unknown" and a warning is logged.
 */
class RegisteredDomainResolver {
public:
    static constexpr const char* kDnsLabel = "dns";
    static constexpr const char* kWhoisLabel = "whois";
    static constexpr const char* kUnknownLabel = "unknown";

    explicit RegisteredDomainResolver(const common::PublicSuffixList& suffixes) : suffixes_(suffixes) {}

    std::string resolve(const std::string& url) const;

private:
    static bool isPseudoScheme(std::string_view scheme);
    static bool isValidHostName(std::string_view host);

    const common::PublicSuffixList& suffixes_;
};

} // namespace crawl_summary::summary
