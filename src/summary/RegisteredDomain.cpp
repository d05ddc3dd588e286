#include "../../include/crawl_summary/summary/RegisteredDomain.h"
#include "../../include/crawl_summary/common/UrlUtils.h"
#include "../../include/Logger.h"

#include <cctype>

namespace crawl_summary::summary {

std::string RegisteredDomainResolver::resolve(const std::string& url) const {
    if (auto scheme = common::urlScheme(url); scheme && isPseudoScheme(*scheme)) {
        return *scheme;
    }

    std::string host;
    common::ParsedUrl parsed = common::parseUrl(url);
    if (parsed.status == common::UrlParseStatus::OK) {
        host = parsed.host;
    } else {
        LOG_DEBUG_STREAM("URL parser rejected " << url << " (code " << parsed.parserCode
                         << "), falling back to authority split");
        host = common::authorityFallback(url);
    }

    if (host.empty()) {
        LOG_WARNING("No host found in URL " + url + ", counting it as " + kUnknownLabel);
        LOG_DEBUG("URL bytes: " + common::hexDump(url));
        return kUnknownLabel;
    }

    host = common::toLowerAscii(host);
    if (common::isIpLiteral(host)) {
        return host;
    }

    if (!isValidHostName(host)) {
        LOG_WARNING("Invalid host '" + host + "' in URL " + url + ", counting it as " + kUnknownLabel);
        LOG_DEBUG("URL bytes: " + common::hexDump(url));
        return kUnknownLabel;
    }

    if (auto domain = suffixes_.registrableDomain(host)) {
        return *domain;
    }
    return host;
}

bool RegisteredDomainResolver::isPseudoScheme(std::string_view scheme) {
    return scheme == kDnsLabel || scheme == kWhoisLabel;
}

bool RegisteredDomainResolver::isValidHostName(std::string_view host) {
    if (!host.empty() && host.back() == '.') {
        host.remove_suffix(1);
    }
    if (host.empty() || host.size() > 253) {
        return false;
    }

    size_t labelLength = 0;
    for (char ch : host) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '.') {
            if (labelLength == 0) return false;
            labelLength = 0;
            continue;
        }
        // bytes >= 0x80 belong to internationalized labels
        if (!std::isalnum(c) && c != '-' && c != '_' && c < 0x80) {
            return false;
        }
        if (++labelLength > 63) return false;
    }
    return labelLength > 0;
}

} // namespace crawl_summary::summary
