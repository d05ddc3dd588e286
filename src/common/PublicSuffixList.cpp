#include "../../include/crawl_summary/common/PublicSuffixList.h"
#include "../../include/crawl_summary/common/UrlUtils.h"
#include "../../include/Logger.h"

#include <fstream>
#include <vector>

namespace crawl_summary::common {

namespace {

// Subset of the ICANN and private sections of the public suffix list, used
// when no list file is available.
constexpr std::string_view kBuiltInRules[] = {
    // generic
    "com", "org", "net", "edu", "gov", "mil", "int", "info", "biz", "name",
    "pro", "aero", "coop", "museum", "mobi", "asia", "tel", "travel", "jobs", "cat",
    "xxx", "app", "dev", "blog", "shop", "online", "site", "xyz", "top", "club",
    // country code, with common second levels
    "uk", "co.uk", "org.uk", "ac.uk", "gov.uk", "ltd.uk", "plc.uk", "me.uk", "net.uk", "sch.uk",
    "au", "com.au", "net.au", "org.au", "edu.au", "gov.au", "asn.au", "id.au",
    "nz", "co.nz", "org.nz", "net.nz", "ac.nz", "govt.nz",
    "jp", "co.jp", "ne.jp", "or.jp", "ac.jp", "go.jp", "*.kawasaki.jp", "!city.kawasaki.jp",
    "br", "com.br", "net.br", "org.br", "gov.br",
    "cn", "com.cn", "net.cn", "org.cn", "gov.cn", "edu.cn",
    "in", "co.in", "net.in", "org.in",
    "za", "co.za", "org.za",
    "dk", "de", "fr", "nl", "se", "no", "fi", "is", "it", "es", "pt", "be", "ch", "at",
    "pl", "cz", "ie", "eu", "ca", "us", "ru", "io", "me", "tv", "cc", "ly", "co",
    "*.ck", "!www.ck", "*.bd", "*.np",
    // private registries
    "blogspot.com", "github.io", "appspot.com", "herokuapp.com", "netlify.app",
    "pages.dev", "wordpress.com", "cloudfront.net",
};

std::optional<std::string> normalizeHost(std::string_view host) {
    std::string normalized = toLowerAscii(host);
    if (!normalized.empty() && normalized.back() == '.') {
        normalized.pop_back();
    }
    if (normalized.empty() || normalized.front() == '.' || normalized.find("..") != std::string::npos) {
        return std::nullopt;
    }
    return normalized;
}

std::vector<size_t> labelStarts(const std::string& host) {
    std::vector<size_t> starts{0};
    for (size_t i = 0; i < host.size(); ++i) {
        if (host[i] == '.') starts.push_back(i + 1);
    }
    return starts;
}

} // namespace

PublicSuffixList PublicSuffixList::builtIn() {
    PublicSuffixList list;
    for (std::string_view rule : kBuiltInRules) {
        list.addRule(rule);
    }
    return list;
}

PublicSuffixList PublicSuffixList::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw PublicSuffixListError("Cannot open public suffix list " + path);
    }
    PublicSuffixList list = fromStream(in);
    if (list.ruleCount() == 0) {
        throw PublicSuffixListError("No rules found in public suffix list " + path);
    }
    LOG_DEBUG_STREAM("Loaded " << list.ruleCount() << " public suffix rules from " << path);
    return list;
}

PublicSuffixList PublicSuffixList::fromStream(std::istream& in) {
    PublicSuffixList list;
    std::string line;
    while (std::getline(in, line)) {
        list.addRule(line);
    }
    return list;
}

void PublicSuffixList::addRule(std::string_view line) {
    // A rule is the first whitespace-delimited token of the line
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) return;
    size_t end = line.find_first_of(" \t\r", begin);
    std::string_view rule = line.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);

    if (rule.substr(0, 2) == "//") return;

    if (rule.front() == '!') {
        if (rule.size() > 1) exception_.insert(toLowerAscii(rule.substr(1)));
    } else if (rule.substr(0, 2) == "*.") {
        if (rule.size() > 2) wildcard_.insert(toLowerAscii(rule.substr(2)));
    } else {
        exact_.insert(toLowerAscii(rule));
    }
}

std::optional<std::string> PublicSuffixList::publicSuffix(std::string_view rawHost) const {
    auto host = normalizeHost(rawHost);
    if (!host) return std::nullopt;

    const std::vector<size_t> starts = labelStarts(*host);

    // Exception rules take priority over every other rule
    for (size_t i = 0; i < starts.size(); ++i) {
        if (exception_.count(host->substr(starts[i]))) {
            if (i + 1 < starts.size()) return host->substr(starts[i + 1]);
            return std::nullopt;
        }
    }

    // Leftmost match is the longest one
    for (size_t i = 0; i < starts.size(); ++i) {
        std::string candidate = host->substr(starts[i]);
        if (exact_.count(candidate)) return candidate;
        if (i + 1 < starts.size() && wildcard_.count(host->substr(starts[i + 1]))) return candidate;
    }
    return std::nullopt;
}

std::optional<std::string> PublicSuffixList::registrableDomain(std::string_view rawHost) const {
    auto host = normalizeHost(rawHost);
    if (!host) return std::nullopt;

    auto suffix = publicSuffix(*host);
    if (!suffix || suffix->size() >= host->size()) {
        return std::nullopt;
    }

    // index of the dot separating the suffix from the label before it
    size_t separator = host->size() - suffix->size() - 1;
    if (separator == 0) return std::nullopt;
    size_t dot = host->rfind('.', separator - 1);
    size_t start = dot == std::string::npos ? 0 : dot + 1;
    return host->substr(start);
}

} // namespace crawl_summary::common
