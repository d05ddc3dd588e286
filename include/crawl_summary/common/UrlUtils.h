#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace crawl_summary::common {

enum class UrlParseStatus {
    OK,
    MALFORMED,   // rejected by the URL parser (illegal characters, bad port, ...)
    NO_HOST      // parsed, but carries no host component
};

struct ParsedUrl {
    UrlParseStatus status = UrlParseStatus::MALFORMED;
    std::string scheme;
    std::string host;
    int parserCode = 0;  // CURLUcode reported by libcurl, 0 on success
};

// Parse an absolute URL with libcurl's URL API. Schemes libcurl does not
// support (ftp-like pseudo schemes, whois, ...) are accepted.
ParsedUrl parseUrl(const std::string& url);

// RFC 3986 scheme of the URL, lowercased. Works on strings libcurl rejects,
// including opaque forms such as "dns:example.com".
std::optional<std::string> urlScheme(std::string_view url);

// Best-effort authority extraction used when the URL parser gives up:
// splits on '/' and returns the third segment with userinfo and port removed.
// Returns an empty string when there is no such segment.
std::string authorityFallback(std::string_view url);

// Lowercased host of the URL, falling back to authorityFallback() when the
// parser rejects it. Empty when neither finds one.
std::string hostOf(const std::string& url);

// True for dotted-quad IPv4 literals and bracketed IPv6 literals.
bool isIpLiteral(std::string_view host);

std::string toLowerAscii(std::string_view input);

// Produce a compact hex dump of the given string for logging/debugging.
// Example: "68 74 74 70 73 3a 2f ..."
std::string hexDump(const std::string& input);

} // namespace crawl_summary::common
