#include "../../include/crawl_summary/common/UrlUtils.h"

#include <curl/curl.h>

#include <cctype>
#include <memory>
#include <sstream>

namespace crawl_summary::common {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};
using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
    void operator()(char* str) const { curl_free(str); }
};
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

bool isSchemeChar(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

bool isAllDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl result;

    CurlUrlHandle handle(curl_url());
    if (!handle) {
        result.parserCode = CURLUE_OUT_OF_MEMORY;
        return result;
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        result.parserCode = static_cast<int>(rc);
        return result;
    }

    char* raw = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_SCHEME, &raw, 0) == CURLUE_OK && raw) {
        CurlString scheme(raw);
        result.scheme = toLowerAscii(scheme.get());
    }

    raw = nullptr;
    rc = curl_url_get(handle.get(), CURLUPART_HOST, &raw, 0);
    CurlString host(raw);
    if (rc != CURLUE_OK || !host) {
        result.status = UrlParseStatus::NO_HOST;
        result.parserCode = static_cast<int>(rc);
        return result;
    }

    result.host = host.get();
    result.status = result.host.empty() ? UrlParseStatus::NO_HOST : UrlParseStatus::OK;
    return result;
}

std::optional<std::string> urlScheme(std::string_view url) {
    if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0]))) {
        return std::nullopt;
    }
    for (size_t i = 1; i < url.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (c == ':') {
            return toLowerAscii(url.substr(0, i));
        }
        if (!isSchemeChar(c)) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string authorityFallback(std::string_view url) {
    // "scheme:" "" "authority" ...
    size_t segment = 0;
    size_t start = 0;
    while (segment < 2) {
        size_t slash = url.find('/', start);
        if (slash == std::string_view::npos) return "";
        start = slash + 1;
        ++segment;
    }
    size_t end = url.find('/', start);
    std::string_view authority = url.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);

    if (size_t at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close != std::string_view::npos) {
            authority = authority.substr(0, close + 1);
        }
    } else if (size_t colon = authority.find(':'); colon != std::string_view::npos) {
        authority = authority.substr(0, colon);
    }
    return std::string(authority);
}

std::string hostOf(const std::string& url) {
    ParsedUrl parsed = parseUrl(url);
    if (parsed.status == UrlParseStatus::OK) {
        return toLowerAscii(parsed.host);
    }
    return toLowerAscii(authorityFallback(url));
}

bool isIpLiteral(std::string_view host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return true;
    }

    int parts = 0;
    size_t start = 0;
    while (start <= host.size()) {
        size_t dot = host.find('.', start);
        std::string_view part = host.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (part.size() > 3 || !isAllDigits(part) || std::stoi(std::string(part)) > 255) {
            return false;
        }
        ++parts;
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return parts == 4;
}

std::string toLowerAscii(std::string_view input) {
    std::string out(input);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

} // namespace crawl_summary::common
