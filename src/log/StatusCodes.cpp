#include "../../include/crawl_summary/log/StatusCodes.h"

namespace crawl_summary::log {

std::string describeStatusCode(int code) {
    switch (code) {
        // Crawler-internal outcomes
        case 1: return "Successful DNS lookup";
        case 0: return "Fetch never tried";
        case -1: return "DNS lookup failed";
        case -2: return "HTTP connect failed";
        case -3: return "HTTP connect broken";
        case -4: return "HTTP timeout";
        case -5: return "Unexpected runtime exception";
        case -6: return "Prerequisite domain-lookup failed";
        case -7: return "URI recognized as unsupported or illegal";
        case -8: return "Multiple retries failed";
        case -50: return "Temporary status assigned to URIs awaiting preconditions";
        case -60: return "URIs assigned a failure status that could not be queued";
        case -61: return "Prerequisite robots.txt fetch failed";
        case -62: return "Some other prerequisite failed";
        case -63: return "A prerequisite could not be scheduled";
        case -404: return "Empty HTTP response";
        case -3000: return "Severe Java error condition";
        case -4000: return "Chaff detection of traps/content with negligible value";
        case -4001: return "Too many link hops away from seed";
        case -4002: return "Too many embed/transitive hops away from last URI in scope";
        case -5000: return "Out of scope upon reexamination";
        case -5001: return "Blocked from fetch by user setting";
        case -5002: return "Blocked by a custom processor";
        case -5003: return "Blocked due to exceeding an established quota";
        case -5004: return "Blocked due to exceeding an established runtime";
        case -6000: return "Deleted from frontier by user";
        case -7000: return "Processing thread was killed by the operator";
        case -9998: return "Robots.txt rules precluded fetch";

        // HTTP
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 305: return "Use Proxy";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 418: return "I'm a teapot";
        case 421: return "Misdirected Request";
        case 422: return "Unprocessable Entity";
        case 423: return "Locked";
        case 425: return "Too Early";
        case 426: return "Upgrade Required";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        case 507: return "Insufficient Storage";
        case 508: return "Loop Detected";
        case 511: return "Network Authentication Required";
        default: return "Unknown status code " + std::to_string(code);
    }
}

} // namespace crawl_summary::log
