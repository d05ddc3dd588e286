#include "../../include/crawl_summary/log/MimeTypes.h"
#include "../../include/crawl_summary/common/UrlUtils.h"

namespace crawl_summary::log {

std::string canonicalizeMimeType(std::string_view mimeType) {
    if (size_t semicolon = mimeType.find(';'); semicolon != std::string_view::npos) {
        mimeType = mimeType.substr(0, semicolon);
    }

    size_t begin = mimeType.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return "unknown";
    }
    size_t end = mimeType.find_last_not_of(" \t\r\n");
    mimeType = mimeType.substr(begin, end - begin + 1);

    if (mimeType == "-") {
        return "unknown";
    }
    return common::toLowerAscii(mimeType);
}

} // namespace crawl_summary::log
