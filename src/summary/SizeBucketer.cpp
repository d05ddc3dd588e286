#include "../../include/crawl_summary/summary/SizeBucketer.h"

#include <cmath>
#include <limits>

namespace crawl_summary::summary {

int64_t sizeBucket(int64_t size) {
    if (size <= 0) {
        return 0;
    }
    const double exponent = std::ceil(std::log(static_cast<double>(size)) / std::log(8.0)) + 1;
    const double bucket = std::pow(8.0, exponent);
    if (bucket >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(bucket);
}

std::string humanSize(int64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    static constexpr const char* kUnits = "KMGTPE";
    const int e = static_cast<int>(std::log(static_cast<double>(bytes)) / std::log(1024.0));
    const auto value = static_cast<int64_t>(static_cast<double>(bytes) / std::pow(1024.0, e));
    return std::to_string(value) + " " + kUnits[e - 1] + "iB";
}

} // namespace crawl_summary::summary
