#pragma once

#include <cstdint>
#include <string>

namespace crawl_summary::summary {

/**
 * Histogram boundary for a byte count: 8^(ceil(log8(size)) + 1).
 * Sizes of zero (or less) fall in bucket 0. The boundary is computed in
 * double precision, exactly as the existing reports were produced, so bucket
 * values stay comparable across runs.
 */
int64_t sizeBucket(int64_t size);

/**
 * "<n> B" below 1024, otherwise the integral value in the largest binary
 * unit not exceeding it, e.g. "4 KiB", "2 MiB".
 */
std::string humanSize(int64_t bytes);

} // namespace crawl_summary::summary
