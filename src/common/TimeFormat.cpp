#include "../../include/crawl_summary/common/TimeFormat.h"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace crawl_summary::common {

namespace {

bool readNumber(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    const char* first = text.data() + pos;
    const char* last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

std::optional<Timestamp> parseIsoTimestamp(std::string_view text) {
    using namespace std::chrono;

    if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readNumber(text, 0, 4, y) || !readNumber(text, 5, 2, mo) || !readNumber(text, 8, 2, d) ||
        !readNumber(text, 11, 2, h) || !readNumber(text, 14, 2, mi) || !readNumber(text, 17, 2, s)) {
        return std::nullopt;
    }

    size_t pos = 19;
    int millis = 0;
    if (text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t k = digits; k < 3; ++k) millis *= 10;
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }

    return sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + milliseconds{millis};
}

std::string formatIsoTimestamp(Timestamp time) {
    using namespace std::chrono;

    auto ms = floor<milliseconds>(time);
    auto dayPoint = floor<days>(ms);
    year_month_day ymd{dayPoint};
    hh_mm_ss<milliseconds> hms{ms - dayPoint};

    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << static_cast<int>(ymd.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
       << std::setw(2) << hms.hours().count() << ':'
       << std::setw(2) << hms.minutes().count() << ':'
       << std::setw(2) << hms.seconds().count() << '.'
       << std::setw(3) << hms.subseconds().count() << 'Z';
    return ss.str();
}

} // namespace crawl_summary::common
