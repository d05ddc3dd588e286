#include "../../include/crawl_summary/log/CrawlLogReader.h"
#include "../../include/Logger.h"

#include <charconv>
#include <fstream>
#include <vector>

namespace crawl_summary::log {

namespace {

// Minimum fields up to and including the content digest
constexpr size_t kRequiredFields = 10;

enum Field : size_t {
    TIMESTAMP = 0,
    STATUS = 1,
    SIZE = 2,
    URL = 3,
    HOP_PATH = 4,
    VIA = 5,
    MIME = 6,
    THREAD = 7,
    FETCH_TIME = 8,
    DIGEST = 9
};

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = line.find_first_not_of(" \t\r", pos);
        if (start == std::string_view::npos) break;
        size_t end = line.find_first_of(" \t\r", start);
        if (end == std::string_view::npos) end = line.size();
        fields.push_back(line.substr(start, end - start));
        pos = end;
    }
    return fields;
}

template <typename T>
bool parseInteger(std::string_view text, T& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = first + text.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

std::string orEmpty(std::string_view field) {
    return field == "-" ? std::string() : std::string(field);
}

} // namespace

CrawlLogReader::CrawlLogReader(const std::string& path) : sourceName_(path) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        throw CrawlLogError("Cannot open crawl log " + path);
    }
    input_ = std::move(file);
}

CrawlLogReader::CrawlLogReader(std::unique_ptr<std::istream> input, std::string sourceName)
    : input_(std::move(input)), sourceName_(std::move(sourceName)) {
    if (!input_) {
        throw CrawlLogError("No input stream for " + sourceName_);
    }
}

std::optional<CrawlRecord> CrawlLogReader::next() {
    if (!input_) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(*input_, line)) {
        ++lineNumber_;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        auto record = parseLine(line);
        if (!record) {
            ++malformedLines_;
            LOG_WARNING_STREAM("Skipping malformed line " << lineNumber_ << " in " << sourceName_ << ": " << line);
            continue;
        }

        ++recordsRead_;
        return record;
    }

    if (input_->bad()) {
        throw CrawlLogError("Read error in " + sourceName_ + " after line " + std::to_string(lineNumber_));
    }

    // Exhausted: release the underlying file
    input_.reset();
    return std::nullopt;
}

std::optional<CrawlRecord> CrawlLogReader::parseLine(std::string_view line) {
    const auto fields = splitFields(line);
    if (fields.size() < kRequiredFields) {
        return std::nullopt;
    }

    CrawlRecord record;

    auto timestamp = common::parseIsoTimestamp(fields[TIMESTAMP]);
    if (!timestamp) {
        return std::nullopt;
    }
    record.timestamp = *timestamp;

    if (!parseInteger(fields[STATUS], record.statusCode)) {
        return std::nullopt;
    }

    if (fields[SIZE] != "-") {
        if (!parseInteger(fields[SIZE], record.size) || record.size < 0) {
            return std::nullopt;
        }
    }

    record.url = std::string(fields[URL]);
    record.discoveryPath = std::string(fields[HOP_PATH]);
    record.parentUrl = orEmpty(fields[VIA]);
    record.mimeType = std::string(fields[MIME]);
    record.digest = orEmpty(fields[DIGEST]);
    return record;
}

void CrawlLogReader::Iterator::advance() {
    if (!reader_) return;
    auto record = reader_->next();
    if (record) {
        current_ = std::move(*record);
    } else {
        reader_ = nullptr;
    }
}

} // namespace crawl_summary::log
