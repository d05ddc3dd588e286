#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include "CrawlRecord.h"

namespace crawl_summary::log {

struct CrawlLogError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Single-pass reader over a Heritrix crawl.log. Owns its input stream; open a
 * new reader for every pass over the same file.
 *
 * Malformed lines are skipped with a warning and counted; blank lines are
 * skipped silently.
 */
class CrawlLogReader {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = CrawlRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const CrawlRecord*;
        using reference = const CrawlRecord&;

        Iterator() = default;
        explicit Iterator(CrawlLogReader* reader) : reader_(reader) { advance(); }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const Iterator& other) const { return reader_ == other.reader_; }
        bool operator!=(const Iterator& other) const { return reader_ != other.reader_; }

    private:
        void advance();

        CrawlLogReader* reader_ = nullptr;
        CrawlRecord current_;
    };

    // Opens path for reading. Throws CrawlLogError if it cannot be opened.
    explicit CrawlLogReader(const std::string& path);

    CrawlLogReader(std::unique_ptr<std::istream> input, std::string sourceName);

    CrawlLogReader(const CrawlLogReader&) = delete;
    CrawlLogReader& operator=(const CrawlLogReader&) = delete;

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

    // Next well-formed record, or nullopt at end of input
    std::optional<CrawlRecord> next();

    size_t recordsRead() const { return recordsRead_; }
    size_t malformedLines() const { return malformedLines_; }
    size_t lineNumber() const { return lineNumber_; }
    const std::string& sourceName() const { return sourceName_; }

    // Parses a single crawl.log line; nullopt if the line is malformed
    static std::optional<CrawlRecord> parseLine(std::string_view line);

private:
    std::unique_ptr<std::istream> input_;
    std::string sourceName_;
    size_t lineNumber_ = 0;
    size_t recordsRead_ = 0;
    size_t malformedLines_ = 0;
};

} // namespace crawl_summary::log
