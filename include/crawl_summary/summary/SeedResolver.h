#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "../log/CrawlRecord.h"

namespace crawl_summary::summary {

// One occurrence of a URL at a given position of the discovery graph
struct DiscoveryKey {
    std::string url;
    std::string discoveryPath;   // normalized, "" for seeds

    DiscoveryKey() = default;
    DiscoveryKey(std::string u, std::string_view path)
        : url(std::move(u)), discoveryPath(normalizePath(path)) {}

    static DiscoveryKey of(const log::CrawlRecord& record) {
        return DiscoveryKey(record.url, record.discoveryPath);
    }

    // "-" and "" both mean "no hops"
    static std::string normalizePath(std::string_view path) {
        return path == "-" ? std::string() : std::string(path);
    }

    bool isRoot() const { return discoveryPath.empty(); }

    // Path of the record that discovered this one: the last hop removed
    std::string parentPath() const {
        return isRoot() ? std::string() : discoveryPath.substr(0, discoveryPath.size() - 1);
    }

    std::string toString() const { return "{url='" + url + "', discoveryPath='" + discoveryPath + "'}"; }

    bool operator==(const DiscoveryKey& other) const {
        return url == other.url && discoveryPath == other.discoveryPath;
    }
    bool operator!=(const DiscoveryKey& other) const { return !(*this == other); }
};

struct DiscoveryKeyHash {
    size_t operator()(const DiscoveryKey& key) const {
        size_t h = std::hash<std::string>()(key.url);
        return h ^ (std::hash<std::string>()(key.discoveryPath) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

enum class ResolveOutcome {
    ALREADY_ROOT,
    RESOLVED,
    MISSING_PARENT,   // an ancestor was never logged; it became the root
    PATHOLOGICAL,     // depth ceiling hit; left pointing at a non-root ancestor
    UNKNOWN_KEY
};

struct ResolveReport {
    size_t keys = 0;
    size_t alreadyRoots = 0;
    size_t resolved = 0;
    size_t missingParents = 0;
    size_t pathological = 0;
};

/**
 * Discovery forest over every (URL, discovery path) pair of a crawl log.
 *
 * Build with add() over every record, call resolveAll() once, then query
 * seedFor(). After resolution every key maps straight to its root, except
 * keys stopped by the depth ceiling.
 */
class SeedResolver {
public:
    using ParentMap = std::unordered_map<DiscoveryKey, DiscoveryKey, DiscoveryKeyHash>;

    static constexpr size_t kDefaultMaxDepth = 50;

    explicit SeedResolver(size_t maxDepth = kDefaultMaxDepth) : maxDepth_(maxDepth) {}

    SeedResolver(const SeedResolver&) = delete;
    SeedResolver& operator=(const SeedResolver&) = delete;
    SeedResolver(SeedResolver&&) = default;
    SeedResolver& operator=(SeedResolver&&) = default;

    // Records the parent edge of record; a later record with the same key replaces it
    void add(const log::CrawlRecord& record);

    template <typename RecordRange>
    void addAll(RecordRange&& records) {
        for (const auto& record : records) {
            add(record);
        }
    }

    // Compresses every key's edge to point at its root
    ResolveReport resolveAll();

    // Compresses a single key's edge
    ResolveOutcome resolve(const DiscoveryKey& key);

    // Attributed seed URL, nullopt when key was never added
    std::optional<std::string> seedFor(const DiscoveryKey& key) const;

    std::optional<DiscoveryKey> parentOf(const DiscoveryKey& key) const;

    const ParentMap& parents() const { return parents_; }
    size_t size() const { return parents_.size(); }
    size_t maxDepth() const { return maxDepth_; }

private:
    ResolveOutcome compress(const DiscoveryKey& key, DiscoveryKey& target);

    size_t maxDepth_;
    ParentMap parents_;
};

} // namespace crawl_summary::summary
