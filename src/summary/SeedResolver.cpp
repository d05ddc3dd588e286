#include "../../include/crawl_summary/summary/SeedResolver.h"
#include "../../include/Logger.h"

namespace crawl_summary::summary {

void SeedResolver::add(const log::CrawlRecord& record) {
    DiscoveryKey key = DiscoveryKey::of(record);
    // A seed is its own root
    DiscoveryKey parent = key.isRoot() ? key : DiscoveryKey(record.parentUrl, key.parentPath());
    parents_.insert_or_assign(std::move(key), std::move(parent));
}

ResolveReport SeedResolver::resolveAll() {
    ResolveReport report;
    report.keys = parents_.size();

    LOG_INFO_STREAM("Resolving seeds for " << report.keys << " discovery keys");

    // Values are rewritten in place; no entries are added or removed, so the
    // iteration stays valid while earlier results shorten later walks.
    for (auto& [key, target] : parents_) {
        switch (compress(key, target)) {
            case ResolveOutcome::ALREADY_ROOT: ++report.alreadyRoots; break;
            case ResolveOutcome::RESOLVED: ++report.resolved; break;
            case ResolveOutcome::MISSING_PARENT: ++report.missingParents; break;
            case ResolveOutcome::PATHOLOGICAL: ++report.pathological; break;
            case ResolveOutcome::UNKNOWN_KEY: break;
        }
    }

    LOG_INFO_STREAM("Seed resolution done: " << report.alreadyRoots << " already roots, "
                    << report.resolved << " resolved, " << report.missingParents << " with missing ancestors, "
                    << report.pathological << " pathological");
    return report;
}

ResolveOutcome SeedResolver::resolve(const DiscoveryKey& key) {
    auto it = parents_.find(key);
    if (it == parents_.end()) {
        return ResolveOutcome::UNKNOWN_KEY;
    }
    return compress(it->first, it->second);
}

ResolveOutcome SeedResolver::compress(const DiscoveryKey& key, DiscoveryKey& target) {
    if (target.isRoot()) {
        return ResolveOutcome::ALREADY_ROOT;
    }

    size_t steps = 0;
    while (!target.isRoot()) {
        if (++steps > maxDepth_) {
            LOG_WARNING("Pathological discovery chain for " + key.toString() + ": stopped at " +
                        target.toString() + " after " + std::to_string(maxDepth_) + " steps");
            return ResolveOutcome::PATHOLOGICAL;
        }

        auto ancestor = parents_.find(target);
        if (ancestor == parents_.end()) {
            LOG_DEBUG("No record for ancestor " + target.toString() + " of " + key.toString() +
                      ", treating it as a seed");
            target = DiscoveryKey(target.url, "");
            return ResolveOutcome::MISSING_PARENT;
        }

        // Jump to the ancestor's own target, which may already be a root
        target = ancestor->second;
    }
    return ResolveOutcome::RESOLVED;
}

std::optional<std::string> SeedResolver::seedFor(const DiscoveryKey& key) const {
    auto it = parents_.find(key);
    if (it == parents_.end()) {
        return std::nullopt;
    }
    return it->second.url;
}

std::optional<DiscoveryKey> SeedResolver::parentOf(const DiscoveryKey& key) const {
    auto it = parents_.find(key);
    if (it == parents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace crawl_summary::summary
