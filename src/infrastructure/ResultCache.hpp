/**
 * @file ResultCache.hpp
 * @brief In-memory, TTL-bounded store of completed analysis results.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include "domain/AnalysisStores.hpp"

namespace redline::infrastructure {

/**
 * @class ResultCache
 * @brief Maps request content to the suggestion set of its last completed pass.
 *
 * Entries live for the TTL. Once the map grows past the sweep threshold every
 * put() purges expired entries first. Thread-safe.
 */
class ResultCache : public domain::ResultStore {
public:
    explicit ResultCache(std::chrono::seconds ttl = std::chrono::minutes(15),
                         std::size_t sweepThreshold = 500);

    std::optional<domain::SuggestionList> get(const domain::CacheKey& key, domain::Clock::time_point now) override;
    void put(const domain::CacheKey& key, const domain::SuggestionList& suggestions, domain::Clock::time_point now) override;

    /** @brief Drops every expired entry; returns how many were removed. */
    std::size_t sweep(domain::Clock::time_point now);

    std::size_t size() const;

private:
    struct CacheEntry {
        std::string text;
        domain::AnalysisLevel level;
        domain::SuggestionList suggestions;
        domain::Clock::time_point storedAt;
    };

    bool expired(const CacheEntry& entry, domain::Clock::time_point now) const;
    std::size_t sweepLocked(domain::Clock::time_point now);

    std::chrono::seconds m_ttl;
    std::size_t m_sweepThreshold;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, CacheEntry> m_entries;
};

} // namespace redline::infrastructure
