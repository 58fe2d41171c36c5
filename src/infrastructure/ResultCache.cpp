/**
 * @file ResultCache.cpp
 * @brief Implementation of ResultCache.
 */

#include "infrastructure/ResultCache.hpp"
#include <iostream>

namespace redline::infrastructure {

ResultCache::ResultCache(std::chrono::seconds ttl, std::size_t sweepThreshold)
    : m_ttl(ttl), m_sweepThreshold(sweepThreshold) {}

std::optional<domain::SuggestionList> ResultCache::get(const domain::CacheKey& key, domain::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key.hash);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    if (expired(it->second, now)) {
        m_entries.erase(it);
        return std::nullopt;
    }
    // Hash collisions must not replay another document's suggestions.
    if (it->second.text != key.text || it->second.level != key.level) {
        return std::nullopt;
    }
    return it->second.suggestions;
}

void ResultCache::put(const domain::CacheKey& key, const domain::SuggestionList& suggestions, domain::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.size() > m_sweepThreshold) {
        std::size_t removed = sweepLocked(now);
        if (removed > 0) {
            std::cout << "[ResultCache] Swept " << removed << " expired entries" << std::endl;
        }
    }
    m_entries[key.hash] = {key.text, key.level, suggestions, now};
}

std::size_t ResultCache::sweep(domain::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return sweepLocked(now);
}

std::size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool ResultCache::expired(const CacheEntry& entry, domain::Clock::time_point now) const {
    return now - entry.storedAt >= m_ttl;
}

std::size_t ResultCache::sweepLocked(domain::Clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (expired(it->second, now)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace redline::infrastructure
