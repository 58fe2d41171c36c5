/**
 * @file RateLimiter.hpp
 * @brief Fixed-window per-client request budget.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include "domain/AnalysisStores.hpp"

namespace redline::infrastructure {

/**
 * @class RateLimiter
 * @brief Allows `limit` requests per client per window; the window opens on the first request.
 *
 * Expired windows are purged once more than `sweepThreshold` clients are tracked.
 */
class RateLimiter : public domain::RateLimitStore {
public:
    explicit RateLimiter(std::size_t limit = 120,
                         std::chrono::seconds window = std::chrono::hours(1),
                         std::size_t sweepThreshold = 500);

    bool tryAcquire(const std::string& clientKey, domain::Clock::time_point now) override;

    /** @brief Drops every expired window. Returns how many were removed. */
    std::size_t sweep(domain::Clock::time_point now);

    std::size_t trackedClients() const;

private:
    struct Window {
        std::size_t count = 0;
        domain::Clock::time_point resetAt;
    };

    std::size_t sweepLocked(domain::Clock::time_point now);

    std::size_t m_limit;
    std::chrono::seconds m_window;
    std::size_t m_sweepThreshold;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Window> m_windows;
};

} // namespace redline::infrastructure
