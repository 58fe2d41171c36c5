/**
 * @file RateLimiter.cpp
 * @brief Implementation of RateLimiter.
 */

#include "infrastructure/RateLimiter.hpp"
#include <iostream>

namespace redline::infrastructure {

RateLimiter::RateLimiter(std::size_t limit, std::chrono::seconds window, std::size_t sweepThreshold)
    : m_limit(limit), m_window(window), m_sweepThreshold(sweepThreshold) {}

bool RateLimiter::tryAcquire(const std::string& clientKey, domain::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_windows.find(clientKey);
    if (it == m_windows.end() && m_windows.size() >= m_sweepThreshold) {
        std::size_t removed = sweepLocked(now);
        if (removed > 0) {
            std::cout << "[RateLimiter] Swept " << removed << " expired windows" << std::endl;
        }
    }
    if (it == m_windows.end() || now > it->second.resetAt) {
        m_windows[clientKey] = {1, now + m_window};
        return m_limit > 0;
    }
    if (it->second.count >= m_limit) {
        return false;
    }
    ++it->second.count;
    return true;
}

std::size_t RateLimiter::sweep(domain::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return sweepLocked(now);
}

std::size_t RateLimiter::sweepLocked(domain::Clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = m_windows.begin(); it != m_windows.end();) {
        if (now > it->second.resetAt) {
            it = m_windows.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t RateLimiter::trackedClients() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_windows.size();
}

} // namespace redline::infrastructure
