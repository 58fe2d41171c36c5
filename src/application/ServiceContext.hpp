/**
 * @file ServiceContext.hpp
 * @brief Shared state injected into request handlers: result cache, rate limits and clock.
 */

#pragma once

#include <functional>
#include <memory>
#include "domain/AnalysisStores.hpp"

namespace redline::application {

/**
 * @struct ServiceContext
 * @brief Container for the stores a GrammarCheckService shares across requests.
 */
struct ServiceContext {
    std::shared_ptr<domain::ResultStore> resultStore;
    std::shared_ptr<domain::RateLimitStore> rateLimiter;
    std::function<domain::Clock::time_point()> clock = [] { return domain::Clock::now(); };
};

} // namespace redline::application
