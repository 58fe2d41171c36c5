/**
 * @file AnalysisStores.hpp
 * @brief Storage interfaces shared by analysis requests: result cache and rate limits.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "Suggestion.hpp"

namespace redline::domain {

using Clock = std::chrono::steady_clock;

/**
 * @struct CacheKey
 * @brief Identity of an analysis request. The hash is the lookup key, text and level
 * are kept so that a hit can be verified byte for byte.
 */
struct CacheKey {
    std::string hash;
    std::string text;
    AnalysisLevel level = AnalysisLevel::Full;
};

/**
 * @class ResultStore
 * @brief Stores completed suggestion sets keyed by request content.
 */
class ResultStore {
public:
    virtual ~ResultStore() = default;

    /** @brief Returns the stored suggestions if the entry exists, matches exactly and is not expired. */
    virtual std::optional<SuggestionList> get(const CacheKey& key, Clock::time_point now) = 0;

    virtual void put(const CacheKey& key, const SuggestionList& suggestions, Clock::time_point now) = 0;
};

/**
 * @class RateLimitStore
 * @brief Per-client request budget.
 */
class RateLimitStore {
public:
    virtual ~RateLimitStore() = default;

    /** @brief Counts one request for the client. Returns false if the budget is exhausted. */
    virtual bool tryAcquire(const std::string& clientKey, Clock::time_point now) = 0;
};

} // namespace redline::domain
