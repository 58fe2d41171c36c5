/**
 * @file GrammarCheckService.hpp
 * @brief Request-level orchestration of an analysis: admission, cache, upstream stream, NDJSON out.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "application/ServiceContext.hpp"
#include "domain/ProposalSource.hpp"
#include "domain/Suggestion.hpp"

namespace redline::application {

/**
 * @struct CheckRequest
 * @brief A parsed analysis request.
 */
struct CheckRequest {
    std::string text;
    domain::AnalysisLevel level = domain::AnalysisLevel::Full;
    std::string clientKey = "unknown";
};

/**
 * @struct CheckAdmission
 * @brief Outcome of the checks done before any byte of the response is sent.
 */
struct CheckAdmission {
    int status = 200;
    std::string message;
    domain::CacheKey key;
    std::optional<domain::SuggestionList> cached; ///< Set on a cache hit.

    bool admitted() const { return status == 200; }
    bool cacheHit() const { return cached.has_value(); }
};

/**
 * @class GrammarCheckService
 * @brief Streams resolved suggestions for one request, replaying or filling the result cache.
 */
class GrammarCheckService {
public:
    /** @brief Receives one NDJSON line (terminated by '\n'); return false to stop. */
    using LineSink = std::function<bool(const std::string& line)>;

    GrammarCheckService(std::shared_ptr<domain::ProposalSource> source, ServiceContext context);

    /**
     * @brief Parses a JSON request body.
     * @param error Receives the reason on failure.
     * @return std::nullopt for invalid JSON, a non-string text or an unknown level.
     */
    static std::optional<CheckRequest> ParseRequest(const std::string& body,
                                                    const std::string& clientKey,
                                                    std::string& error);

    /** @brief X-Forwarded-For, then X-Real-IP, else "unknown". */
    static std::string ClientKey(const std::string& forwardedFor, const std::string& realIp);

    /** @brief Key over the exact text and level. */
    static domain::CacheKey MakeCacheKey(const std::string& text, domain::AnalysisLevel level);

    /**
     * @brief Decides the response status.
     *
     * Order: missing model (500), empty text (400), rate limit (429), cache hit,
     * unreachable upstream (500). Counts one request against the client's budget.
     */
    CheckAdmission admit(const CheckRequest& request);

    /**
     * @brief Writes the response lines of an admitted request.
     *
     * A hit replays the cached set. A miss streams from the source and caches the
     * full set only when the upstream completed.
     * @return Stream outcome; Completed for a replayed hit.
     */
    domain::StreamStatus run(const CheckRequest& request, const CheckAdmission& admission, const LineSink& sink);

private:
    std::shared_ptr<domain::ProposalSource> m_source;
    ServiceContext m_context;
};

} // namespace redline::application
