/**
 * @file ProposalSource.hpp
 * @brief Interface for the generative model that streams correction proposals.
 */

#pragma once
#include <functional>
#include <string>
#include "Suggestion.hpp"

namespace redline::domain {

/**
 * @enum StreamStatus
 * @brief How an upstream proposal stream ended.
 */
enum class StreamStatus {
    Completed, ///< Upstream closed the stream normally.
    Failed,    ///< Network or model error; data already delivered stays valid.
    Cancelled  ///< The consumer stopped reading.
};

/**
 * @class ProposalSource
 * @brief Abstract upstream that turns a text into a stream of near-JSON proposal records.
 */
class ProposalSource {
public:
    /** @brief Receives one raw text fragment; return false to stop the stream. */
    using ChunkCallback = std::function<bool(const std::string& chunk)>;

    virtual ~ProposalSource() = default;

    /** @brief False when the source lacks the settings it needs (e.g. no model name). */
    virtual bool isConfigured() const = 0;

    /** @brief Reachability check done before a stream is opened. */
    virtual bool isReachable() = 0;

    /**
     * @brief Streams proposals for the text.
     * @param text The document text to analyze.
     * @param level Requested analysis depth.
     * @param onChunk Called for every fragment, in arrival order. Fragments need not
     *        align with record boundaries.
     */
    virtual StreamStatus streamProposals(const std::string& text,
                                         AnalysisLevel level,
                                         const ChunkCallback& onChunk) = 0;
};

} // namespace redline::domain
