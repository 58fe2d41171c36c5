/**
 * @file AnalysisPipeline.hpp
 * @brief One analysis pass: model stream in, resolved suggestions out.
 */

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include "application/SpanResolver.hpp"
#include "application/StreamDecoder.hpp"
#include "domain/Suggestion.hpp"

namespace redline::application {

/**
 * @class AnalysisPipeline
 * @brief StreamDecoder -> CandidateValidator -> SpanResolver over a fixed text snapshot.
 *
 * The used-anchor set lives as long as the pass, so duplicate proposals consume
 * successive occurrences.
 */
class AnalysisPipeline {
public:
    explicit AnalysisPipeline(std::string text);

    /** @brief Feeds one stream fragment; returns the suggestions it completed. */
    domain::SuggestionList feed(std::string_view chunk);

    /** @brief Ends the stream and returns whatever the decoder could still recover. */
    domain::SuggestionList finish();

    /** @brief Anchors one candidate; std::nullopt when its literal cannot be placed. */
    std::optional<domain::ResolvedSuggestion> resolve(const domain::CorrectionCandidate& candidate);

    const std::string& text() const { return m_text; }
    const StreamDecoder& decoder() const { return m_decoder; }
    std::size_t resolvedCount() const { return m_resolved; }
    std::size_t unresolvedCount() const { return m_unresolved; }

    /** @brief Builds the stable id "<type>-<start>-<originalLiteral>". */
    static std::string MakeSuggestionId(domain::SuggestionType kind, std::size_t start, const std::string& literal);

private:
    domain::SuggestionList resolveAll(const std::vector<domain::CorrectionCandidate>& candidates);

    std::string m_text;
    StreamDecoder m_decoder;
    SpanResolver m_resolver;
    AnchorSet m_usedAnchors;
    std::size_t m_resolved = 0;
    std::size_t m_unresolved = 0;
};

} // namespace redline::application
