/**
 * @file AnalysisPipeline.cpp
 * @brief Implementation of AnalysisPipeline.
 */

#include "application/AnalysisPipeline.hpp"
#include <utility>

namespace redline::application {

namespace {
constexpr int kStreamedConfidence = 95;
const char* const kDefaultDescription = "A suggestion for improvement.";
} // namespace

AnalysisPipeline::AnalysisPipeline(std::string text) : m_text(std::move(text)) {}

domain::SuggestionList AnalysisPipeline::feed(std::string_view chunk) {
    return resolveAll(m_decoder.feed(chunk));
}

domain::SuggestionList AnalysisPipeline::finish() {
    return resolveAll(m_decoder.finish());
}

std::optional<domain::ResolvedSuggestion> AnalysisPipeline::resolve(const domain::CorrectionCandidate& candidate) {
    auto match = m_resolver.resolve(m_text, candidate.originalLiteral, m_usedAnchors);
    if (!match) {
        ++m_unresolved;
        return std::nullopt;
    }

    domain::ResolvedSuggestion suggestion;
    suggestion.span = match->span;
    suggestion.kind = candidate.kind;
    suggestion.originalLiteral = match->literal;
    suggestion.suggestedLiteral = candidate.suggestedLiteral;
    if (match->pass == SpanMatch::Pass::Trimmed) {
        // Trim the replacement on the same sides so the edit stays local to the match.
        std::string& replacement = suggestion.suggestedLiteral;
        std::size_t lead = 0;
        while (lead < match->trimmedLeading && lead < replacement.size() &&
               (replacement[lead] == ' ' || replacement[lead] == '\t' || replacement[lead] == '\n' || replacement[lead] == '\r')) {
            ++lead;
        }
        replacement.erase(0, lead);
        std::size_t trail = 0;
        while (trail < match->trimmedTrailing && trail < replacement.size()) {
            char ch = replacement[replacement.size() - 1 - trail];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') break;
            ++trail;
        }
        replacement.erase(replacement.size() - trail);
    }
    suggestion.explanation = candidate.explanation.empty() ? kDefaultDescription : candidate.explanation;
    suggestion.priority = domain::SuggestionPriority(candidate.kind);
    suggestion.confidence = kStreamedConfidence;
    suggestion.title = domain::SuggestionTitle(candidate.kind);
    suggestion.icon = domain::SuggestionIcon(candidate.kind);
    // The id names the literal the model proposed, as the wire record does.
    suggestion.id = MakeSuggestionId(candidate.kind, match->span.start, candidate.originalLiteral);

    ++m_resolved;
    return suggestion;
}

std::string AnalysisPipeline::MakeSuggestionId(domain::SuggestionType kind, std::size_t start, const std::string& literal) {
    return domain::SuggestionTypeToString(kind) + "-" + std::to_string(start) + "-" + literal;
}

domain::SuggestionList AnalysisPipeline::resolveAll(const std::vector<domain::CorrectionCandidate>& candidates) {
    domain::SuggestionList out;
    for (const auto& candidate : candidates) {
        if (auto suggestion = resolve(candidate)) {
            out.push_back(std::move(*suggestion));
        }
    }
    return out;
}

} // namespace redline::application
