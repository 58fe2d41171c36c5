/**
 * @file ApplyEngine.cpp
 * @brief Implementation of ApplyEngine.
 */

#include "application/ApplyEngine.hpp"
#include <iostream>

namespace redline::application {

ApplyEngine::ApplyEngine(domain::TextBuffer& buffer, SuggestionIndex& index, EditHistory& history)
    : m_buffer(buffer), m_index(index), m_history(history) {}

ApplyResult ApplyEngine::apply(const std::string& suggestionId, domain::Clock::time_point now) {
    ApplyResult result;

    const domain::ResolvedSuggestion* found = m_index.find(suggestionId);
    if (!found) {
        result.status = ApplyStatus::NotFound;
        return result;
    }
    const domain::ResolvedSuggestion suggestion = *found;
    const domain::TextSpan span = suggestion.span;

    if (span.end > m_buffer.size() ||
        m_buffer.text().compare(span.start, span.length(), suggestion.originalLiteral) != 0) {
        std::cerr << "[ApplyEngine] Suggestion " << suggestionId
                  << " no longer matches the text; evicting." << std::endl;
        m_index.remove(suggestionId);
        result.status = ApplyStatus::Stale;
        return result;
    }

    checkpointBeforeApply(now);

    result.replaced = span;
    result.replacement = PreserveEdgeSpaces(suggestion.originalLiteral, suggestion.suggestedLiteral);
    result.delta = static_cast<std::ptrdiff_t>(result.replacement.size()) -
                   static_cast<std::ptrdiff_t>(span.length());

    m_buffer.splice(span.start, span.end, result.replacement);

    result.removed = m_index.removeRange(span.start, span.end);
    result.evicted = m_index.evictOverlapping(span.start, span.end);
    result.shifted = m_index.shift(span.end, result.delta);

    m_history.pushStep({m_buffer.snapshot(), now, m_index.all()});

    result.status = ApplyStatus::Applied;
    return result;
}

bool ApplyEngine::dismiss(const std::string& suggestionId) {
    return m_index.remove(suggestionId);
}

std::string ApplyEngine::PreserveEdgeSpaces(const std::string& originalLiteral, std::string replacement) {
    if (!originalLiteral.empty() && originalLiteral.front() == ' ' &&
        (replacement.empty() || replacement.front() != ' ')) {
        replacement.insert(replacement.begin(), ' ');
    }
    if (!originalLiteral.empty() && originalLiteral.back() == ' ' &&
        (replacement.empty() || replacement.back() != ' ')) {
        replacement.push_back(' ');
    }
    return replacement;
}

void ApplyEngine::checkpointBeforeApply(domain::Clock::time_point now) {
    // Typing that has not settled yet becomes its own undo step.
    m_history.flush();
    const HistorySnapshot* current = m_history.current();
    if (!current || current->text != m_buffer.text()) {
        m_history.push({m_buffer.snapshot(), now, m_index.all()});
    } else {
        m_history.amendCurrent(m_index.all());
    }
}

} // namespace redline::application
