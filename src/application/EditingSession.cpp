/**
 * @file EditingSession.cpp
 * @brief Implementation of EditingSession.
 */

#include "application/EditingSession.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace redline::application {

EditingSession::EditingSession(std::string initialText, SessionSettings settings, domain::Clock::time_point now)
    : m_settings(settings),
      m_buffer(std::move(initialText)),
      m_history(settings.historyDebounce, settings.historyDepth),
      m_applyEngine(m_buffer, m_index, m_history) {
    m_history.reset({m_buffer.snapshot(), now, {}});
}

void EditingSession::replaceRange(std::size_t position, std::size_t length, const std::string& insertion,
                                  domain::Clock::time_point now) {
    if (position > m_buffer.size() || length > m_buffer.size() - position) {
        throw std::out_of_range("EditingSession edit range outside the text");
    }
    const std::size_t editEnd = position + length;
    const auto delta = static_cast<std::ptrdiff_t>(insertion.size()) - static_cast<std::ptrdiff_t>(length);

    m_buffer.splice(position, editEnd, insertion);
    m_index.evictOverlapping(position, editEnd);
    m_index.shift(editEnd, delta);

    m_history.record({m_buffer.snapshot(), now, m_index.all()});
    m_analysisDueAt = now + m_settings.analysisDebounce;
}

void EditingSession::setText(const std::string& newText, domain::Clock::time_point now) {
    const std::string& old = m_buffer.text();
    if (old == newText) {
        return;
    }
    std::size_t prefix = 0;
    const std::size_t shorter = std::min(old.size(), newText.size());
    while (prefix < shorter && old[prefix] == newText[prefix]) ++prefix;

    std::size_t suffix = 0;
    while (suffix < shorter - prefix &&
           old[old.size() - 1 - suffix] == newText[newText.size() - 1 - suffix]) {
        ++suffix;
    }

    replaceRange(prefix, old.size() - prefix - suffix,
                 newText.substr(prefix, newText.size() - prefix - suffix), now);
}

bool EditingSession::tick(domain::Clock::time_point now) {
    m_history.poll(now);
    if (m_analysisDueAt && now >= *m_analysisDueAt) {
        m_analysisDueAt.reset();
        return true;
    }
    return false;
}

AnalysisTicket EditingSession::beginAnalysis(domain::AnalysisLevel level) {
    AnalysisTicket ticket;
    ticket.sequence = ++m_lastSequence;
    ticket.version = m_buffer.version();
    ticket.text = m_buffer.snapshot();
    ticket.level = level;
    m_passHasResults = false;
    m_analysisDueAt.reset();
    return ticket;
}

bool EditingSession::isCurrent(const AnalysisTicket& ticket) const {
    return ticket.sequence == m_lastSequence && ticket.version == m_buffer.version();
}

bool EditingSession::acceptSuggestion(const AnalysisTicket& ticket, const domain::ResolvedSuggestion& suggestion) {
    if (!isCurrent(ticket)) {
        return false;
    }
    const domain::TextSpan& span = suggestion.span;
    if (span.start >= span.end || span.end > m_buffer.size() ||
        m_buffer.text().compare(span.start, span.length(), suggestion.originalLiteral) != 0) {
        std::cerr << "[EditingSession] Ignoring " << suggestion.id << ": range does not match the text" << std::endl;
        return false;
    }

    if (!m_passHasResults) {
        m_index.clear();
        m_passHasResults = true;
    }
    if (!m_index.insert(suggestion)) {
        return false;
    }
    syncHistorySuggestions();
    return true;
}

bool EditingSession::completeAnalysis(const AnalysisTicket& ticket) {
    if (!isCurrent(ticket)) {
        return false;
    }
    if (!m_passHasResults) {
        m_index.clear();
        syncHistorySuggestions();
    }
    return true;
}

ApplyResult EditingSession::apply(const std::string& suggestionId, domain::Clock::time_point now) {
    ApplyResult result = m_applyEngine.apply(suggestionId, now);
    if (result.status == ApplyStatus::Applied) {
        m_analysisDueAt.reset();
    }
    return result;
}

bool EditingSession::dismiss(const std::string& suggestionId) {
    if (!m_applyEngine.dismiss(suggestionId)) {
        return false;
    }
    syncHistorySuggestions();
    return true;
}

bool EditingSession::undo() {
    m_history.flush();
    auto snapshot = m_history.undo();
    if (!snapshot) {
        return false;
    }
    restore(*snapshot);
    return true;
}

bool EditingSession::redo() {
    m_history.flush();
    auto snapshot = m_history.redo();
    if (!snapshot) {
        return false;
    }
    restore(*snapshot);
    return true;
}

bool EditingSession::canUndo() const {
    return m_history.canUndo() || m_history.hasPending();
}

bool EditingSession::canRedo() const {
    return m_history.canRedo() && !m_history.hasPending();
}

void EditingSession::render(domain::OverlayRenderer& renderer, std::size_t visibleStart, std::size_t visibleEnd) const {
    const std::string& text = m_buffer.text();
    visibleEnd = std::min(visibleEnd, text.size());
    std::string_view view(text);

    renderer.beginDocument();
    for (const auto& segment : m_index.coveringSegments(visibleStart, visibleEnd)) {
        renderer.drawSegment(view.substr(segment.span.start, segment.span.length()), segment);
    }
    renderer.endDocument();
}

void EditingSession::restore(const HistorySnapshot& snapshot) {
    m_buffer.assign(snapshot.text);
    m_index.replaceAll(snapshot.suggestions);
    m_analysisDueAt.reset();
}

void EditingSession::syncHistorySuggestions() {
    // Typing still settling: the pending checkpoint carries the suggestions.
    if (m_history.amendPending(m_index.all())) {
        return;
    }
    const HistorySnapshot* current = m_history.current();
    if (current && current->text == m_buffer.text()) {
        m_history.amendCurrent(m_index.all());
    }
}

} // namespace redline::application
