/**
 * @file EditHistory.cpp
 * @brief Implementation of EditHistory.
 */

#include "application/EditHistory.hpp"
#include <utility>

namespace redline::application {

EditHistory::EditHistory(std::chrono::milliseconds debounceDelay, std::size_t maxDepth)
    : m_delay(debounceDelay), m_maxDepth(maxDepth == 0 ? 1 : maxDepth) {}

void EditHistory::reset(HistorySnapshot initial) {
    m_stack.clear();
    m_stack.push_back(std::move(initial));
    m_cursor = 0;
    m_pending.reset();
}

void EditHistory::record(HistorySnapshot snapshot) {
    m_pending = std::move(snapshot);
}

bool EditHistory::poll(domain::Clock::time_point now) {
    if (!m_pending || now - m_pending->timestamp < m_delay) {
        return false;
    }
    return flush();
}

bool EditHistory::flush() {
    if (!m_pending) {
        return false;
    }
    HistorySnapshot snapshot = std::move(*m_pending);
    m_pending.reset();
    return commit(std::move(snapshot));
}

void EditHistory::push(HistorySnapshot snapshot) {
    m_pending.reset();
    if (!commit(snapshot)) {
        // Same text as the cursor: keep the step, refresh what it remembers.
        amendCurrent(snapshot.suggestions);
    }
}

void EditHistory::pushStep(HistorySnapshot snapshot) {
    m_pending.reset();
    commit(std::move(snapshot), true);
}

void EditHistory::amendCurrent(const domain::SuggestionList& suggestions) {
    if (!m_stack.empty()) {
        m_stack[m_cursor].suggestions = suggestions;
    }
}

bool EditHistory::amendPending(const domain::SuggestionList& suggestions) {
    if (!m_pending) {
        return false;
    }
    m_pending->suggestions = suggestions;
    return true;
}

std::optional<HistorySnapshot> EditHistory::undo() {
    if (!canUndo()) {
        return std::nullopt;
    }
    --m_cursor;
    return m_stack[m_cursor];
}

std::optional<HistorySnapshot> EditHistory::redo() {
    if (!canRedo()) {
        return std::nullopt;
    }
    ++m_cursor;
    return m_stack[m_cursor];
}

const HistorySnapshot* EditHistory::current() const {
    return m_stack.empty() ? nullptr : &m_stack[m_cursor];
}

bool EditHistory::commit(HistorySnapshot snapshot, bool allowSameText) {
    if (!allowSameText && !m_stack.empty() && m_stack[m_cursor].text == snapshot.text) {
        return false;
    }
    if (!m_stack.empty()) {
        m_stack.erase(m_stack.begin() + static_cast<std::ptrdiff_t>(m_cursor) + 1, m_stack.end());
    }
    m_stack.push_back(std::move(snapshot));
    if (m_stack.size() > m_maxDepth) {
        m_stack.erase(m_stack.begin(), m_stack.begin() + static_cast<std::ptrdiff_t>(m_stack.size() - m_maxDepth));
    }
    m_cursor = m_stack.size() - 1;
    return true;
}

} // namespace redline::application
