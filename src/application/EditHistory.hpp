/**
 * @file EditHistory.hpp
 * @brief Debounced snapshot stack over the canonical text with undo/redo.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/AnalysisStores.hpp"
#include "domain/Suggestion.hpp"

namespace redline::application {

/**
 * @struct HistorySnapshot
 * @brief Text plus the suggestions that were active on it.
 */
struct HistorySnapshot {
    std::string text;
    domain::Clock::time_point timestamp;
    domain::SuggestionList suggestions;
};

/**
 * @class EditHistory
 * @brief Linear undo stack with a cursor.
 *
 * record() is debounced: a burst of edits becomes one checkpoint once input
 * pauses for the configured delay. push() bypasses the debounce. Committing a
 * snapshot while the cursor is not at the top truncates the redo branch.
 */
class EditHistory {
public:
    explicit EditHistory(std::chrono::milliseconds debounceDelay = std::chrono::milliseconds(1000),
                         std::size_t maxDepth = 200);

    /** @brief Starts the stack with its first snapshot, discarding everything else. */
    void reset(HistorySnapshot initial);

    /** @brief Schedules a checkpoint; replaces any pending one and restarts the delay. */
    void record(HistorySnapshot snapshot);

    /**
     * @brief Commits the pending checkpoint if its delay elapsed.
     * @return True if a checkpoint was committed.
     */
    bool poll(domain::Clock::time_point now);

    /** @brief Commits the pending checkpoint immediately, if any. */
    bool flush();

    void cancelPending() { m_pending.reset(); }
    bool hasPending() const { return m_pending.has_value(); }

    /** @brief Commits a checkpoint immediately (discrete user actions). */
    void push(HistorySnapshot snapshot);

    /** @brief Commits a distinct step even if the text equals the cursor's (an applied edit). */
    void pushStep(HistorySnapshot snapshot);

    /** @brief Replaces the suggestion set of the snapshot under the cursor. */
    void amendCurrent(const domain::SuggestionList& suggestions);

    /** @brief Replaces the suggestion set of the pending checkpoint, keeping its delay. */
    bool amendPending(const domain::SuggestionList& suggestions);

    /** @brief Moves the cursor back. Returns the snapshot at the new cursor. */
    std::optional<HistorySnapshot> undo();

    /** @brief Moves the cursor forward. Returns the snapshot at the new cursor. */
    std::optional<HistorySnapshot> redo();

    bool canUndo() const { return m_cursor > 0 && !m_stack.empty(); }
    bool canRedo() const { return !m_stack.empty() && m_cursor + 1 < m_stack.size(); }

    const HistorySnapshot* current() const;
    std::size_t size() const { return m_stack.size(); }
    std::size_t cursor() const { return m_cursor; }

private:
    bool commit(HistorySnapshot snapshot, bool allowSameText = false);

    std::chrono::milliseconds m_delay;
    std::size_t m_maxDepth;
    std::vector<HistorySnapshot> m_stack;
    std::size_t m_cursor = 0;
    std::optional<HistorySnapshot> m_pending;
};

} // namespace redline::application
