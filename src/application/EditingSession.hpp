/**
 * @file EditingSession.hpp
 * @brief Single-editor session: canonical text, live suggestions, history and analysis bookkeeping.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "application/ApplyEngine.hpp"
#include "application/EditHistory.hpp"
#include "application/SuggestionIndex.hpp"
#include "domain/OverlayRenderer.hpp"
#include "domain/TextBuffer.hpp"

namespace redline::application {

/**
 * @struct SessionSettings
 * @brief Timing knobs of an editing session.
 */
struct SessionSettings {
    std::chrono::milliseconds historyDebounce{1000};
    std::chrono::milliseconds analysisDebounce{2000};
    std::size_t historyDepth = 200;
};

/**
 * @struct AnalysisTicket
 * @brief Tags an analysis pass with the buffer version it was issued against.
 */
struct AnalysisTicket {
    std::uint64_t sequence = 0;
    std::uint64_t version = 0;
    std::string text;
    domain::AnalysisLevel level = domain::AnalysisLevel::Full;
};

/**
 * @class EditingSession
 * @brief Owns the TextBuffer and keeps index, history and overlay consistent with it.
 *
 * All methods are meant to run on one thread (the UI/event thread). Results of
 * an analysis are only merged while their ticket is the latest one issued and
 * the buffer version has not moved since.
 */
class EditingSession {
public:
    explicit EditingSession(std::string initialText = {},
                            SessionSettings settings = {},
                            domain::Clock::time_point now = domain::Clock::now());

    const std::string& text() const { return m_buffer.text(); }
    std::uint64_t version() const { return m_buffer.version(); }
    const SuggestionIndex& suggestions() const { return m_index; }
    const EditHistory& history() const { return m_history; }

    /**
     * @brief A keystroke-level edit: replaces [position, position + length) with insertion.
     *
     * Suggestions the edit cuts into are evicted, later ones shift, a debounced
     * checkpoint is recorded and an analysis is scheduled.
     * @throws std::out_of_range if the range is outside the text.
     */
    void replaceRange(std::size_t position, std::size_t length, const std::string& insertion,
                      domain::Clock::time_point now);

    /** @brief Replaces the whole text, reduced to the minimal differing range. */
    void setText(const std::string& newText, domain::Clock::time_point now);

    /**
     * @brief Advances timers: commits due checkpoints.
     * @return True once when a scheduled analysis has become due.
     */
    bool tick(domain::Clock::time_point now);

    /** @brief Issues a ticket for a new pass; any earlier pass becomes stale. */
    AnalysisTicket beginAnalysis(domain::AnalysisLevel level = domain::AnalysisLevel::Full);

    bool isCurrent(const AnalysisTicket& ticket) const;

    /**
     * @brief Merges one streamed result.
     *
     * The first result of a pass replaces the previous pass's suggestions.
     * @return False if the ticket is stale or the suggestion does not fit the text.
     */
    bool acceptSuggestion(const AnalysisTicket& ticket, const domain::ResolvedSuggestion& suggestion);

    /** @brief Closes a pass. A fresh pass that produced nothing clears the old suggestions. */
    bool completeAnalysis(const AnalysisTicket& ticket);

    ApplyResult apply(const std::string& suggestionId, domain::Clock::time_point now);
    bool dismiss(const std::string& suggestionId);

    /** @brief Steps back one checkpoint, restoring text and suggestions together. */
    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;

    /** @brief Paints [visibleStart, visibleEnd) of the text through the renderer. */
    void render(domain::OverlayRenderer& renderer,
                std::size_t visibleStart = 0,
                std::size_t visibleEnd = std::string::npos) const;

private:
    void restore(const HistorySnapshot& snapshot);
    void syncHistorySuggestions();

    SessionSettings m_settings;
    domain::TextBuffer m_buffer;
    SuggestionIndex m_index;
    EditHistory m_history;
    ApplyEngine m_applyEngine;

    std::uint64_t m_lastSequence = 0;
    bool m_passHasResults = false;
    std::optional<domain::Clock::time_point> m_analysisDueAt;
};

} // namespace redline::application
