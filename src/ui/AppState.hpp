/**
 * @file AppState.hpp
 * @brief Editor state and the coordination between the UI thread and the analysis worker.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "application/AnalysisWorker.hpp"
#include "application/EditingSession.hpp"
#include "domain/ProposalSource.hpp"
#include "domain/Suggestion.hpp"

namespace redline::ui {

    /**
     * @struct UIState
     * @brief Transient widget state.
     */
    struct UIState {
        std::string outputLog;                          ///< Text shown in the log pane.
        std::string draft;                              ///< Editable copy of the session text.
        std::optional<std::string> selectedSuggestion;  ///< Suggestion whose popup is open.
        bool openSuggestionPopup = false;
        bool analyzing = false;                         ///< A pass is in flight.
        bool requestExit = false;
        domain::AnalysisLevel level = domain::AnalysisLevel::Full;
    };

    /**
     * @class AppState
     * @brief Owns the EditingSession and the AnalysisWorker feeding it.
     *
     * Every method runs on the UI thread; worker results only reach the
     * session through update().
     */
    class AppState {
    public:
        UIState ui;

        AppState();

        /** @brief Creates the session and starts the worker. */
        void Initialize(const std::string& initialText,
                        application::SessionSettings settings,
                        std::shared_ptr<domain::ProposalSource> source);

        /** @brief Per-frame step: timers, worker inbox, scheduled analysis. */
        void Update(domain::Clock::time_point now);

        /** @brief Pushes ui.draft into the session after the text widget changed it. */
        void OnDraftEdited(domain::Clock::time_point now);

        void RequestAnalysis();
        void ApplySelected(domain::Clock::time_point now);
        void DismissSelected();
        void Undo();
        void Redo();

        application::EditingSession* session() { return m_session.get(); }
        const application::EditingSession* session() const { return m_session.get(); }

        void AppendLog(const std::string& msg);

    private:
        void SyncDraft();

        std::unique_ptr<application::EditingSession> m_session;
        std::unique_ptr<application::AnalysisWorker> m_worker;
        std::shared_ptr<const application::AnalysisTicket> m_activeTicket;
    };

} // namespace redline::ui
