/**
 * @file AppState.cpp
 * @brief Implementation of AppState.
 */

#include "ui/AppState.hpp"
#include <iostream>

namespace redline::ui {

AppState::AppState() {
    ui.outputLog = "Redline - suggestion engine initialized.\n";
}

void AppState::Initialize(const std::string& initialText,
                          application::SessionSettings settings,
                          std::shared_ptr<domain::ProposalSource> source) {
    m_session = std::make_unique<application::EditingSession>(initialText, settings);
    m_worker = std::make_unique<application::AnalysisWorker>(std::move(source));
    SyncDraft();
    if (!initialText.empty()) {
        RequestAnalysis();
    }
}

void AppState::Update(domain::Clock::time_point now) {
    if (!m_session) return;

    if (m_session->tick(now)) {
        RequestAnalysis();
    }

    for (auto& event : m_worker->drain()) {
        switch (event.kind) {
        case application::AnalysisEvent::Kind::Suggestion:
            m_session->acceptSuggestion(*event.ticket, event.suggestion);
            break;
        case application::AnalysisEvent::Kind::Completed:
            if (m_session->completeAnalysis(*event.ticket)) {
                AppendLog("[ANALYSIS] " + std::to_string(m_session->suggestions().size()) + " suggestion(s).\n");
            }
            if (event.ticket == m_activeTicket) ui.analyzing = false;
            break;
        case application::AnalysisEvent::Kind::Failed:
            AppendLog("[ANALYSIS] Failed: " + event.message + "\n");
            if (event.ticket == m_activeTicket) ui.analyzing = false;
            break;
        }
    }
}

void AppState::OnDraftEdited(domain::Clock::time_point now) {
    if (!m_session) return;
    m_session->setText(ui.draft, now);
    if (ui.selectedSuggestion && !m_session->suggestions().find(*ui.selectedSuggestion)) {
        ui.selectedSuggestion.reset();
    }
}

void AppState::RequestAnalysis() {
    if (!m_session) return;
    auto ticket = m_session->beginAnalysis(ui.level);
    m_activeTicket = std::make_shared<const application::AnalysisTicket>(ticket);
    m_worker->submit(std::move(ticket));
    ui.analyzing = true;
}

void AppState::ApplySelected(domain::Clock::time_point now) {
    if (!m_session || !ui.selectedSuggestion) return;
    auto result = m_session->apply(*ui.selectedSuggestion, now);
    switch (result.status) {
    case application::ApplyStatus::Applied:
        AppendLog("[EDIT] Applied " + *ui.selectedSuggestion + "\n");
        break;
    case application::ApplyStatus::Stale:
        AppendLog("[EDIT] Suggestion no longer matches the text; removed.\n");
        break;
    case application::ApplyStatus::NotFound:
        break;
    }
    ui.selectedSuggestion.reset();
    SyncDraft();
}

void AppState::DismissSelected() {
    if (!m_session || !ui.selectedSuggestion) return;
    m_session->dismiss(*ui.selectedSuggestion);
    ui.selectedSuggestion.reset();
}

void AppState::Undo() {
    if (m_session && m_session->undo()) {
        ui.selectedSuggestion.reset();
        SyncDraft();
    }
}

void AppState::Redo() {
    if (m_session && m_session->redo()) {
        ui.selectedSuggestion.reset();
        SyncDraft();
    }
}

void AppState::AppendLog(const std::string& msg) {
    ui.outputLog += msg;
    std::cout << msg;
}

void AppState::SyncDraft() {
    if (m_session) {
        ui.draft = m_session->text();
    }
}

} // namespace redline::ui
