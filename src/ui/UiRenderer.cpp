/**
 * @file UiRenderer.cpp
 * @brief Editor window: text input, annotated preview, suggestion popup and log.
 */

#include "ui/UiRenderer.hpp"
#include "ui/ImGuiOverlayRenderer.hpp"

#include "imgui.h"
#include <cfloat>

namespace redline::ui {

namespace {

int TextEditCallback(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        auto* str = static_cast<std::string*>(data->UserData);
        str->resize(data->BufTextLen);
        data->Buf = str->data();
    }
    return 0;
}

bool InputTextMultilineString(const char* label, std::string* str, const ImVec2& size, ImGuiInputTextFlags flags = 0) {
    flags |= ImGuiInputTextFlags_CallbackResize;
    if (str->capacity() == 0) {
        str->reserve(1024);
    }
    return ImGui::InputTextMultiline(label, str->data(), str->capacity() + 1, size, flags, TextEditCallback, str);
}

void DrawToolbar(AppState& app) {
    auto* session = app.session();

    if (ImGui::Button("Analyze now")) {
        app.RequestAnalysis();
    }
    ImGui::SameLine();

    int level = static_cast<int>(app.ui.level);
    ImGui::SetNextItemWidth(140.0f);
    if (ImGui::Combo("##level", &level, "Spelling only\0Full\0Style\0")) {
        app.ui.level = static_cast<domain::AnalysisLevel>(level);
        app.RequestAnalysis();
    }
    ImGui::SameLine();

    bool canUndo = session && session->canUndo();
    if (!canUndo) ImGui::BeginDisabled();
    if (ImGui::Button("Undo")) app.Undo();
    if (!canUndo) ImGui::EndDisabled();
    ImGui::SameLine();

    bool canRedo = session && session->canRedo();
    if (!canRedo) ImGui::BeginDisabled();
    if (ImGui::Button("Redo")) app.Redo();
    if (!canRedo) ImGui::EndDisabled();

    if (app.ui.analyzing) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1, 1, 0, 1), "Analyzing...");
    } else if (session) {
        ImGui::SameLine();
        ImGui::TextDisabled("%zu suggestion(s)", session->suggestions().size());
    }
}

void HandleShortcuts(AppState& app) {
    ImGuiIO& io = ImGui::GetIO();
    if (!io.KeyCtrl || ImGui::IsAnyItemActive()) return;
    if (ImGui::IsKeyPressed(ImGuiKey_Z)) {
        if (io.KeyShift) app.Redo(); else app.Undo();
    } else if (ImGui::IsKeyPressed(ImGuiKey_Y)) {
        app.Redo();
    }
}

void DrawSuggestionPopup(AppState& app) {
    if (app.ui.openSuggestionPopup) {
        ImGui::OpenPopup("Suggestion");
        app.ui.openSuggestionPopup = false;
    }
    if (!ImGui::BeginPopup("Suggestion")) {
        return;
    }

    const domain::ResolvedSuggestion* suggestion = nullptr;
    if (app.session() && app.ui.selectedSuggestion) {
        suggestion = app.session()->suggestions().find(*app.ui.selectedSuggestion);
    }
    if (!suggestion) {
        ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
        return;
    }

    ImGui::Text("%s %s", suggestion->icon.c_str(), suggestion->title.c_str());
    ImGui::Separator();
    ImGui::TextColored(ImVec4(1.0f, 0.5f, 0.5f, 1.0f), "%s", suggestion->originalLiteral.c_str());
    ImGui::TextColored(ImVec4(0.5f, 1.0f, 0.5f, 1.0f), "%s", suggestion->suggestedLiteral.c_str());
    ImGui::PushTextWrapPos(ImGui::GetFontSize() * 25.0f);
    ImGui::TextDisabled("%s", suggestion->explanation.c_str());
    ImGui::PopTextWrapPos();
    ImGui::Spacing();

    if (ImGui::Button("Apply")) {
        app.ApplySelected(domain::Clock::now());
        ImGui::CloseCurrentPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("Dismiss")) {
        app.DismissSelected();
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

} // namespace

void DrawUI(AppState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("Main", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize);

    HandleShortcuts(app);
    DrawToolbar(app);
    ImGui::Separator();

    const float paneHeight = (ImGui::GetContentRegionAvail().y - 140.0f) * 0.5f;
    if (InputTextMultilineString("##editor", &app.ui.draft, ImVec2(-FLT_MIN, paneHeight))) {
        app.OnDraftEdited(domain::Clock::now());
    }

    ImGui::Text("Suggestions");
    ImGui::BeginChild("Overlay", ImVec2(0, paneHeight), true);
    if (app.session()) {
        ImGuiOverlayRenderer renderer;
        app.session()->render(renderer);
        if (renderer.clickedSuggestion()) {
            app.ui.selectedSuggestion = renderer.clickedSuggestion();
            app.ui.openSuggestionPopup = true;
        }
    }
    ImGui::EndChild();
    DrawSuggestionPopup(app);

    ImGui::Text("Log");
    ImGui::BeginChild("Log", ImVec2(0, 0), true);
    ImGui::TextUnformatted(app.ui.outputLog.c_str());
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        ImGui::SetScrollHereY(1.0f);
    ImGui::EndChild();

    ImGui::End();
}

} // namespace redline::ui
