#include "ui/ImGuiOverlayRenderer.hpp"
#include "imgui.h"

namespace redline::ui {

namespace {

ImVec4 ColorFor(domain::SuggestionType type) {
    switch (type) {
    case domain::SuggestionType::Spelling: return ImVec4(1.00f, 0.40f, 0.40f, 1.0f);
    case domain::SuggestionType::Grammar: return ImVec4(1.00f, 0.75f, 0.30f, 1.0f);
    case domain::SuggestionType::PassiveVoice: return ImVec4(0.55f, 0.75f, 1.00f, 1.0f);
    case domain::SuggestionType::Conciseness: return ImVec4(0.45f, 0.90f, 0.60f, 1.0f);
    case domain::SuggestionType::Clarity: return ImVec4(0.80f, 0.60f, 1.00f, 1.0f);
    case domain::SuggestionType::Tone: return ImVec4(1.00f, 0.60f, 0.85f, 1.0f);
    case domain::SuggestionType::CallToAction: return ImVec4(0.40f, 0.90f, 0.90f, 1.0f);
    }
    return ImVec4(1, 1, 1, 1);
}

} // namespace

void ImGuiOverlayRenderer::beginDocument() {
    m_clicked.reset();
    m_lineOpen = false;
}

void ImGuiOverlayRenderer::drawSegment(std::string_view text, const domain::CoveringSegment& segment) {
    // ImGui lays out runs left to right; explicit newlines start a new row.
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t newline = text.find('\n', start);
        std::string_view run = text.substr(start, newline == std::string_view::npos ? std::string_view::npos : newline - start);
        if (!run.empty()) {
            drawRun(run, segment);
        }
        if (newline == std::string_view::npos) {
            break;
        }
        if (!m_lineOpen) {
            ImGui::NewLine();
        }
        m_lineOpen = false;
        start = newline + 1;
    }
}

void ImGuiOverlayRenderer::endDocument() {
    if (m_lineOpen) {
        ImGui::NewLine();
    }
    m_lineOpen = false;
}

void ImGuiOverlayRenderer::drawRun(std::string_view run, const domain::CoveringSegment& segment) {
    if (m_lineOpen) {
        ImGui::SameLine(0.0f, 0.0f);
    }
    m_lineOpen = true;

    if (!segment.highlighted()) {
        ImGui::TextUnformatted(run.data(), run.data() + run.size());
        return;
    }

    const ImVec4 color = ColorFor(segment.primary->kind);
    ImGui::PushStyleColor(ImGuiCol_Text, color);
    ImGui::TextUnformatted(run.data(), run.data() + run.size());
    ImGui::PopStyleColor();

    ImVec2 min = ImGui::GetItemRectMin();
    ImVec2 max = ImGui::GetItemRectMax();
    ImGui::GetWindowDrawList()->AddLine(ImVec2(min.x, max.y), ImVec2(max.x, max.y), ImColor(color), 1.5f);

    if (ImGui::IsItemHovered()) {
        ImGui::BeginTooltip();
        for (const auto* suggestion : segment.covering) {
            ImGui::Text("%s %s", suggestion->icon.c_str(), suggestion->title.c_str());
            ImGui::TextDisabled("\"%s\" -> \"%s\"", suggestion->originalLiteral.c_str(),
                                suggestion->suggestedLiteral.c_str());
        }
        ImGui::EndTooltip();
    }
    if (ImGui::IsItemClicked()) {
        m_clicked = segment.primary->id;
    }
}

} // namespace redline::ui
