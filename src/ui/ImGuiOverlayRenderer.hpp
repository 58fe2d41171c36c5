/**
 * @file ImGuiOverlayRenderer.hpp
 * @brief OverlayRenderer drawing the annotated text with Dear ImGui.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "domain/OverlayRenderer.hpp"

namespace redline::ui {

/**
 * @class ImGuiOverlayRenderer
 * @brief Emits text runs inline; highlighted runs are tinted and underlined by the
 * primary suggestion's type, show a tooltip of every covering suggestion and
 * report clicks by suggestion id.
 */
class ImGuiOverlayRenderer : public domain::OverlayRenderer {
public:
    void beginDocument() override;
    void drawSegment(std::string_view text, const domain::CoveringSegment& segment) override;
    void endDocument() override;

    /** @brief Id of the suggestion clicked during the last document, if any. */
    const std::optional<std::string>& clickedSuggestion() const { return m_clicked; }

private:
    void drawRun(std::string_view run, const domain::CoveringSegment& segment);

    std::optional<std::string> m_clicked;
    bool m_lineOpen = false;
};

} // namespace redline::ui
