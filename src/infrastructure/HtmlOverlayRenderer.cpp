#include "infrastructure/HtmlOverlayRenderer.hpp"

namespace redline::infrastructure {

void HtmlOverlayRenderer::beginDocument() {
    m_html.clear();
}

void HtmlOverlayRenderer::drawSegment(std::string_view text, const domain::CoveringSegment& segment) {
    if (!segment.highlighted()) {
        m_html += Escape(text);
        return;
    }

    std::string title;
    for (const auto* suggestion : segment.covering) {
        if (!title.empty()) title += "\n";
        title += suggestion->title + ": " + suggestion->suggestedLiteral;
    }

    m_html += "<span class=\"suggestion suggestion-";
    m_html += domain::SuggestionTypeToString(segment.primary->kind);
    m_html += "\" data-suggestion-id=\"";
    m_html += Escape(segment.primary->id);
    m_html += "\" title=\"";
    m_html += Escape(title);
    m_html += "\">";
    m_html += Escape(text);
    m_html += "</span>";
}

std::string HtmlOverlayRenderer::Escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += ch; break;
        }
    }
    return out;
}

} // namespace redline::infrastructure
