/**
 * @file HtmlOverlayRenderer.hpp
 * @brief OverlayRenderer producing an HTML fragment with highlighted spans.
 */

#pragma once

#include <string>
#include <string_view>
#include "domain/OverlayRenderer.hpp"

namespace redline::infrastructure {

/**
 * @class HtmlOverlayRenderer
 * @brief Uncovered text is emitted escaped; covered segments become
 * `<span class="suggestion suggestion-<type>" data-suggestion-id="..." title="...">`.
 *
 * The class follows the primary suggestion; the title lists every covering one.
 */
class HtmlOverlayRenderer : public domain::OverlayRenderer {
public:
    void beginDocument() override;
    void drawSegment(std::string_view text, const domain::CoveringSegment& segment) override;

    const std::string& html() const { return m_html; }

    static std::string Escape(std::string_view text);

private:
    std::string m_html;
};

} // namespace redline::infrastructure
