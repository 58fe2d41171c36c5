/**
 * @file OverlayRenderer.hpp
 * @brief Rendering adapter interface for the suggestion overlay.
 */

#pragma once
#include <string_view>
#include <vector>
#include "Suggestion.hpp"

namespace redline::domain {

/**
 * @struct CoveringSegment
 * @brief Minimal text segment between two consecutive interval boundaries.
 */
struct CoveringSegment {
    TextSpan span;
    const ResolvedSuggestion* primary = nullptr;     ///< Lowest priority value among covering; null if uncovered.
    std::vector<const ResolvedSuggestion*> covering; ///< All suggestions covering the segment, by anchor.

    bool highlighted() const { return primary != nullptr; }
};

/**
 * @class OverlayRenderer
 * @brief Paints the text with highlighted segments. Implemented by the UI layers.
 */
class OverlayRenderer {
public:
    virtual ~OverlayRenderer() = default;

    virtual void beginDocument() {}

    /**
     * @brief Draws one segment.
     * @param text The bytes of the segment.
     * @param segment Segment geometry and the suggestions that cover it.
     */
    virtual void drawSegment(std::string_view text, const CoveringSegment& segment) = 0;

    virtual void endDocument() {}
};

} // namespace redline::domain
