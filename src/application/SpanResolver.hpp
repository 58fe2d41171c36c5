/**
 * @file SpanResolver.hpp
 * @brief Anchors proposal literals to exact, unclaimed ranges of the text.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include "domain/Suggestion.hpp"

namespace redline::application {

/** @brief Start positions already claimed during one analysis pass. */
using AnchorSet = std::set<std::size_t>;

/**
 * @struct SpanMatch
 * @brief Result of a successful resolution.
 */
struct SpanMatch {
    enum class Pass {
        WordBoundary,  ///< Matched with non-alphanumeric neighbours.
        Unconstrained, ///< Matched anywhere.
        Trimmed        ///< Matched after stripping surrounding whitespace.
    };

    domain::TextSpan span;
    std::string literal;  ///< The literal actually found (trimmed for Pass::Trimmed).
    std::size_t trimmedLeading = 0;
    std::size_t trimmedTrailing = 0;
    Pass pass = Pass::WordBoundary;
};

/**
 * @class SpanResolver
 * @brief Three ordered passes over literal occurrences; the first success wins.
 *
 * 1. Occurrences whose neighbours (or buffer edges) are not ASCII alphanumeric.
 * 2. Any occurrence.
 * 3. Passes 1-2 again on the literal stripped of leading/trailing whitespace.
 *
 * Claimed anchors are never reused, so k identical proposals consume k distinct
 * occurrences from left to right.
 */
class SpanResolver {
public:
    /**
     * @brief Finds the best unclaimed range for the literal.
     * @param text Canonical text snapshot.
     * @param literal The proposal's original literal.
     * @param usedAnchors Anchors claimed so far; the chosen start is added on success.
     * @return The match, or std::nullopt if no unclaimed occurrence exists.
     */
    std::optional<SpanMatch> resolve(const std::string& text,
                                     const std::string& literal,
                                     AnchorSet& usedAnchors) const;

private:
    std::optional<std::size_t> scan(const std::string& text,
                                    const std::string& literal,
                                    const AnchorSet& usedAnchors,
                                    bool requireWordBoundary) const;
};

} // namespace redline::application
