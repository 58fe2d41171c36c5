/**
 * @file SuggestionIndex.hpp
 * @brief Interval index of the active suggestions over the canonical text.
 */

#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "domain/OverlayRenderer.hpp"
#include "domain/Suggestion.hpp"

namespace redline::application {

/**
 * @class SuggestionIndex
 * @brief Resolved suggestions ordered by anchor (start position).
 *
 * Invariant: no two entries share a start. Ranges may overlap; overlaps are
 * settled at render time by priority. Pointers handed out by find(), at() and
 * coveringSegments() stay valid until the next mutation.
 */
class SuggestionIndex {
public:
    /**
     * @brief Adds a suggestion.
     * @return False if the range is empty, or the anchor or id is already taken.
     */
    bool insert(domain::ResolvedSuggestion suggestion);

    /** @brief Removes the suggestion with the given id. */
    bool remove(const std::string& id);

    /** @brief Removes every suggestion fully contained in [start, end]. Returns the removed ids. */
    std::vector<std::string> removeRange(std::size_t start, std::size_t end);

    /**
     * @brief Removes every suggestion the range cuts into.
     *
     * For a non-empty range that is any suggestion overlapping [start, end). For
     * an empty range (an insertion point) it is any suggestion strictly
     * containing the point.
     */
    std::vector<std::string> evictOverlapping(std::size_t start, std::size_t end);

    /**
     * @brief Moves every suggestion with start >= fromPosition by delta.
     *
     * Entries that would move before the beginning of the text or onto an
     * occupied anchor are dropped.
     * @return Number of entries moved.
     */
    std::size_t shift(std::size_t fromPosition, std::ptrdiff_t delta);

    /** @brief Replaces the whole content (history restore, new analysis pass). */
    void replaceAll(const domain::SuggestionList& suggestions);

    void clear() { m_entries.clear(); }

    const domain::ResolvedSuggestion* find(const std::string& id) const;
    const domain::ResolvedSuggestion* at(std::size_t anchor) const;

    /** @brief All suggestions ordered by anchor. */
    domain::SuggestionList all() const;

    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /**
     * @brief Splits the visible range into minimal segments and settles overlaps.
     *
     * Boundary points are every suggestion start/end inside the range plus the
     * range's own endpoints. Each segment lists all suggestions covering it and
     * the primary one: lowest priority value, lower anchor on ties. Uncovered
     * segments are included with no covering suggestions.
     */
    std::vector<domain::CoveringSegment> coveringSegments(std::size_t visibleStart,
                                                          std::size_t visibleEnd) const;

private:
    std::map<std::size_t, domain::ResolvedSuggestion> m_entries;
};

} // namespace redline::application
