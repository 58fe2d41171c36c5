/**
 * @file SuggestionIndex.cpp
 * @brief Implementation of SuggestionIndex.
 */

#include "application/SuggestionIndex.hpp"
#include <algorithm>
#include <iostream>

namespace redline::application {

bool SuggestionIndex::insert(domain::ResolvedSuggestion suggestion) {
    if (suggestion.span.start >= suggestion.span.end) {
        return false;
    }
    if (m_entries.count(suggestion.span.start) != 0 || find(suggestion.id) != nullptr) {
        return false;
    }
    std::size_t anchor = suggestion.span.start;
    m_entries.emplace(anchor, std::move(suggestion));
    return true;
}

bool SuggestionIndex::remove(const std::string& id) {
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->second.id == id) {
            m_entries.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<std::string> SuggestionIndex::removeRange(std::size_t start, std::size_t end) {
    std::vector<std::string> removed;
    for (auto it = m_entries.lower_bound(start); it != m_entries.end() && it->first <= end;) {
        if (it->second.span.end <= end) {
            removed.push_back(it->second.id);
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> SuggestionIndex::evictOverlapping(std::size_t start, std::size_t end) {
    std::vector<std::string> removed;
    for (auto it = m_entries.begin(); it != m_entries.end() && it->first <= end;) {
        const domain::TextSpan& span = it->second.span;
        bool cut = (start == end) ? (span.start < start && start < span.end)
                                  : (span.start < end && start < span.end);
        if (cut) {
            removed.push_back(it->second.id);
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t SuggestionIndex::shift(std::size_t fromPosition, std::ptrdiff_t delta) {
    if (delta == 0) {
        return 0;
    }

    std::vector<domain::ResolvedSuggestion> moving;
    for (auto it = m_entries.lower_bound(fromPosition); it != m_entries.end();) {
        moving.push_back(std::move(it->second));
        it = m_entries.erase(it);
    }

    std::size_t moved = 0;
    for (auto& suggestion : moving) {
        auto start = static_cast<std::ptrdiff_t>(suggestion.span.start) + delta;
        auto end = static_cast<std::ptrdiff_t>(suggestion.span.end) + delta;
        if (start < 0 || end <= start) {
            std::cerr << "[SuggestionIndex] Dropping " << suggestion.id << ": shifted before text start" << std::endl;
            continue;
        }
        suggestion.span.start = static_cast<std::size_t>(start);
        suggestion.span.end = static_cast<std::size_t>(end);
        std::string id = suggestion.id;
        if (!m_entries.emplace(suggestion.span.start, std::move(suggestion)).second) {
            std::cerr << "[SuggestionIndex] Dropping " << id << ": anchor collision after shift" << std::endl;
            continue;
        }
        ++moved;
    }
    return moved;
}

void SuggestionIndex::replaceAll(const domain::SuggestionList& suggestions) {
    m_entries.clear();
    for (const auto& suggestion : suggestions) {
        insert(suggestion);
    }
}

const domain::ResolvedSuggestion* SuggestionIndex::find(const std::string& id) const {
    for (const auto& [anchor, suggestion] : m_entries) {
        if (suggestion.id == id) {
            return &suggestion;
        }
    }
    return nullptr;
}

const domain::ResolvedSuggestion* SuggestionIndex::at(std::size_t anchor) const {
    auto it = m_entries.find(anchor);
    return it == m_entries.end() ? nullptr : &it->second;
}

domain::SuggestionList SuggestionIndex::all() const {
    domain::SuggestionList list;
    list.reserve(m_entries.size());
    for (const auto& [anchor, suggestion] : m_entries) {
        list.push_back(suggestion);
    }
    return list;
}

std::vector<domain::CoveringSegment> SuggestionIndex::coveringSegments(std::size_t visibleStart,
                                                                       std::size_t visibleEnd) const {
    std::vector<domain::CoveringSegment> segments;
    if (visibleStart >= visibleEnd) {
        return segments;
    }

    std::vector<std::size_t> points = {visibleStart, visibleEnd};
    for (const auto& [anchor, suggestion] : m_entries) {
        for (std::size_t p : {suggestion.span.start, suggestion.span.end}) {
            if (p > visibleStart && p < visibleEnd) {
                points.push_back(p);
            }
        }
    }
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());

    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        domain::CoveringSegment segment;
        segment.span = {points[i], points[i + 1]};

        for (const auto& [anchor, suggestion] : m_entries) {
            if (anchor > segment.span.start) {
                break;
            }
            if (suggestion.span.end >= segment.span.end) {
                segment.covering.push_back(&suggestion);
                if (!segment.primary || suggestion.priority < segment.primary->priority) {
                    segment.primary = &suggestion;
                }
            }
        }
        segments.push_back(std::move(segment));
    }
    return segments;
}

} // namespace redline::application
