/**
 * @file SpanResolver.cpp
 * @brief Implementation of SpanResolver.
 */

#include "application/SpanResolver.hpp"
#include <iostream>

namespace redline::application {

namespace {

bool IsWordChar(char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
}

bool IsSpace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool HasWordBoundary(const std::string& text, std::size_t pos, std::size_t length) {
    bool before = pos == 0 || !IsWordChar(text[pos - 1]);
    bool after = pos + length >= text.size() || !IsWordChar(text[pos + length]);
    return before && after;
}

} // namespace

std::optional<SpanMatch> SpanResolver::resolve(const std::string& text,
                                               const std::string& literal,
                                               AnchorSet& usedAnchors) const {
    if (literal.empty()) {
        return std::nullopt;
    }

    auto claim = [&](std::size_t start, const std::string& found, SpanMatch::Pass pass) {
        usedAnchors.insert(start);
        SpanMatch match;
        match.span = {start, start + found.size()};
        match.literal = found;
        match.pass = pass;
        return match;
    };

    if (auto pos = scan(text, literal, usedAnchors, true)) {
        return claim(*pos, literal, SpanMatch::Pass::WordBoundary);
    }
    if (auto pos = scan(text, literal, usedAnchors, false)) {
        return claim(*pos, literal, SpanMatch::Pass::Unconstrained);
    }

    std::size_t first = 0;
    while (first < literal.size() && IsSpace(literal[first])) ++first;
    std::size_t last = literal.size();
    while (last > first && IsSpace(literal[last - 1])) --last;

    if (first < last && (first > 0 || last < literal.size())) {
        std::string trimmed = literal.substr(first, last - first);
        auto pos = scan(text, trimmed, usedAnchors, true);
        if (!pos) {
            pos = scan(text, trimmed, usedAnchors, false);
        }
        if (pos) {
            SpanMatch match = claim(*pos, trimmed, SpanMatch::Pass::Trimmed);
            match.trimmedLeading = first;
            match.trimmedTrailing = literal.size() - last;
            return match;
        }
    }

    std::cerr << "[SpanResolver] Could not find unused position for \"" << literal
              << "\" in text" << std::endl;
    return std::nullopt;
}

std::optional<std::size_t> SpanResolver::scan(const std::string& text,
                                               const std::string& literal,
                                               const AnchorSet& usedAnchors,
                                               bool requireWordBoundary) const {
    std::size_t from = 0;
    while (from < text.size()) {
        std::size_t found = text.find(literal, from);
        if (found == std::string::npos) {
            break;
        }
        if (usedAnchors.count(found) == 0 &&
            (!requireWordBoundary || HasWordBoundary(text, found, literal.size()))) {
            return found;
        }
        from = found + 1;
    }
    return std::nullopt;
}

} // namespace redline::application
