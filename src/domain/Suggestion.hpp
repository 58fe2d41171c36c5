/**
 * @file Suggestion.hpp
 * @brief Domain entities for the suggestion engine: candidates, resolved suggestions and their ranking.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace redline::domain {

/**
 * @enum SuggestionType
 * @brief Categorizes what a suggestion corrects.
 *
 * Declaration order is the rendering priority: when several suggestions cover
 * the same text, the one declared first wins the visual treatment.
 */
enum class SuggestionType {
    Spelling,     ///< Misspelled word.
    Grammar,      ///< Grammatical error.
    PassiveVoice, ///< Passive construction that could be active.
    Conciseness,  ///< Wordy phrasing.
    Clarity,      ///< Ambiguous or hard to read phrasing.
    Tone,         ///< Tone mismatch for the audience.
    CallToAction  ///< Weak or missing call to action.
};

/**
 * @enum AnalysisLevel
 * @brief Depth of an analysis request.
 */
enum class AnalysisLevel {
    Spelling, ///< Spelling errors only.
    Full,     ///< Spelling and grammar errors.
    Style     ///< Spelling and grammar plus every stylistic type.
};

inline std::string SuggestionTypeToString(SuggestionType type) {
    switch (type) {
        case SuggestionType::Spelling: return "spelling";
        case SuggestionType::Grammar: return "grammar";
        case SuggestionType::PassiveVoice: return "passive-voice";
        case SuggestionType::Conciseness: return "conciseness";
        case SuggestionType::Clarity: return "clarity";
        case SuggestionType::Tone: return "tone";
        case SuggestionType::CallToAction: return "cta";
    }
    return "grammar";
}

inline std::optional<SuggestionType> SuggestionTypeFromString(const std::string& value) {
    if (value == "spelling") return SuggestionType::Spelling;
    if (value == "grammar") return SuggestionType::Grammar;
    if (value == "passive-voice") return SuggestionType::PassiveVoice;
    if (value == "conciseness") return SuggestionType::Conciseness;
    if (value == "clarity") return SuggestionType::Clarity;
    if (value == "tone") return SuggestionType::Tone;
    if (value == "cta") return SuggestionType::CallToAction;
    return std::nullopt;
}

/** @brief Rendering priority; lower values win when suggestions overlap. */
inline int SuggestionPriority(SuggestionType type) {
    return static_cast<int>(type) + 1;
}

inline std::string AnalysisLevelToString(AnalysisLevel level) {
    switch (level) {
        case AnalysisLevel::Spelling: return "spelling";
        case AnalysisLevel::Full: return "full";
        case AnalysisLevel::Style: return "style";
    }
    return "full";
}

inline std::optional<AnalysisLevel> AnalysisLevelFromString(const std::string& value) {
    if (value == "spelling") return AnalysisLevel::Spelling;
    if (value == "full") return AnalysisLevel::Full;
    if (value == "style") return AnalysisLevel::Style;
    return std::nullopt;
}

/**
 * @struct CorrectionCandidate
 * @brief An unresolved proposal decoded from the model stream.
 *
 * Untrusted: the literal may not occur in the text any more.
 */
struct CorrectionCandidate {
    SuggestionType kind = SuggestionType::Grammar;
    std::string originalLiteral;
    std::string suggestedLiteral;
    std::string explanation; ///< May be empty.
};

/**
 * @struct TextSpan
 * @brief Half-open byte range [start, end) into the canonical text.
 */
struct TextSpan {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t length() const { return end - start; }
    bool contains(const TextSpan& other) const { return start <= other.start && other.end <= end; }
    bool overlaps(const TextSpan& other) const { return start < other.end && other.start < end; }

    bool operator==(const TextSpan& other) const { return start == other.start && end == other.end; }
    bool operator!=(const TextSpan& other) const { return !(*this == other); }
};

/**
 * @struct ResolvedSuggestion
 * @brief A candidate anchored to a concrete range of the canonical text.
 *
 * Invariant at resolution time: text.substr(span.start, span.length()) == originalLiteral.
 */
struct ResolvedSuggestion {
    std::string id;
    TextSpan span;
    SuggestionType kind = SuggestionType::Grammar;
    std::string originalLiteral;
    std::string suggestedLiteral;
    std::string explanation;
    int priority = SuggestionPriority(SuggestionType::Grammar);
    int confidence = 95;
    std::string title;
    std::string icon;

    bool operator==(const ResolvedSuggestion& other) const {
        return id == other.id && span == other.span && kind == other.kind &&
               originalLiteral == other.originalLiteral &&
               suggestedLiteral == other.suggestedLiteral &&
               explanation == other.explanation && priority == other.priority &&
               confidence == other.confidence && title == other.title && icon == other.icon;
    }
    bool operator!=(const ResolvedSuggestion& other) const { return !(*this == other); }
};

using SuggestionList = std::vector<ResolvedSuggestion>;

/** @brief Display title for a suggestion type ("Spelling Correction", "Passive Voice", ...). */
inline std::string SuggestionTitle(SuggestionType type) {
    if (type == SuggestionType::Spelling) return "Spelling Correction";
    if (type == SuggestionType::Grammar) return "Grammar Correction";

    std::string wire = SuggestionTypeToString(type);
    std::string title;
    bool startOfWord = true;
    for (char ch : wire) {
        if (ch == '-') {
            title.push_back(' ');
            startOfWord = true;
            continue;
        }
        if (startOfWord && ch >= 'a' && ch <= 'z') {
            title.push_back(static_cast<char>(ch - 'a' + 'A'));
        } else {
            title.push_back(ch);
        }
        startOfWord = false;
    }
    return title;
}

/** @brief Icon shown next to a suggestion of the given type. */
inline std::string SuggestionIcon(SuggestionType type) {
    switch (type) {
        case SuggestionType::Spelling: return "\xE2\x9C\x8D\xEF\xB8\x8F"; // writing hand
        case SuggestionType::Grammar: return "\xF0\x9F\xA7\x90";          // face with monocle
        default: return "\xE2\x9C\xA8";                                   // sparkles
    }
}

} // namespace redline::domain
