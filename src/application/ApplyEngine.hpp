/**
 * @file ApplyEngine.hpp
 * @brief Atomic accept/dismiss transactions over buffer, index and history.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "application/EditHistory.hpp"
#include "application/SuggestionIndex.hpp"
#include "domain/TextBuffer.hpp"

namespace redline::application {

/**
 * @enum ApplyStatus
 * @brief Outcome of an apply transaction.
 */
enum class ApplyStatus {
    Applied,  ///< Text spliced, index and history updated.
    NotFound, ///< No active suggestion with that id.
    Stale     ///< The text under the anchor no longer matches; the suggestion was evicted.
};

/**
 * @struct ApplyResult
 * @brief What an apply transaction changed.
 */
struct ApplyResult {
    ApplyStatus status = ApplyStatus::NotFound;
    domain::TextSpan replaced;      ///< Range that was replaced, in pre-apply coordinates.
    std::string replacement;        ///< Text actually inserted (after space preservation).
    std::ptrdiff_t delta = 0;       ///< replacement length minus replaced length.
    std::vector<std::string> removed; ///< Suggestions fully inside the replaced range, the applied one included.
    std::vector<std::string> evicted; ///< Suggestions partially overlapping the replaced range.
    std::size_t shifted = 0;        ///< Suggestions moved by delta.
};

/**
 * @class ApplyEngine
 * @brief Accepts or dismisses a resolved suggestion as one transaction.
 *
 * Apply validates before mutating anything. It then splices the replacement,
 * removes the suggestions inside the replaced range, evicts the ones it cuts
 * into, shifts the ones after it, and pushes an immediate history checkpoint.
 */
class ApplyEngine {
public:
    ApplyEngine(domain::TextBuffer& buffer, SuggestionIndex& index, EditHistory& history);

    ApplyResult apply(const std::string& suggestionId, domain::Clock::time_point now);

    /** @brief Removes the suggestion without touching text or history. */
    bool dismiss(const std::string& suggestionId);

    /**
     * @brief Re-adds a leading/trailing space the model dropped from its replacement.
     *
     * Keeps "a  word" from collapsing into "aword" when the original literal
     * carried the separator.
     */
    static std::string PreserveEdgeSpaces(const std::string& originalLiteral, std::string replacement);

private:
    void checkpointBeforeApply(domain::Clock::time_point now);

    domain::TextBuffer& m_buffer;
    SuggestionIndex& m_index;
    EditHistory& m_history;
};

} // namespace redline::application
