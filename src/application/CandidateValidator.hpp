/**
 * @file CandidateValidator.hpp
 * @brief Structural validation of decoded proposal records.
 */

#pragma once
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/Suggestion.hpp"

namespace redline::application {

/**
 * @class CandidateValidator
 * @brief Turns a decoded JSON object into a CorrectionCandidate, or drops it.
 *
 * Requires non-empty string fields "type", "originalText" and "suggestedText",
 * and a known suggestion type. Rejections are silent: losing one proposal must
 * never abort the stream.
 */
class CandidateValidator {
public:
    std::optional<domain::CorrectionCandidate> validate(const nlohmann::json& record) const;
};

} // namespace redline::application
