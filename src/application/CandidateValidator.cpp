/**
 * @file CandidateValidator.cpp
 * @brief Implementation of CandidateValidator.
 */

#include "application/CandidateValidator.hpp"
#include <string>

namespace redline::application {

namespace {

std::optional<std::string> NonEmptyString(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<domain::CorrectionCandidate> CandidateValidator::validate(const nlohmann::json& record) const {
    if (!record.is_object()) {
        return std::nullopt;
    }

    auto type = NonEmptyString(record, "type");
    auto original = NonEmptyString(record, "originalText");
    auto suggested = NonEmptyString(record, "suggestedText");
    if (!type || !original || !suggested) {
        return std::nullopt;
    }

    auto kind = domain::SuggestionTypeFromString(*type);
    if (!kind) {
        return std::nullopt;
    }

    domain::CorrectionCandidate candidate;
    candidate.kind = *kind;
    candidate.originalLiteral = std::move(*original);
    candidate.suggestedLiteral = std::move(*suggested);

    auto explanation = record.find("explanation");
    if (explanation != record.end() && explanation->is_string()) {
        candidate.explanation = explanation->get<std::string>();
    }
    return candidate;
}

} // namespace redline::application
