/**
 * @file SuggestionCodec.hpp
 * @brief JSON wire format of a resolved suggestion (one NDJSON line per suggestion).
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Suggestion.hpp"

namespace redline::infrastructure {

class SuggestionCodec {
public:
    /**
     * @brief Serializes to the wire object:
     * { id, type, span:{start,end,text}, originalText, suggestedText, description, confidence, icon, title }.
     */
    static nlohmann::json ToJson(const domain::ResolvedSuggestion& suggestion);

    /** @brief Compact JSON followed by '\n'. */
    static std::string EncodeLine(const domain::ResolvedSuggestion& suggestion);

    /** @brief Reads a wire object back; std::nullopt if a required field is missing or mistyped. */
    static std::optional<domain::ResolvedSuggestion> FromJson(const nlohmann::json& j);

    static std::optional<domain::ResolvedSuggestion> DecodeLine(const std::string& line);
};

} // namespace redline::infrastructure
