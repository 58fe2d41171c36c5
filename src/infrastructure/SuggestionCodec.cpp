/**
 * @file SuggestionCodec.cpp
 * @brief Implementation of SuggestionCodec.
 */

#include "infrastructure/SuggestionCodec.hpp"
#include <iostream>

namespace redline::infrastructure {

using json = nlohmann::json;

json SuggestionCodec::ToJson(const domain::ResolvedSuggestion& suggestion) {
    return json{
        {"id", suggestion.id},
        {"type", domain::SuggestionTypeToString(suggestion.kind)},
        {"span", {
            {"start", suggestion.span.start},
            {"end", suggestion.span.end},
            {"text", suggestion.originalLiteral}
        }},
        {"originalText", suggestion.originalLiteral},
        {"suggestedText", suggestion.suggestedLiteral},
        {"description", suggestion.explanation},
        {"confidence", suggestion.confidence},
        {"icon", suggestion.icon},
        {"title", suggestion.title}
    };
}

std::string SuggestionCodec::EncodeLine(const domain::ResolvedSuggestion& suggestion) {
    // Replace invalid UTF-8 from the model instead of throwing mid-stream.
    return ToJson(suggestion).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::optional<domain::ResolvedSuggestion> SuggestionCodec::FromJson(const json& j) {
    try {
        if (!j.is_object() || !j.contains("span") || !j["span"].is_object()) {
            return std::nullopt;
        }
        auto kind = domain::SuggestionTypeFromString(j.at("type").get<std::string>());
        if (!kind) {
            return std::nullopt;
        }

        domain::ResolvedSuggestion suggestion;
        suggestion.id = j.at("id").get<std::string>();
        suggestion.kind = *kind;
        suggestion.span.start = j["span"].at("start").get<std::size_t>();
        suggestion.span.end = j["span"].at("end").get<std::size_t>();
        suggestion.originalLiteral = j.at("originalText").get<std::string>();
        suggestion.suggestedLiteral = j.at("suggestedText").get<std::string>();
        suggestion.explanation = j.value("description", std::string());
        suggestion.confidence = j.value("confidence", suggestion.confidence);
        suggestion.priority = domain::SuggestionPriority(*kind);
        suggestion.title = j.value("title", domain::SuggestionTitle(*kind));
        suggestion.icon = j.value("icon", domain::SuggestionIcon(*kind));
        return suggestion;
    } catch (const json::exception& e) {
        std::cerr << "[SuggestionCodec] Bad suggestion record: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::ResolvedSuggestion> SuggestionCodec::DecodeLine(const std::string& line) {
    try {
        return FromJson(json::parse(line));
    } catch (const json::parse_error& e) {
        std::cerr << "[SuggestionCodec] Bad line: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace redline::infrastructure
