/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the proofreading prompts sent to the model.
 */

#pragma once

#include <string>
#include "domain/Suggestion.hpp"

namespace redline::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt describing the streaming record format and the types the level may report. */
    static std::string GetSystemPrompt(domain::AnalysisLevel level);

    /** @brief The per-request prompt for the given level, with the text embedded. */
    static std::string GetAnalysisPrompt(domain::AnalysisLevel level, const std::string& text);
};

} // namespace redline::infrastructure
