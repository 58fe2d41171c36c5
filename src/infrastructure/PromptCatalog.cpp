#include "infrastructure/PromptCatalog.hpp"

namespace redline::infrastructure {

std::string PromptCatalog::GetSystemPrompt(domain::AnalysisLevel level) {
    const bool style = level == domain::AnalysisLevel::Style;
    std::string prompt =
        "You are a fast and efficient writing assistant.\n\n"
        "For each issue you find, stream a single, complete JSON object on a new line. "
        "Do not wrap them in an array or a parent JSON object. Each JSON object must have this exact structure:\n"
        "{\n";
    prompt += style
        ? "  \"type\": \"spelling\" | \"grammar\" | \"clarity\" | \"conciseness\" | \"passive-voice\" | \"tone\" | \"cta\",\n"
        : "  \"type\": \"spelling\" | \"grammar\",\n";
    prompt +=
        "  \"originalText\": \"the exact text with the issue\",\n"
        "  \"suggestedText\": \"the improved or corrected version\",\n"
        "  \"explanation\": \"a brief explanation of why the change is better\"\n"
        "}\n\n"
        "IMPORTANT:\n"
        "- Prioritize ACCURACY. Only identify definite issues.\n"
        "- Be extremely confident before reporting an error. If a phrase could be interpreted as correct in any context, do not flag it.\n"
        "- Copy originalText exactly as it appears in the text, including capitalization.\n";
    prompt += style
        ? "- Stylistic suggestions may cover a whole phrase or sentence, even one that also contains an error.\n"
        : "- Do not suggest stylistic changes.\n";
    prompt +=
        "- Do not flag errors in what might be incomplete sentences. Wait for a natural pause.\n"
        "- Each JSON object MUST be on its own line.\n"
        "- Do NOT return a list or an array. Stream one object at a time.\n"
        "- If no issues are found, return nothing.";
    return prompt;
}

std::string PromptCatalog::GetAnalysisPrompt(domain::AnalysisLevel level, const std::string& text) {
    std::string task;
    switch (level) {
    case domain::AnalysisLevel::Spelling:
        task = "Your ONLY task is to identify spelling errors in the text below.";
        break;
    case domain::AnalysisLevel::Full:
        task = "Your ONLY task is to identify grammar and spelling errors in the text below.";
        break;
    case domain::AnalysisLevel::Style:
        task =
            "Analyze the text below for these issues:\n"
            "- spelling: find and correct spelling mistakes\n"
            "- grammar: find and correct grammatical errors\n"
            "- clarity: find and correct unclear or confusing sentences\n"
            "- conciseness: find and correct verbose or wordy phrases\n"
            "- passive-voice: find and correct passive voice constructions\n"
            "- tone: find and correct wording whose tone does not fit the text\n"
            "- cta: find and strengthen weak or missing calls to action";
        break;
    }
    return task + "\n\nText to analyze:\n\"" + text + "\"\n";
}

} // namespace redline::infrastructure
