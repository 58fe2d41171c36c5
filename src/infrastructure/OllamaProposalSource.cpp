#include "infrastructure/OllamaProposalSource.hpp"
#include <algorithm>
#include <iostream>
#include <utility>
#include "infrastructure/PromptCatalog.hpp"

namespace redline::infrastructure {

OllamaProposalSource::OllamaProposalSource(OllamaClient client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

bool OllamaProposalSource::isConfigured() const {
    return !m_model.empty();
}

bool OllamaProposalSource::isReachable() {
    auto models = m_client.getAvailableModels();
    if (!models) {
        std::cerr << "[OllamaProposalSource] Ollama not reachable at "
                  << m_client.host() << ":" << m_client.port() << std::endl;
        return false;
    }
    if (std::find(models->begin(), models->end(), m_model) == models->end()) {
        // Ollama may still resolve tags such as "llama3" -> "llama3:latest".
        std::cerr << "[OllamaProposalSource] Model " << m_model << " not listed by Ollama" << std::endl;
    }
    return true;
}

domain::StreamStatus OllamaProposalSource::streamProposals(const std::string& text,
                                                           domain::AnalysisLevel level,
                                                           const ChunkCallback& onChunk) {
    return m_client.generateStream(m_model,
                                   PromptCatalog::GetSystemPrompt(level),
                                   PromptCatalog::GetAnalysisPrompt(level, text),
                                   onChunk);
}

} // namespace redline::infrastructure
