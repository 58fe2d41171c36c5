/**
 * @file OllamaProposalSource.hpp
 * @brief ProposalSource backed by a local Ollama model.
 */

#pragma once

#include <string>
#include "domain/ProposalSource.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace redline::infrastructure {

class OllamaProposalSource : public domain::ProposalSource {
public:
    OllamaProposalSource(OllamaClient client, std::string model);

    bool isConfigured() const override;
    bool isReachable() override;
    domain::StreamStatus streamProposals(const std::string& text,
                                         domain::AnalysisLevel level,
                                         const ChunkCallback& onChunk) override;

    const std::string& model() const { return m_model; }

private:
    OllamaClient m_client;
    std::string m_model;
};

} // namespace redline::infrastructure
