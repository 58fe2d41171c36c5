/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/ProposalSource.hpp"
#include "infrastructure/OllamaStreamReader.hpp"

namespace redline::infrastructure {

class OllamaClient {
public:
    using TokenCallback = OllamaStreamReader::TokenCallback;

    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a streaming POST request to /api/generate.
     *
     * Ollama answers with NDJSON lines `{"response": "...", "done": false}`; each
     * response fragment is forwarded in order.
     * @return Completed when Ollama reported `done`, Cancelled if the callback
     *         stopped the stream, Failed otherwise.
     */
    domain::StreamStatus generateStream(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        const TokenCallback& onToken);

    /** @brief Fetches available models from /api/tags; std::nullopt if the server cannot be reached. */
    std::optional<std::vector<std::string>> getAvailableModels();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
};

} // namespace redline::infrastructure
