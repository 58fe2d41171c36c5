#include <csignal>
#include <iostream>
#include <memory>

#include "application/GrammarCheckService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GrammarCheckServer.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaProposalSource.hpp"
#include "infrastructure/RateLimiter.hpp"
#include "infrastructure/ResultCache.hpp"

using namespace redline;

namespace {
infrastructure::GrammarCheckServer* g_server = nullptr;

void HandleSignal(int) {
    if (g_server) g_server->stop();
}
} // namespace

int main() {
    auto config = infrastructure::ConfigLoader::Load();

    auto source = std::make_shared<infrastructure::OllamaProposalSource>(
        infrastructure::OllamaClient(config.ollamaHost, config.ollamaPort), config.model);
    if (!source->isConfigured()) {
        std::cerr << "[Server] No model configured; every check will answer 500" << std::endl;
    }

    application::ServiceContext context;
    context.resultStore = std::make_shared<infrastructure::ResultCache>(config.cacheTtl, config.cacheSweepThreshold);
    context.rateLimiter = std::make_shared<infrastructure::RateLimiter>(config.rateLimit, config.rateWindow);

    application::GrammarCheckService service(source, context);
    infrastructure::GrammarCheckServer server(service);
    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    bool ok = server.listen(config.serverHost, config.serverPort);
    g_server = nullptr;
    return ok ? 0 : 1;
}
