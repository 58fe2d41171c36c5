/**
 * @file GrammarCheckServer.hpp
 * @brief HTTP front end: POST /api/grammar/check streaming NDJSON suggestions.
 */

#pragma once

#include <memory>
#include <string>
#include "application/GrammarCheckService.hpp"

namespace httplib {
class Server;
}

namespace redline::infrastructure {

/**
 * @class GrammarCheckServer
 * @brief Binds a GrammarCheckService to a cpp-httplib server.
 *
 * Status and X-Cache-Status are decided before the chunked body starts; the
 * body is written line by line as suggestions resolve.
 */
class GrammarCheckServer {
public:
    explicit GrammarCheckServer(application::GrammarCheckService& service);
    ~GrammarCheckServer();

    GrammarCheckServer(const GrammarCheckServer&) = delete;
    GrammarCheckServer& operator=(const GrammarCheckServer&) = delete;

    /** @brief Blocks serving requests until stop() is called. Returns false if binding failed. */
    bool listen(const std::string& host, int port);

    /** @brief Binds to an ephemeral port; returns it, or -1 on failure. Call listenAfterBind() next. */
    int bindToAnyPort(const std::string& host);
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

private:
    void registerRoutes();

    application::GrammarCheckService& m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace redline::infrastructure
