/**
 * @file GrammarCheckServer.cpp
 * @brief Implementation of GrammarCheckServer.
 */

#include "infrastructure/GrammarCheckServer.hpp"
#include <httplib.h>
#include <iostream>

namespace redline::infrastructure {

namespace {

constexpr const char* kNdjsonContentType = "application/json; charset=utf-8";

struct StreamJob {
    application::CheckRequest request;
    application::CheckAdmission admission;
};

} // namespace

GrammarCheckServer::GrammarCheckServer(application::GrammarCheckService& service)
    : m_service(service), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

GrammarCheckServer::~GrammarCheckServer() {
    stop();
}

void GrammarCheckServer::registerRoutes() {
    m_server->Post("/api/grammar/check", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string clientKey = application::GrammarCheckService::ClientKey(
            req.get_header_value("X-Forwarded-For"), req.get_header_value("X-Real-IP"));

        std::string error;
        auto request = application::GrammarCheckService::ParseRequest(req.body, clientKey, error);
        if (!request) {
            res.status = 400;
            res.set_content(error, "text/plain");
            return;
        }

        auto admission = m_service.admit(*request);
        if (!admission.admitted()) {
            res.status = admission.status;
            res.set_content(admission.message, "text/plain");
            return;
        }

        res.set_header("X-Cache-Status", admission.cacheHit() ? "HIT" : "MISS");
        auto job = std::make_shared<StreamJob>(StreamJob{std::move(*request), std::move(admission)});
        res.set_chunked_content_provider(kNdjsonContentType, [this, job](size_t /*offset*/, httplib::DataSink& sink) {
            auto status = m_service.run(job->request, job->admission, [&sink](const std::string& line) {
                return sink.write(line.data(), line.size());
            });
            if (status == domain::StreamStatus::Failed) {
                // Abort the connection so the client sees a terminal error after the flushed lines.
                return false;
            }
            sink.done();
            return true;
        });
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[GrammarCheckServer] " << req.path << " failed: " << e.what() << std::endl;
        }
        res.status = 500;
        res.set_content("Internal server error", "text/plain");
    });
}

bool GrammarCheckServer::listen(const std::string& host, int port) {
    std::cout << "[GrammarCheckServer] Listening on " << host << ":" << port << std::endl;
    if (!m_server->listen(host, port)) {
        std::cerr << "[GrammarCheckServer] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

int GrammarCheckServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool GrammarCheckServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void GrammarCheckServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool GrammarCheckServer::isRunning() const {
    return m_server && m_server->is_running();
}

} // namespace redline::infrastructure
