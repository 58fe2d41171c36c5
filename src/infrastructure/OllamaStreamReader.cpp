/**
 * @file OllamaStreamReader.cpp
 * @brief Implementation of OllamaStreamReader.
 */

#include "infrastructure/OllamaStreamReader.hpp"
#include <iostream>
#include <utility>
#include <nlohmann/json.hpp>

namespace redline::infrastructure {

using json = nlohmann::json;

OllamaStreamReader::OllamaStreamReader(TokenCallback onToken)
    : m_onToken(std::move(onToken)) {}

bool OllamaStreamReader::feed(std::string_view data) {
    if (m_failed || m_cancelled) {
        return false;
    }
    m_pending.append(data.data(), data.size());
    std::size_t newline;
    while ((newline = m_pending.find('\n')) != std::string::npos) {
        std::string line = m_pending.substr(0, newline);
        m_pending.erase(0, newline + 1);
        if (!consumeLine(line)) {
            return false;
        }
    }
    return true;
}

void OllamaStreamReader::finish() {
    if (m_failed || m_cancelled || m_pending.empty()) {
        return;
    }
    std::string line;
    line.swap(m_pending);
    consumeLine(line);
}

domain::StreamStatus OllamaStreamReader::status() const {
    if (m_cancelled) {
        return domain::StreamStatus::Cancelled;
    }
    if (m_failed) {
        return domain::StreamStatus::Failed;
    }
    if (!m_done) {
        std::cerr << "[OllamaStreamReader] Stream ended before completion" << std::endl;
        return domain::StreamStatus::Failed;
    }
    return domain::StreamStatus::Completed;
}

bool OllamaStreamReader::consumeLine(const std::string& line) {
    if (line.empty() || line == "\r") {
        return true;
    }
    try {
        auto body = json::parse(line);
        if (body.contains("error")) {
            std::cerr << "[OllamaStreamReader] Model error: " << body["error"].dump() << std::endl;
            m_failed = true;
            return false;
        }
        if (body.contains("response") && body["response"].is_string()) {
            const std::string token = body["response"].get<std::string>();
            if (!token.empty() && !m_onToken(token)) {
                m_cancelled = true;
                return false;
            }
        }
        if (body.value("done", false)) {
            m_done = true;
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaStreamReader] JSON Parse Error: " << e.what() << std::endl;
        m_failed = true;
        return false;
    }
    return true;
}

} // namespace redline::infrastructure
