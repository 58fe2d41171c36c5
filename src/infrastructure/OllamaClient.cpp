#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include <string_view>
#include <nlohmann/json.hpp>

namespace redline::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

domain::StreamStatus OllamaClient::generateStream(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  const TokenCallback& onToken) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600); // 10 min

    json requestData = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", true},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    OllamaStreamReader reader(onToken);
    int httpStatus = 0;

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/generate";
    req.set_header("Content-Type", "application/json");
    req.body = requestData.dump();
    req.response_handler = [&](const httplib::Response& response) {
        httpStatus = response.status;
        return response.status == 200;
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t /*offset*/, uint64_t /*total*/) {
        return reader.feed(std::string_view(data, length));
    };

    auto res = cli.send(req);
    reader.finish();
    if (reader.cancelled() || reader.failed()) {
        return reader.status();
    }
    if (httpStatus != 0 && httpStatus != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << httpStatus << std::endl;
        return domain::StreamStatus::Failed;
    }
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        return domain::StreamStatus::Failed;
    }
    return reader.status();
}

std::optional<std::vector<std::string>> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(2);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        return std::nullopt;
    }
    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Bad /api/tags response: " << e.what() << std::endl;
    }
    return models;
}

} // namespace redline::infrastructure
