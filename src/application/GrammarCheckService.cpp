/**
 * @file GrammarCheckService.cpp
 * @brief Implementation of GrammarCheckService.
 */

#include "application/GrammarCheckService.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include "application/AnalysisPipeline.hpp"
#include "infrastructure/SuggestionCodec.hpp"

namespace redline::application {

using json = nlohmann::json;

namespace {

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

} // namespace

GrammarCheckService::GrammarCheckService(std::shared_ptr<domain::ProposalSource> source, ServiceContext context)
    : m_source(std::move(source)), m_context(std::move(context)) {}

std::optional<CheckRequest> GrammarCheckService::ParseRequest(const std::string& body,
                                                              const std::string& clientKey,
                                                              std::string& error) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception&) {
        error = "Invalid JSON body";
        return std::nullopt;
    }
    if (!j.is_object()) {
        error = "Invalid JSON body";
        return std::nullopt;
    }

    CheckRequest request;
    request.clientKey = clientKey.empty() ? "unknown" : clientKey;
    if (j.contains("text")) {
        if (!j["text"].is_string()) {
            error = "No text provided";
            return std::nullopt;
        }
        request.text = j["text"].get<std::string>();
    }
    if (j.contains("level") && !j["level"].is_null()) {
        auto level = j["level"].is_string()
            ? domain::AnalysisLevelFromString(j["level"].get<std::string>())
            : std::nullopt;
        if (!level) {
            error = "Unknown analysis level";
            return std::nullopt;
        }
        request.level = *level;
    }
    return request;
}

std::string GrammarCheckService::ClientKey(const std::string& forwardedFor, const std::string& realIp) {
    if (!forwardedFor.empty()) return forwardedFor;
    if (!realIp.empty()) return realIp;
    return "unknown";
}

domain::CacheKey GrammarCheckService::MakeCacheKey(const std::string& text, domain::AnalysisLevel level) {
    domain::CacheKey key;
    const std::string content = domain::AnalysisLevelToString(level) + '\n' + text;
    key.hash = std::to_string(std::hash<std::string>{}(content));
    key.text = text;
    key.level = level;
    return key;
}

CheckAdmission GrammarCheckService::admit(const CheckRequest& request) {
    CheckAdmission admission;

    if (!m_source || !m_source->isConfigured()) {
        admission.status = 500;
        admission.message = "Model not configured";
        return admission;
    }
    if (IsBlank(request.text)) {
        admission.status = 400;
        admission.message = "No text provided";
        return admission;
    }

    const auto now = m_context.clock();
    if (m_context.rateLimiter && !m_context.rateLimiter->tryAcquire(request.clientKey, now)) {
        admission.status = 429;
        admission.message = "Rate limit exceeded for grammar checks";
        return admission;
    }

    admission.key = MakeCacheKey(request.text, request.level);
    if (m_context.resultStore) {
        admission.cached = m_context.resultStore->get(admission.key, now);
        if (admission.cached) {
            return admission;
        }
    }

    if (!m_source->isReachable()) {
        std::cerr << "[GrammarCheckService] Upstream model is unreachable" << std::endl;
        admission.status = 500;
        admission.message = "Upstream model unreachable";
    }
    return admission;
}

domain::StreamStatus GrammarCheckService::run(const CheckRequest& request,
                                              const CheckAdmission& admission,
                                              const LineSink& sink) {
    if (admission.cached) {
        for (const auto& suggestion : *admission.cached) {
            if (!sink(infrastructure::SuggestionCodec::EncodeLine(suggestion))) {
                return domain::StreamStatus::Cancelled;
            }
        }
        return domain::StreamStatus::Completed;
    }

    AnalysisPipeline pipeline(request.text);
    domain::SuggestionList produced;
    bool sinkOpen = true;

    auto emit = [&](const domain::SuggestionList& batch) {
        for (const auto& suggestion : batch) {
            produced.push_back(suggestion);
            if (sinkOpen && !sink(infrastructure::SuggestionCodec::EncodeLine(suggestion))) {
                sinkOpen = false;
            }
        }
        return sinkOpen;
    };

    domain::StreamStatus status = m_source->streamProposals(
        request.text, request.level,
        [&](const std::string& chunk) { return emit(pipeline.feed(chunk)); });

    if (status == domain::StreamStatus::Completed) {
        emit(pipeline.finish());
        if (!sinkOpen) {
            status = domain::StreamStatus::Cancelled;
        }
    }

    std::cout << "[GrammarCheckService] Pass finished: " << pipeline.resolvedCount() << " resolved, "
              << pipeline.unresolvedCount() << " unresolved, "
              << pipeline.decoder().malformedCount() << " malformed" << std::endl;

    if (status == domain::StreamStatus::Completed && m_context.resultStore) {
        m_context.resultStore->put(admission.key, produced, m_context.clock());
    } else if (status == domain::StreamStatus::Failed) {
        std::cerr << "[GrammarCheckService] Upstream stream failed; result not cached" << std::endl;
    }
    return status;
}

} // namespace redline::application
