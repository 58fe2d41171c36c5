/**
 * @file AnalysisWorker.cpp
 * @brief Implementation of AnalysisWorker.
 */

#include "application/AnalysisWorker.hpp"
#include <iostream>
#include <limits>
#include "application/AnalysisPipeline.hpp"

namespace redline::application {

AnalysisWorker::AnalysisWorker(std::shared_ptr<domain::ProposalSource> source)
    : m_source(std::move(source)) {
    m_thread = std::thread([this]() { loop(); });
}

AnalysisWorker::~AnalysisWorker() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
        m_pending.reset();
    }
    m_latestSequence = std::numeric_limits<std::uint64_t>::max();
    m_wake.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void AnalysisWorker::submit(AnalysisTicket ticket) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_latestSequence = ticket.sequence;
        m_pending = std::move(ticket);
    }
    m_wake.notify_one();
}

std::vector<AnalysisEvent> AnalysisWorker::drain() {
    std::lock_guard<std::mutex> lock(m_inboxMutex);
    std::vector<AnalysisEvent> events;
    events.swap(m_inbox);
    return events;
}

bool AnalysisWorker::busy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running || m_pending.has_value();
}

void AnalysisWorker::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this]() { return !m_running && !m_pending; });
}

void AnalysisWorker::loop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_wake.wait(lock, [this]() { return m_stopping || m_pending.has_value(); });
        if (m_stopping) {
            break;
        }
        auto ticket = std::make_shared<const AnalysisTicket>(std::move(*m_pending));
        m_pending.reset();
        m_running = true;
        lock.unlock();

        try {
            process(ticket);
        } catch (const std::exception& e) {
            std::cerr << "[AnalysisWorker] Pass " << ticket->sequence << " failed: " << e.what() << std::endl;
            publish({AnalysisEvent::Kind::Failed, ticket, {}, e.what()});
        }

        lock.lock();
        m_running = false;
        if (!m_pending) {
            m_idle.notify_all();
        }
    }
    m_running = false;
    m_idle.notify_all();
}

void AnalysisWorker::process(const std::shared_ptr<const AnalysisTicket>& ticket) {
    if (!m_source || !m_source->isConfigured()) {
        publish({AnalysisEvent::Kind::Failed, ticket, {}, "Model not configured"});
        return;
    }

    AnalysisPipeline pipeline(ticket->text);
    auto publishBatch = [&](const domain::SuggestionList& batch) {
        for (const auto& suggestion : batch) {
            publish({AnalysisEvent::Kind::Suggestion, ticket, suggestion, {}});
        }
    };

    auto status = m_source->streamProposals(ticket->text, ticket->level, [&](const std::string& chunk) {
        if (superseded(*ticket)) {
            return false;
        }
        publishBatch(pipeline.feed(chunk));
        return !superseded(*ticket);
    });

    switch (status) {
    case domain::StreamStatus::Completed:
        publishBatch(pipeline.finish());
        publish({AnalysisEvent::Kind::Completed, ticket, {}, {}});
        break;
    case domain::StreamStatus::Failed:
        publish({AnalysisEvent::Kind::Failed, ticket, {}, "Upstream stream failed"});
        break;
    case domain::StreamStatus::Cancelled:
        std::cout << "[AnalysisWorker] Pass " << ticket->sequence << " superseded" << std::endl;
        break;
    }
}

bool AnalysisWorker::superseded(const AnalysisTicket& ticket) const {
    return m_latestSequence.load() != ticket.sequence;
}

void AnalysisWorker::publish(AnalysisEvent event) {
    std::lock_guard<std::mutex> lock(m_inboxMutex);
    m_inbox.push_back(std::move(event));
}

} // namespace redline::application
