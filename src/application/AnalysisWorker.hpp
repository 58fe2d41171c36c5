/**
 * @file AnalysisWorker.hpp
 * @brief Background execution of analysis passes for an interactive editor.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/EditingSession.hpp"
#include "domain/ProposalSource.hpp"

namespace redline::application {

/**
 * @struct AnalysisEvent
 * @brief One message from the worker to the UI thread.
 */
struct AnalysisEvent {
    enum class Kind {
        Suggestion, ///< A resolved suggestion of the pass.
        Completed,  ///< The pass ended normally.
        Failed      ///< The pass ended with an upstream error; message says why.
    };

    Kind kind = Kind::Suggestion;
    std::shared_ptr<const AnalysisTicket> ticket;
    domain::ResolvedSuggestion suggestion;
    std::string message;
};

/**
 * @class AnalysisWorker
 * @brief Runs one pass at a time on its own thread and queues results in an inbox.
 *
 * Submitting a new ticket supersedes the pass in flight: its stream is stopped
 * at the next chunk and nothing more is queued for it. The UI thread drains the
 * inbox and feeds EditingSession, which owns all index mutation.
 */
class AnalysisWorker {
public:
    explicit AnalysisWorker(std::shared_ptr<domain::ProposalSource> source);
    ~AnalysisWorker();

    AnalysisWorker(const AnalysisWorker&) = delete;
    AnalysisWorker& operator=(const AnalysisWorker&) = delete;

    void submit(AnalysisTicket ticket);

    /** @brief Takes every queued event, oldest first. */
    std::vector<AnalysisEvent> drain();

    bool busy() const;

    /** @brief Blocks until no pass is queued or running. */
    void waitIdle();

private:
    void loop();
    void process(const std::shared_ptr<const AnalysisTicket>& ticket);
    bool superseded(const AnalysisTicket& ticket) const;
    void publish(AnalysisEvent event);

    std::shared_ptr<domain::ProposalSource> m_source;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::optional<AnalysisTicket> m_pending;
    bool m_running = false;
    bool m_stopping = false;
    std::atomic<std::uint64_t> m_latestSequence{0};

    std::mutex m_inboxMutex;
    std::vector<AnalysisEvent> m_inbox;

    std::thread m_thread;
};

} // namespace redline::application
