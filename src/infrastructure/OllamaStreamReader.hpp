/**
 * @file OllamaStreamReader.hpp
 * @brief Reassembles Ollama's NDJSON generate stream into token callbacks.
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include "domain/ProposalSource.hpp"

namespace redline::infrastructure {

/**
 * @class OllamaStreamReader
 * @brief Splits raw network reads into `{"response": ..., "done": ...}` lines.
 *
 * Lines may arrive split across any number of reads. A line carrying `error`,
 * or one that is not JSON, fails the stream. The stream only completes once a
 * line reported `done`.
 */
class OllamaStreamReader {
public:
    /** @brief Receives one `response` token fragment; return false to stop. */
    using TokenCallback = std::function<bool(const std::string& token)>;

    explicit OllamaStreamReader(TokenCallback onToken);

    /** @return False once reading should stop (error, bad line or cancellation). */
    bool feed(std::string_view data);

    /** @brief Consumes a last line that had no trailing newline. */
    void finish();

    /** @brief Cancelled if the callback stopped, Completed after `done`, Failed otherwise. */
    domain::StreamStatus status() const;

    bool cancelled() const { return m_cancelled; }
    bool failed() const { return m_failed; }
    bool done() const { return m_done; }

private:
    bool consumeLine(const std::string& line);

    TokenCallback m_onToken;
    std::string m_pending;
    bool m_done = false;
    bool m_failed = false;
    bool m_cancelled = false;
};

} // namespace redline::infrastructure
