/**
 * @file StreamDecoder.hpp
 * @brief Resumable decoder that extracts proposal records from a fragmented model stream.
 */

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "application/CandidateValidator.hpp"
#include "domain/Suggestion.hpp"

namespace redline::application {

/**
 * @class StreamDecoder
 * @brief Turns arbitrarily chunked near-JSON text into CorrectionCandidates.
 *
 * The decoder scans for '{', accumulates until the brace depth returns to zero
 * and parses the record. Braces inside string literals (with backslash escapes)
 * are not counted and code fences outside strings are stripped. Scan position,
 * depth, quote state and the partial record survive between feed() calls, so
 * the output does not depend on where the chunks were split.
 */
class StreamDecoder {
public:
    enum class State {
        Scanning,    ///< Looking for the next '{'.
        Accumulating ///< Inside a record, counting depth.
    };

    StreamDecoder() = default;

    /**
     * @brief Consumes the next fragment of the stream.
     * @return Candidates completed by this fragment, in stream order.
     */
    std::vector<domain::CorrectionCandidate> feed(std::string_view chunk);

    /**
     * @brief Signals the end of the stream.
     *
     * A record that never balanced is treated like a parse failure: scanning
     * resumes one character after its '{' so records nested behind a stray brace
     * are still recovered. Whatever remains incomplete is discarded.
     */
    std::vector<domain::CorrectionCandidate> finish();

    /** @brief Drops all buffered input and counters. */
    void reset();

    State state() const { return m_state; }
    std::size_t emittedCount() const { return m_emitted; }
    std::size_t rejectedCount() const { return m_rejected; }
    std::size_t malformedCount() const { return m_malformed; }

private:
    enum class FenceMatch { None, Partial, Full };

    void run(std::vector<domain::CorrectionCandidate>& out);
    void completeRecord(std::vector<domain::CorrectionCandidate>& out);
    void abandonRecord();
    FenceMatch matchFence(std::size_t pos, std::size_t& length) const;
    void compact();

    CandidateValidator m_validator;
    std::string m_buffer;      ///< Unconsumed input.
    std::size_t m_pos = 0;     ///< Scan cursor into m_buffer.
    State m_state = State::Scanning;
    std::size_t m_recordStart = 0; ///< Offset of the opening '{' in m_buffer.
    std::string m_record;      ///< Current record with fences removed.
    int m_depth = 0;
    bool m_inString = false;
    bool m_escape = false;
    bool m_finishing = false;

    std::size_t m_emitted = 0;
    std::size_t m_rejected = 0;
    std::size_t m_malformed = 0;
};

} // namespace redline::application
