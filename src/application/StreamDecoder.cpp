/**
 * @file StreamDecoder.cpp
 * @brief Implementation of StreamDecoder.
 */

#include "application/StreamDecoder.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace redline::application {

namespace {
constexpr std::string_view kFence = "```";
constexpr std::string_view kJsonFence = "```json";
constexpr std::size_t kLogPreview = 80;

bool IsPrefixOf(std::string_view candidate, std::string_view full) {
    return candidate.size() <= full.size() && full.compare(0, candidate.size(), candidate) == 0;
}
} // namespace

std::vector<domain::CorrectionCandidate> StreamDecoder::feed(std::string_view chunk) {
    std::vector<domain::CorrectionCandidate> out;
    m_buffer.append(chunk.data(), chunk.size());
    run(out);
    compact();
    return out;
}

std::vector<domain::CorrectionCandidate> StreamDecoder::finish() {
    std::vector<domain::CorrectionCandidate> out;
    m_finishing = true;
    run(out);
    while (m_state == State::Accumulating) {
        abandonRecord();
        run(out);
    }
    m_buffer.clear();
    m_pos = 0;
    m_finishing = false;
    return out;
}

void StreamDecoder::reset() {
    m_buffer.clear();
    m_record.clear();
    m_pos = 0;
    m_recordStart = 0;
    m_state = State::Scanning;
    m_depth = 0;
    m_inString = false;
    m_escape = false;
    m_finishing = false;
    m_emitted = 0;
    m_rejected = 0;
    m_malformed = 0;
}

void StreamDecoder::run(std::vector<domain::CorrectionCandidate>& out) {
    while (m_pos < m_buffer.size()) {
        const char ch = m_buffer[m_pos];

        if (m_state == State::Scanning) {
            if (ch == '{') {
                m_state = State::Accumulating;
                m_recordStart = m_pos;
                m_record.assign(1, '{');
                m_depth = 1;
                m_inString = false;
                m_escape = false;
            }
            ++m_pos;
            continue;
        }

        if (!m_inString && ch == '`') {
            std::size_t length = 0;
            FenceMatch fence = matchFence(m_pos, length);
            if (fence == FenceMatch::Partial) {
                return; // wait for the rest of the marker
            }
            if (fence == FenceMatch::Full) {
                m_pos += length;
                continue;
            }
        }

        m_record.push_back(ch);
        ++m_pos;

        if (m_inString) {
            if (m_escape) {
                m_escape = false;
            } else if (ch == '\\') {
                m_escape = true;
            } else if (ch == '"') {
                m_inString = false;
            }
            continue;
        }

        if (ch == '"') {
            m_inString = true;
        } else if (ch == '{') {
            ++m_depth;
        } else if (ch == '}') {
            if (--m_depth == 0) {
                completeRecord(out);
            }
        }
    }
}

void StreamDecoder::completeRecord(std::vector<domain::CorrectionCandidate>& out) {
    json record;
    try {
        record = json::parse(m_record);
    } catch (const json::exception& e) {
        std::cerr << "[StreamDecoder] Could not parse potential record: "
                  << m_record.substr(0, kLogPreview) << " (" << e.what() << ")" << std::endl;
        abandonRecord();
        return;
    }

    m_state = State::Scanning;
    m_record.clear();

    auto candidate = m_validator.validate(record);
    if (candidate) {
        ++m_emitted;
        out.push_back(std::move(*candidate));
    } else {
        ++m_rejected;
    }
}

void StreamDecoder::abandonRecord() {
    ++m_malformed;
    m_pos = m_recordStart + 1;
    m_state = State::Scanning;
    m_record.clear();
    m_depth = 0;
    m_inString = false;
    m_escape = false;
}

StreamDecoder::FenceMatch StreamDecoder::matchFence(std::size_t pos, std::size_t& length) const {
    std::string_view rest(m_buffer.data() + pos, m_buffer.size() - pos);

    if (rest.size() < kFence.size()) {
        return (!m_finishing && IsPrefixOf(rest, kFence)) ? FenceMatch::Partial : FenceMatch::None;
    }
    if (rest.compare(0, kFence.size(), kFence) != 0) {
        return FenceMatch::None;
    }

    // "```json" optionally followed by a newline, otherwise a bare "```".
    if (rest.size() < kJsonFence.size() + 1 && IsPrefixOf(rest, std::string(kJsonFence) + "\n")) {
        if (!m_finishing) {
            return FenceMatch::Partial;
        }
    }
    if (rest.compare(0, kJsonFence.size(), kJsonFence) == 0) {
        length = kJsonFence.size();
        if (rest.size() > length && rest[length] == '\n') {
            ++length;
        }
        return FenceMatch::Full;
    }
    length = kFence.size();
    return FenceMatch::Full;
}

void StreamDecoder::compact() {
    std::size_t keepFrom = (m_state == State::Accumulating) ? m_recordStart : m_pos;
    if (keepFrom == 0) {
        return;
    }
    m_buffer.erase(0, keepFrom);
    m_pos -= keepFrom;
    if (m_state == State::Accumulating) {
        m_recordStart = 0;
    }
}

} // namespace redline::application
