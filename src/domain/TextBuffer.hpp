/**
 * @file TextBuffer.hpp
 * @brief The canonical, versioned document text.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace redline::domain {

/**
 * @class TextBuffer
 * @brief Single mutable string holding the document content.
 *
 * Every mutation bumps the version. Collaborators read it through snapshot(),
 * never through a mutable alias.
 */
class TextBuffer {
public:
    TextBuffer() = default;
    explicit TextBuffer(std::string initial) : m_text(std::move(initial)) {}

    const std::string& text() const { return m_text; }
    std::string snapshot() const { return m_text; }
    std::size_t size() const { return m_text.size(); }
    std::uint64_t version() const { return m_version; }

    /** @brief Returns the bytes in [start, end). Throws std::out_of_range on a bad range. */
    std::string slice(std::size_t start, std::size_t end) const {
        if (start > end || end > m_text.size()) {
            throw std::out_of_range("TextBuffer slice out of range");
        }
        return m_text.substr(start, end - start);
    }

    /**
     * @brief Replaces [start, end) with the replacement text.
     * @throws std::out_of_range if the range is outside the buffer.
     */
    void splice(std::size_t start, std::size_t end, const std::string& replacement) {
        if (start > end || end > m_text.size()) {
            throw std::out_of_range("TextBuffer splice out of range");
        }
        m_text.replace(start, end - start, replacement);
        ++m_version;
    }

    /** @brief Replaces the whole content (undo/redo restore). */
    void assign(std::string content) {
        m_text = std::move(content);
        ++m_version;
    }

private:
    std::string m_text;
    std::uint64_t m_version = 0;
};

} // namespace redline::domain
