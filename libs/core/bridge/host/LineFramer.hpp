#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Splits a byte stream into '\n'-terminated lines. A trailing '\r' is stripped.
// Bytes after the last terminator are held until more input arrives.
// A line longer than maxLine is discarded up to its terminator and counted.
class LineFramer {
public:
    static constexpr size_t kDefaultMaxLine = 1024 * 1024;

    explicit LineFramer(size_t maxLine = kDefaultMaxLine)
        : m_maxLine(maxLine > 0 ? maxLine : 1)
    {}

    std::vector<std::string> feed(std::string_view chunk) {
        std::vector<std::string> lines;
        size_t pos = 0;
        while (pos < chunk.size()) {
            const auto nl = chunk.find('\n', pos);
            const auto piece = chunk.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);

            if (m_discarding) {
                if (nl == std::string_view::npos) return lines;
                m_discarding = false;
                pos = nl + 1;
                continue;
            }

            if (m_buffer.size() + piece.size() > m_maxLine) {
                m_buffer.clear();
                ++m_overflows;
                m_discarding = (nl == std::string_view::npos);
                if (m_discarding) return lines;
                pos = nl + 1;
                continue;
            }

            m_buffer.append(piece);
            if (nl == std::string_view::npos) return lines;

            if (!m_buffer.empty() && m_buffer.back() == '\r') m_buffer.pop_back();
            lines.push_back(std::move(m_buffer));
            m_buffer.clear();
            pos = nl + 1;
        }
        return lines;
    }

    bool hasPartial() const { return !m_buffer.empty() || m_discarding; }
    size_t partialSize() const { return m_buffer.size(); }
    size_t overflows() const { return m_overflows; }

    void reset() {
        m_buffer.clear();
        m_discarding = false;
    }

private:
    size_t      m_maxLine;
    std::string m_buffer;
    bool        m_discarding = false;
    size_t      m_overflows = 0;
};
