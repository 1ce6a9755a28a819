#pragma once

/**
 * @page fs-line-framing fedsim Line Framing
 * @file line_framer.hpp
 * @brief Newline framing for the coordinator/node protocol over any byte stream.
 *
 * @details
 * OVERVIEW
 * --------
 * Every protocol message is one line of UTF-8 text ending in '\n'. The byte stream
 * underneath (TCP, Unix socket, socketpair) does not preserve write boundaries: one
 * read can carry half a line, or three lines and the start of a fourth. The framer
 * buffers bytes and hands out complete lines only.
 *
 * RULES
 * -----
 *   - A line ends at '\n'. The '\n' is not part of the delivered line.
 *   - One trailing '\r' is stripped, so CRLF peers work unchanged.
 *   - Empty lines are delivered as empty strings; the codec decides what they mean.
 *   - A partial line longer than MAX_LINE bytes sets `overflow` and the framer stops
 *     producing lines. The connection is no longer trustworthy at that point.
 *
 * EXAMPLES
 * --------
 * @code
 *   fedsim::line::framer fr;
 *   fr.feed("DONE\n[]", 7);
 *   std::string l;
 *   fr.next_line(l);   // true, l == "DONE"
 *   fr.next_line(l);   // false, "[]" still waiting for its '\n'
 *   fr.feed("\n", 1);
 *   fr.next_line(l);   // true, l == "[]"
 * @endcode
 */

#include <cstddef>
#include <string>

namespace fedsim {
namespace line {

/// Longest accepted line, excluding the terminator (16 MiB).
static constexpr std::size_t MAX_LINE = 16u * 1024u * 1024u;

/**
 * @brief Append `payload` plus '\n' to `out`.
 *
 * @return false if `payload` itself contains '\n' (it would split into two lines).
 */
inline bool encode(const std::string& payload, std::string& out) {
    if (payload.find('\n') != std::string::npos) return false;
    out.reserve(out.size() + payload.size() + 1);
    out += payload;
    out += '\n';
    return true;
}

/**
 * @brief Stateful line splitter for chunked reads.
 */
struct framer {
    /// Bytes received but not yet returned as a line.
    std::string buf;

    /// Read offset into `buf`; consumed bytes are compacted lazily.
    std::size_t head = 0;

    /// Set once a partial line exceeded MAX_LINE.
    bool overflow = false;

    /**
     * @brief Append raw bytes from the stream.
     * @return false if the framer is (or just went) into overflow.
     */
    bool feed(const char* data, std::size_t n) {
        if (overflow) return false;
        buf.append(data, n);

        // only the unterminated tail can overflow
        const std::size_t last_nl = buf.rfind('\n');
        const std::size_t tail_start = (last_nl == std::string::npos || last_nl < head) ? head : last_nl + 1;
        if (buf.size() - tail_start > MAX_LINE) {
            overflow = true;
            return false;
        }
        return true;
    }

    /**
     * @brief Pop the next complete line, without its terminator.
     * @return true if `out` holds a line.
     */
    bool next_line(std::string& out) {
        if (overflow) return false;

        const std::size_t nl = buf.find('\n', head);
        if (nl == std::string::npos) {
            compact();
            return false;
        }
        if (nl - head > MAX_LINE) {             // terminated, but still too long
            overflow = true;
            return false;
        }

        std::size_t end = nl;
        if (end > head && buf[end - 1] == '\r') --end;   // CRLF tolerance
        out.assign(buf, head, end - head);
        head = nl + 1;
        if (head == buf.size()) { buf.clear(); head = 0; }
        return true;
    }

    /// True if a complete line is already buffered.
    bool has_line() const {
        return !overflow && buf.find('\n', head) != std::string::npos;
    }

    /// Bytes buffered but not yet returned.
    std::size_t pending() const { return buf.size() - head; }

    void reset() {
        buf.clear();
        head = 0;
        overflow = false;
    }

private:
    void compact() {
        if (head == 0) return;
        buf.erase(0, head);
        head = 0;
    }
};

} // namespace line
} // namespace fedsim
