#pragma once
/**
 * @file transport_base.hpp
 * @brief Line transport interface used between the coordinator and one node.
 *
 * Every blocking call takes an absolute deadline; none waits forever.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace fedsim::transport {

// Return codes kept small; callers map them to ErrorKind.
enum class IoResult : uint8_t { Ok=0, Timeout=1, Closed=2, Error=3, Overflow=4 };

inline const char* io_result_name(IoResult r) {
  switch (r) {
    case IoResult::Ok:       return "ok";
    case IoResult::Timeout:  return "timeout";
    case IoResult::Closed:   return "closed";
    case IoResult::Error:    return "error";
    case IoResult::Overflow: return "overflow";
  }
  return "unknown";
}

using Clock    = std::chrono::steady_clock;
using Deadline = Clock::time_point;

inline Deadline deadline_in_ms(int64_t ms) {
  return Clock::now() + std::chrono::milliseconds(ms < 0 ? 0 : ms);
}

/**
 * @brief Bidirectional, newline-framed message channel.
 *
 * Contract:
 *  - send_line(line, dl) writes `line` + '\n' completely or reports why not.
 *  - recv_line(out, dl) returns exactly one line (terminator stripped).
 *  - wait_closed(dl) discards input until the peer closes; true on EOF.
 *  - abort() may be called from another thread; pending and later I/O fail fast.
 *  - close() releases the resource; idempotent, single-threaded use only.
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual IoResult    send_line(const std::string& line, Deadline dl) = 0;
  virtual IoResult    recv_line(std::string& out, Deadline dl) = 0;
  virtual bool        wait_closed(Deadline dl) = 0;
  virtual void        abort() = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual const char* name() const = 0;
  virtual std::string last_error() const = 0;
};

} // namespace fedsim::transport
