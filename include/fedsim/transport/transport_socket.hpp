#pragma once
/**
 * @file transport_socket.hpp
 * @brief Stream-socket transport (TCP, Unix, socketpair) with newline framing.
 *
 * Header-only. Owns its fd: closed exactly once, by close() or the destructor.
 */

#include "fedsim/transport/transport_base.hpp"
#include "line_framer.hpp"
#include "socket_io.hpp"

#include <atomic>
#include <cstring>
#include <string>

namespace fedsim::transport {

class SocketTransport : public ITransport {
public:
  explicit SocketTransport(int fd, std::string label = "socket")
  : fd_(fd), label_(std::move(label)) {}

  ~SocketTransport() override { close(); }

  SocketTransport(const SocketTransport&) = delete;
  SocketTransport& operator=(const SocketTransport&) = delete;

  IoResult send_line(const std::string& line, Deadline dl) override {
    if (aborted_.load() || fd_ < 0) return IoResult::Closed;

    std::string wire;
    if (!line::encode(line, wire)) {           // embedded '\n' would desync the peer
      last_error_ = "line_contains_newline";
      return IoResult::Error;
    }

    int e = 0;
    const IoResult r = write_all(fd_, wire.data(), wire.size(), dl, e);
    if (r == IoResult::Error) last_error_ = std::strerror(e);
    return r;
  }

  IoResult recv_line(std::string& out, Deadline dl) override {
    return recv_line_impl(out, dl, false);
  }

  /// Node side: block until a line arrives, with no deadline.
  IoResult recv_line_blocking(std::string& out) {
    return recv_line_impl(out, Clock::now(), true);
  }

  bool wait_closed(Deadline dl) override {
    if (fd_ < 0) return true;
    char buf[4096];
    while (true) {
      std::size_t got = 0;
      int e = 0;
      const IoResult r = read_some(fd_, buf, sizeof(buf), got, dl, false, e);
      if (r == IoResult::Closed) return true;
      if (r == IoResult::Ok) continue;         // late output after SHUTDOWN is ignored
      return false;                            // timeout or error
    }
  }

  void abort() override {
    aborted_.store(true);
    shutdown_socket(fd_);                      // wakes a poll() in another thread
  }

  void close() override {
    if (fd_ >= 0) { close_socket(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  const char* name() const override { return label_.c_str(); }

  std::string last_error() const override { return last_error_; }

  int fd() const { return fd_; }

private:
  IoResult recv_line_impl(std::string& out, Deadline dl, bool infinite) {
    if (fd_ < 0) return IoResult::Closed;

    char buf[64 * 1024];
    while (true) {
      if (framer_.next_line(out)) return IoResult::Ok;       // already buffered
      if (framer_.overflow) { last_error_ = "line_too_long"; return IoResult::Overflow; }
      if (aborted_.load()) return IoResult::Closed;

      std::size_t got = 0;
      int e = 0;
      const IoResult r = read_some(fd_, buf, sizeof(buf), got, dl, infinite, e);
      if (r == IoResult::Error) { last_error_ = std::strerror(e); return r; }
      if (r != IoResult::Ok) return r;

      if (!framer_.feed(buf, got)) { last_error_ = "line_too_long"; return IoResult::Overflow; }
    }
  }

  int               fd_{-1};
  std::string       label_;
  line::framer      framer_;
  std::atomic<bool> aborted_{false};
  std::string       last_error_;
};

} // namespace fedsim::transport
