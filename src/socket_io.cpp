// ============================================================================
// socket_io.cpp: implementation for socket_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file socket_io.cpp
 */

#include "socket_io.hpp"   // declarations for parse_endpoint(), connect/listen/accept, bounded I/O

// POSIX socket headers
#include <sys/socket.h>    // socket, connect, bind, listen, accept, send, recv, shutdown
#include <sys/un.h>        // sockaddr_un for unix: endpoints
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>    // IPPROTO_TCP
#include <netinet/tcp.h>   // TCP_NODELAY
#include <poll.h>          // poll(2) for deadline-bounded waits
#include <fcntl.h>         // O_NONBLOCK for deadline-bounded connect
#include <unistd.h>        // ::close, ::unlink
#include <cerrno>          // errno
#include <cstring>         // strerror, memcpy
#include <chrono>
#include <thread>          // sleep_for between connect retries

namespace fedsim {

using transport::Clock;
using transport::Deadline;
using transport::IoResult;

// ---------------------------------------------------------------------------
// remaining_ms()
// --------------
// Milliseconds left until `dl`, clamped at 0; rounded up so a 0.4 ms remainder
// still polls once instead of spinning.
// ---------------------------------------------------------------------------
static int remaining_ms(Deadline dl) {
    const auto now = Clock::now();
    if (dl <= now) return 0;
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(dl - now).count();
    const long long ms = (us + 999) / 1000;
    return ms > 0x7fffffff ? 0x7fffffff : static_cast<int>(ms);
}

static std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}


// ---------------------------------------------------------------------------
// Endpoint::str() / parse_endpoint()
// ---------------------------------------------------------------------------
std::string Endpoint::str() const {
    if (kind == Kind::Unix) return "unix:" + path;
    if (host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

bool parse_endpoint(const std::string& text, Endpoint& out, std::string& err) {
    static const std::string UNIX_PREFIX = "unix:";

    if (text.compare(0, UNIX_PREFIX.size(), UNIX_PREFIX) == 0) {
        Endpoint ep;
        ep.kind = Endpoint::Kind::Unix;
        ep.path = text.substr(UNIX_PREFIX.size());
        if (ep.path.empty()) { err = "endpoint_empty_path"; return false; }
        if (ep.path.size() >= sizeof(sockaddr_un{}.sun_path)) { err = "endpoint_path_too_long"; return false; }
        out = ep;
        return true;
    }

    const std::size_t colon = text.rfind(':');
    if (colon == std::string::npos) { err = "endpoint_missing_port"; return false; }

    std::string host = text.substr(0, colon);
    const std::string port_s = text.substr(colon + 1);

    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')   // [v6]:port
        host = host.substr(1, host.size() - 2);
    if (host.empty()) { err = "endpoint_empty_host"; return false; }

    if (port_s.empty() || port_s.size() > 5) { err = "endpoint_bad_port"; return false; }
    unsigned long port = 0;
    for (char c : port_s) {
        if (c < '0' || c > '9') { err = "endpoint_bad_port"; return false; }
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) { err = "endpoint_bad_port"; return false; }

    Endpoint ep;
    ep.kind = Endpoint::Kind::Tcp;
    ep.host = host;
    ep.port = static_cast<uint16_t>(port);
    out = ep;
    return true;
}


// ---------------------------------------------------------------------------
// fill_unix()
// -----------
// Build a sockaddr_un for `path`. parse_endpoint() already bounded the length.
// ---------------------------------------------------------------------------
static socklen_t fill_unix(const std::string& path, sockaddr_un& sa) {
    std::memset(&sa, 0, sizeof(sa));
    sa.sun_family = AF_UNIX;
    std::memcpy(sa.sun_path, path.c_str(), path.size());   // trailing NUL from memset
    return static_cast<socklen_t>(sizeof(sa));
}

static void set_nodelay(int fd) {
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));   // best effort
}


// Longest single poll() while connecting or sleeping between attempts, so that a
// cancel request is seen promptly.
static constexpr int CONNECT_SLICE_MS = 50;

static bool is_cancelled(const CancelCheck& cancelled) {
    return cancelled && cancelled();
}


// ---------------------------------------------------------------------------
// connect_fd()
// ------------
// Non-blocking connect, then poll for writability until `dl`; SO_ERROR tells the
// outcome. On success the fd is back in blocking mode.
// ---------------------------------------------------------------------------
static bool connect_fd(int fd, const sockaddr* sa, socklen_t len, Deadline dl,
                       const CancelCheck& cancelled, std::string& err) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        err = errno_text("fcntl");
        return false;
    }

    if (::connect(fd, sa, len) != 0) {
        if (errno != EINPROGRESS && errno != EINTR) { err = errno_text("connect"); return false; }

        pollfd pfd{fd, POLLOUT, 0};
        while (true) {
            if (is_cancelled(cancelled)) { err = "connect_cancelled"; return false; }
            const int left = remaining_ms(dl);
            if (left == 0) { err = "connect_timeout"; return false; }
            const int pr = ::poll(&pfd, 1, left < CONNECT_SLICE_MS ? left : CONNECT_SLICE_MS);
            if (pr > 0) break;
            if (pr < 0 && errno != EINTR) { err = errno_text("poll"); return false; }
        }

        int so_err = 0;
        socklen_t sl = sizeof(so_err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &sl) != 0) {
            err = errno_text("getsockopt");
            return false;
        }
        if (so_err != 0) { err = std::string("connect: ") + std::strerror(so_err); return false; }
    }

    if (::fcntl(fd, F_SETFL, flags) != 0) { err = errno_text("fcntl"); return false; }
    return true;
}


// ---------------------------------------------------------------------------
// connect_endpoint()
// ------------------
// Unix: one socket, one connect.
// TCP: walk getaddrinfo results until one connects; one deadline covers them all.
// ---------------------------------------------------------------------------
int connect_endpoint(const Endpoint& ep, int timeout_ms, std::string& err,
                     const CancelCheck& cancelled) {
    const Deadline dl = transport::deadline_in_ms(timeout_ms);

    if (ep.kind == Endpoint::Kind::Unix) {
        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) { err = errno_text("socket"); return -1; }
        sockaddr_un sa{};
        const socklen_t len = fill_unix(ep.path, sa);
        if (!connect_fd(fd, reinterpret_cast<sockaddr*>(&sa), len, dl, cancelled, err)) {
            ::close(fd);
            return -1;
        }
        return fd;
    }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(ep.port);
    const int gai = ::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) { err = std::string("getaddrinfo: ") + ::gai_strerror(gai); return -1; }

    int fd = -1;
    err = "connect: no addresses";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { err = errno_text("socket"); continue; }
        if (connect_fd(fd, ai->ai_addr, ai->ai_addrlen, dl, cancelled, err)) break;   // connected
        ::close(fd);
        fd = -1;
        if (err == "connect_timeout" || err == "connect_cancelled") break;
    }
    ::freeaddrinfo(res);

    if (fd >= 0) set_nodelay(fd);
    return fd;
}


int connect_with_retries(const Endpoint& ep, int attempts, int delay_ms, int attempt_timeout_ms,
                         std::string& err, const CancelCheck& cancelled) {
    if (attempts < 1) attempts = 1;
    int made = 0;
    for (int i = 0; i < attempts; ++i) {
        ++made;
        int fd = connect_endpoint(ep, attempt_timeout_ms, err, cancelled);
        if (fd >= 0) return fd;
        if (is_cancelled(cancelled)) break;

        // sleep in slices so a cancel is not held up by the retry delay
        const Deadline wake = transport::deadline_in_ms(i + 1 < attempts ? delay_ms : 0);
        while (!is_cancelled(cancelled)) {
            const int left = remaining_ms(wake);
            if (left == 0) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(left < CONNECT_SLICE_MS ? left : CONNECT_SLICE_MS));
        }
        if (is_cancelled(cancelled)) break;
    }
    err += " attempts=" + std::to_string(made);
    return -1;
}


// ---------------------------------------------------------------------------
// listen_endpoint()
// -----------------
// Backlog of 1: a node serves exactly one coordinator.
// ---------------------------------------------------------------------------
int listen_endpoint(const Endpoint& ep, std::string& err) {
    if (ep.kind == Endpoint::Kind::Unix) {
        ::unlink(ep.path.c_str());                       // stale socket from a previous run
        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) { err = errno_text("socket"); return -1; }
        sockaddr_un sa{};
        const socklen_t len = fill_unix(ep.path, sa);
        if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), len) != 0) {
            err = errno_text("bind");
            ::close(fd);
            return -1;
        }
        if (::listen(fd, 1) != 0) {
            err = errno_text("listen");
            ::close(fd);
            return -1;
        }
        return fd;
    }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(ep.port);
    const char* host = (ep.host == "*") ? nullptr : ep.host.c_str();
    const int gai = ::getaddrinfo(host, port.c_str(), &hints, &res);
    if (gai != 0) { err = std::string("getaddrinfo: ") + ::gai_strerror(gai); return -1; }

    int fd = -1;
    err = "bind: no addresses";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { err = errno_text("socket"); continue; }
        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 1) == 0) break;
        err = errno_text("bind/listen");
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    return fd;
}


int accept_client(int listen_fd, int timeout_ms, std::string& err) {
    pollfd pfd{listen_fd, POLLIN, 0};
    while (true) {
        const int pr = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
        if (pr == 0) { err = "accept_timeout"; return -1; }
        if (pr < 0) {
            if (errno == EINTR) continue;
            err = errno_text("poll");
            return -1;
        }
        int fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            err = errno_text("accept");
            return -1;
        }
        sockaddr_storage ss{};
        socklen_t sl = sizeof(ss);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &sl) == 0 &&
            (ss.ss_family == AF_INET || ss.ss_family == AF_INET6)) {
            set_nodelay(fd);
        }
        return fd;
    }
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop until every byte is out or the deadline passes.
// MSG_DONTWAIT keeps a full send buffer from blocking past the deadline;
// poll(POLLOUT) does the waiting instead.
// ---------------------------------------------------------------------------
IoResult write_all(int fd, const char* data, std::size_t len, Deadline dl, int& err_no) {
    std::size_t off = 0;
    pollfd pfd{fd, POLLOUT, 0};

    while (off < len) {
        const ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) { off += static_cast<std::size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const int pr = ::poll(&pfd, 1, remaining_ms(dl));
            if (pr == 0) return IoResult::Timeout;
            if (pr < 0 && errno != EINTR) { err_no = errno; return IoResult::Error; }
            if (pfd.revents & (POLLERR | POLLHUP)) return IoResult::Closed;
            continue;
        }
        err_no = (n < 0) ? errno : 0;
        if (err_no == EPIPE || err_no == ECONNRESET || err_no == ENOTCONN) return IoResult::Closed;
        return IoResult::Error;
    }
    return IoResult::Ok;
}


// ---------------------------------------------------------------------------
// read_some()
// -----------
// One poll, one recv. POLLHUP without POLLIN still goes through recv so that
// buffered bytes are read before EOF is reported.
// ---------------------------------------------------------------------------
IoResult read_some(int fd, char* buf, std::size_t cap, std::size_t& got,
                   Deadline dl, bool timeout_infinite, int& err_no) {
    got = 0;
    pollfd pfd{fd, POLLIN, 0};

    while (true) {
        const int pr = ::poll(&pfd, 1, timeout_infinite ? -1 : remaining_ms(dl));
        if (pr == 0) return IoResult::Timeout;
        if (pr < 0) {
            if (errno == EINTR) continue;
            err_no = errno;
            return IoResult::Error;
        }
        if (pfd.revents & POLLNVAL) { err_no = EBADF; return IoResult::Error; }

        const ssize_t n = ::recv(fd, buf, cap, 0);
        if (n > 0) { got = static_cast<std::size_t>(n); return IoResult::Ok; }
        if (n == 0) return IoResult::Closed;                 // orderly EOF
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        err_no = errno;
        if (err_no == ECONNRESET || err_no == ENOTCONN) return IoResult::Closed;
        return IoResult::Error;
    }
}


void shutdown_socket(int fd) {
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

void unlink_endpoint(const Endpoint& ep) {
    if (ep.kind == Endpoint::Kind::Unix) ::unlink(ep.path.c_str());
}

} // namespace fedsim
