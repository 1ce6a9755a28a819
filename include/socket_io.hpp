/**
 * @page fs-socket-io-hdr fedsim Socket I/O API (Header)
 * @file socket_io.hpp
 * @brief POSIX stream sockets for the coordinator/node link: endpoints, connect, listen, bounded I/O.
 *
 * @details
 * PURPOSE
 * -------
 * The coordinator connects to each node; each node listens for exactly one coordinator.
 * This header is the thin layer over the syscalls involved. Framing lives in
 * line_framer.hpp, the per-connection object in transport/transport_socket.hpp.
 *
 * ENDPOINTS
 * ---------
 *   "127.0.0.1:5001"      TCP (IPv4 or IPv6 host; "[::1]:5001" for IPv6 literals)
 *   "localhost:5001"      TCP, resolved with getaddrinfo
 *   "unix:/tmp/n1.sock"   Unix domain stream socket
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   coordinator: parse_endpoint() -> connect_with_retries() -> SocketTransport
 *   node:        parse_endpoint() -> listen_endpoint() -> accept_client() -> SocketTransport
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Writes use MSG_NOSIGNAL: a dead peer is an error return, never SIGPIPE.
 * - Reads are poll()-bounded. A negative timeout means "wait indefinitely" and is only
 *   used by the node while idle between coordinator messages.
 * - TCP sockets get TCP_NODELAY; lockstep cycles are latency-bound, not bandwidth-bound.
 * - Do not share one fd between threads, except for shutdown(2) used to abort.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "fedsim/transport/transport_base.hpp"

namespace fedsim {

struct Endpoint {
    enum class Kind : uint8_t { Tcp = 0, Unix = 1 };

    Kind        kind{Kind::Tcp};
    std::string host;       ///< Tcp: host name or address literal
    uint16_t    port{0};    ///< Tcp: port
    std::string path;       ///< Unix: filesystem path

    /// Canonical text form, suitable for logs and for parse_endpoint().
    std::string str() const;
};

/**
 * @brief Parse "host:port" or "unix:<path>".
 *
 * @return false with `err` set for an empty host or path, a missing or non-numeric
 *         port, or a port outside 1..65535.
 */
bool parse_endpoint(const std::string& text, Endpoint& out, std::string& err);


/// Polled while connecting; returning true abandons the attempt.
using CancelCheck = std::function<bool()>;


/**
 * @brief One connection attempt, bounded by `timeout_ms`.
 *
 * The connect is non-blocking and polled until it completes, the deadline passes
 * (`err` = "connect_timeout") or `cancelled` returns true (`err` = "connect_cancelled").
 * Name resolution itself is not bounded.
 *
 * @return connected fd (blocking mode), or -1 with `err` set.
 */
int connect_endpoint(const Endpoint& ep, int timeout_ms, std::string& err,
                     const CancelCheck& cancelled = nullptr);


/**
 * @brief Connect, retrying on failure.
 *
 * Makes up to `attempts` tries (at least one), each bounded by `attempt_timeout_ms`,
 * sleeping `delay_ms` between them. Nodes are launched separately and may not be
 * listening yet. `cancelled` is checked while connecting and while sleeping.
 *
 * @return connected fd, or -1 with the last attempt's reason in `err`.
 */
int connect_with_retries(const Endpoint& ep, int attempts, int delay_ms, int attempt_timeout_ms,
                         std::string& err, const CancelCheck& cancelled = nullptr);


/**
 * @brief Bind and listen on `ep`.
 *
 * TCP sockets get SO_REUSEADDR. A stale Unix socket file at the path is removed first.
 *
 * @return listening fd, or -1 with `err` set.
 */
int listen_endpoint(const Endpoint& ep, std::string& err);


/**
 * @brief Accept one client.
 *
 * @param timeout_ms  Milliseconds to wait; negative waits indefinitely.
 * @return client fd, or -1 with `err` set ("accept_timeout" on timeout).
 */
int accept_client(int listen_fd, int timeout_ms, std::string& err);


/**
 * @brief Write all `len` bytes before `dl`.
 *
 * Loops over partial writes, waiting for POLLOUT in between.
 * EPIPE/ECONNRESET map to Closed.
 */
transport::IoResult write_all(int fd, const char* data, std::size_t len,
                              transport::Deadline dl, int& err_no);


/**
 * @brief Read whatever is available (up to `cap` bytes), waiting until `dl`.
 *
 * @param timeout_infinite  ignore `dl` and block until data, EOF or error.
 * @return Ok with `got` > 0, Closed on EOF, Timeout, or Error (errno in `err_no`).
 */
transport::IoResult read_some(int fd, char* buf, std::size_t cap, std::size_t& got,
                              transport::Deadline dl, bool timeout_infinite, int& err_no);


/**
 * @brief Stop all I/O on `fd` from any thread (shutdown(2) both directions).
 *
 * Blocked poll()/read() calls on the same fd return promptly. The fd stays allocated
 * until close_socket().
 */
void shutdown_socket(int fd);


/**
 * @brief Close `fd` if non-negative.
 */
void close_socket(int fd);


/**
 * @brief Remove a Unix socket file left by listen_endpoint(). No-op for TCP.
 */
void unlink_endpoint(const Endpoint& ep);

} // namespace fedsim
