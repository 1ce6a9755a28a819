// tests/test_support.hpp
// Socketpair-backed nodes for handle and coordinator tests. No external processes.
#pragma once

#include <doctest/doctest.h>

#include <sys/socket.h>

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "fedsim/node_server.hpp"
#include "fedsim/node_session.hpp"
#include "fedsim/transport/transport_socket.hpp"

namespace fedsim_test {

using fedsim::transport::IoResult;
using fedsim::transport::SocketTransport;

// Connected stream pair: first = coordinator end, second = node end.
inline std::pair<int, int> socket_pair() {
    int fds[2] = {-1, -1};
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
    return {fds[0], fds[1]};
}

// A real NodeSession served on its own thread. Declare it before the handle or
// coordinator that talks to it, so the coordinator end closes first.
class ServedNode {
public:
    explicit ServedNode(std::unique_ptr<fedsim::NodeModel> model)
    : session_(std::move(model)) {
        const auto p = socket_pair();
        coord_fd_ = p.first;
        conn_ = std::make_unique<SocketTransport>(p.second, "node");
        thread_ = std::thread([this] { clean_ = fedsim::serve_connection(*conn_, session_, err_); });
    }

    ~ServedNode() {
        fedsim::close_socket(coord_fd_);            // never handed out: unblock the server
        join();
    }

    // Coordinator end; may be taken once.
    std::unique_ptr<fedsim::transport::ITransport> take_coordinator_end() {
        REQUIRE(coord_fd_ >= 0);
        auto t = std::make_unique<SocketTransport>(coord_fd_, "coord");
        coord_fd_ = -1;
        return t;
    }

    void join() { if (thread_.joinable()) thread_.join(); }

    bool clean_shutdown() { join(); return clean_; }
    const std::string& error() { join(); return err_; }
    const fedsim::NodeSession& session() { join(); return session_; }

private:
    fedsim::NodeSession              session_;
    std::unique_ptr<SocketTransport> conn_;
    int                              coord_fd_{-1};
    std::thread                      thread_;
    bool                             clean_{false};
    std::string                      err_;
};

// A hand-written peer: `script` runs on its own thread with the node end, which is
// closed when the script returns.
class ScriptedPeer {
public:
    using Script = std::function<void(SocketTransport&)>;

    explicit ScriptedPeer(Script script) {
        const auto p = socket_pair();
        coord_fd_ = p.first;
        conn_ = std::make_unique<SocketTransport>(p.second, "peer");
        thread_ = std::thread([this, script] {
            script(*conn_);
            conn_->close();
        });
    }

    ~ScriptedPeer() {
        fedsim::close_socket(coord_fd_);
        if (thread_.joinable()) thread_.join();
    }

    std::unique_ptr<fedsim::transport::ITransport> take_coordinator_end() {
        REQUIRE(coord_fd_ >= 0);
        auto t = std::make_unique<SocketTransport>(coord_fd_, "coord");
        coord_fd_ = -1;
        return t;
    }

private:
    std::unique_ptr<SocketTransport> conn_;
    int                              coord_fd_{-1};
    std::thread                      thread_;
};

inline bool send(SocketTransport& t, const std::string& line) {
    return t.send_line(line, fedsim::transport::deadline_in_ms(2000)) == IoResult::Ok;
}

inline bool recv(SocketTransport& t, std::string& line) {
    return t.recv_line_blocking(line) == IoResult::Ok;
}

// Drain until the coordinator end goes away.
inline void wait_for_hangup(SocketTransport& t) {
    std::string line;
    while (recv(t, line)) {}
}

// Well-behaved fake node that misbehaves in cycle `bad_cycle`:
//   "garbage" -> DONE then a non-JSON line
//   "silent"  -> no reply at all
//   "hangup"  -> closes the connection
// Cycles are counted from 1. bad_cycle 0 never misbehaves.
inline ScriptedPeer::Script fake_node(int bad_cycle, std::string how = "garbage") {
    return [bad_cycle, how](SocketTransport& t) {
        std::string line;
        if (!recv(t, line)) return;                 // INIT
        if (!send(t, "READY")) return;
        for (int cycle = 1;; ++cycle) {
            if (!recv(t, line)) return;             // ADVANCE or SHUTDOWN
            if (line == "SHUTDOWN") return;
            if (!recv(t, line)) return;             // inbound events
            if (cycle == bad_cycle) {
                if (how == "hangup") return;
                if (how == "garbage") { send(t, "DONE"); send(t, "this is not json"); }
                wait_for_hangup(t);
                return;
            }
            if (!send(t, "DONE") || !send(t, "[]")) return;
        }
    };
}

} // namespace fedsim_test
