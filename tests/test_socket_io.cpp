#include <doctest/doctest.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "socket_io.hpp"
using namespace fedsim;

namespace {

// Listener on 127.0.0.1 with a backlog of 0 that never accepts. Once `fill`
// half-open connections sit in its queue, further SYNs are dropped and a connect
// can only end at its deadline.
struct StuckListener {
    int fd{-1};
    uint16_t port{0};
    std::vector<int> fillers;

    explicit StuckListener(int fill) {
        fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        REQUIRE(fd >= 0);
        sockaddr_in sa{};
        sa.sin_family      = AF_INET;
        sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0);
        REQUIRE(::listen(fd, 0) == 0);
        socklen_t sl = sizeof(sa);
        REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &sl) == 0);
        port = ntohs(sa.sin_port);

        for (int i = 0; i < fill; ++i) {
            int c = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
            REQUIRE(c >= 0);
            (void)::connect(c, reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
            fillers.push_back(c);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ~StuckListener() {
        for (int c : fillers) ::close(c);
        ::close(fd);
    }
};

} // namespace

TEST_CASE("parse_endpoint accepts host:port and unix:path") {
    Endpoint ep;
    std::string err;
    REQUIRE(parse_endpoint("127.0.0.1:5001", ep, err));
    CHECK(ep.kind == Endpoint::Kind::Tcp);
    CHECK(ep.port == 5001);
    CHECK(ep.str() == "127.0.0.1:5001");

    REQUIRE(parse_endpoint("unix:/tmp/n.sock", ep, err));
    CHECK(ep.kind == Endpoint::Kind::Unix);
    CHECK(ep.path == "/tmp/n.sock");

    CHECK_FALSE(parse_endpoint("localhost", ep, err));
    CHECK_FALSE(parse_endpoint("localhost:0", ep, err));
    CHECK_FALSE(parse_endpoint("localhost:70000", ep, err));
    CHECK_FALSE(parse_endpoint("unix:", ep, err));
}

TEST_CASE("A connect that gets no answer ends at its deadline") {
    StuckListener stuck(4);
    Endpoint ep;
    std::string err;
    REQUIRE(parse_endpoint("127.0.0.1:" + std::to_string(stuck.port), ep, err));

    const auto t0 = std::chrono::steady_clock::now();
    const int fd = connect_endpoint(ep, 200, err);
    const auto took = std::chrono::steady_clock::now() - t0;
    if (fd >= 0) {
        // the kernel still had room in the queue; the call must not have waited long
        ::close(fd);
    } else {
        CHECK(err == "connect_timeout");
    }
    CHECK(took < std::chrono::seconds(2));
}

TEST_CASE("A cancel request stops the retry loop") {
    Endpoint ep;
    std::string err;
    REQUIRE(parse_endpoint("unix:/nonexistent-fedsim-dir/node.sock", ep, err));

    std::atomic<bool> stop{false};
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop = true;
    });
    const auto t0 = std::chrono::steady_clock::now();
    const int fd = connect_with_retries(ep, 1000, 100, 100, err, [&stop] { return stop.load(); });
    canceller.join();

    CHECK(fd < 0);
    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
    CHECK(err.find("attempts=1000") == std::string::npos);
}

TEST_CASE("connect_endpoint reaches a listening Unix socket") {
    Endpoint ep;
    std::string err;
    const std::string path = "/tmp/fedsim-sockio-" + std::to_string(::getpid()) + ".sock";
    REQUIRE(parse_endpoint("unix:" + path, ep, err));
    const int lfd = listen_endpoint(ep, err);
    REQUIRE(lfd >= 0);

    const int fd = connect_endpoint(ep, 1000, err);
    REQUIRE(fd >= 0);
    CHECK((::fcntl(fd, F_GETFL, 0) & O_NONBLOCK) == 0);   // handed back in blocking mode

    const int afd = accept_client(lfd, 1000, err);
    CHECK(afd >= 0);
    close_socket(afd);
    close_socket(fd);
    close_socket(lfd);
    unlink_endpoint(ep);
}
