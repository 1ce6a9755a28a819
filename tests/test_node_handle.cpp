#include <doctest/doctest.h>
#include <unistd.h>
#include <chrono>
#include <sstream>
#include <thread>
#include "fedsim/models.hpp"
#include "fedsim/node_handle.hpp"
#include "fedsim/summary.hpp"
#include "test_support.hpp"
using namespace fedsim;
using namespace fedsim_test;

TEST_CASE("NodeHandle drives a real session through INIT, cycles and SHUTDOWN") {
    ServedNode node(make_model("sensor"));
    NodeHandle h("s1", node.take_coordinator_end());
    CHECK(h.state() == NodeState::Connecting);

    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({{"seed", 42}}, 1000));
    CHECK(h.state() == NodeState::Idle);

    for (TimeUs t = 1000000; t <= 3000000; t += 1000000) {
        REQUIRE(h.advance(t, 1000, t / 1000000));
        CHECK(h.current_time_us() == t);
    }
    CHECK(h.cycles_completed() == 3);
    CHECK(h.events_emitted() == 2);               // samples at 1e6 and 2e6
    CHECK(h.emitted().size() == 1);               // last cycle only
    CHECK(h.emitted()[0].time_us == 2000000);
    CHECK(h.digest().count() == 2);

    h.shutdown(1000);
    CHECK(h.state() == NodeState::ShutDown);
    CHECK_FALSE(h.live());
    CHECK(node.clean_shutdown());
}

TEST_CASE("NodeHandle delivers pending inbound events once") {
    ServedNode node(make_model("gateway"));
    NodeHandle h("gateway", node.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({{"seed", 0}}, 1000));

    Event e;
    e.event_type  = "TRANSMIT";
    e.time_us     = 10;
    e.source      = "s1";
    e.destination = std::string("gateway");
    e.payload     = {{"temperature", 19.0}};
    h.enqueue_inbound(e);
    h.enqueue_inbound(e);
    CHECK(h.pending_inbound().size() == 2);

    REQUIRE(h.advance(1000, 1000, 1));
    CHECK(h.pending_inbound().empty());
    CHECK(h.events_delivered() == 2);
    REQUIRE(h.advance(2000, 1000, 2));
    CHECK(h.events_delivered() == 2);
    h.shutdown(1000);
}

TEST_CASE("A non-JSON event line fails the node with a protocol error") {
    ScriptedPeer peer(fake_node(2, "garbage"));
    NodeHandle h("bad", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));
    REQUIRE(h.advance(1000, 1000, 1));

    CHECK_FALSE(h.advance(2000, 1000, 2));
    CHECK(h.state() == NodeState::Failed);
    CHECK(h.failure().kind == ErrorKind::Protocol);
    CHECK(h.failure().cycle == 2);
    CHECK(h.failure().detail.find("invalid_json") == 0);
    CHECK(h.current_time_us() == 1000);           // failed cycle does not count
    CHECK(h.emitted().empty());

    CHECK_FALSE(h.advance(3000, 1000, 3));        // terminal
    h.shutdown(100);
    CHECK(h.state() == NodeState::Failed);
}

TEST_CASE("A silent node times out") {
    ScriptedPeer peer(fake_node(1, "silent"));
    NodeHandle h("slow", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));

    CHECK_FALSE(h.advance(1000, 150, 1));
    CHECK(h.failure().kind == ErrorKind::Timeout);
    CHECK(h.failure().cycle == 1);
}

TEST_CASE("A node that hangs up is a transport failure") {
    ScriptedPeer peer(fake_node(1, "hangup"));
    NodeHandle h("gone", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));

    CHECK_FALSE(h.advance(1000, 1000, 1));
    CHECK(h.failure().kind == ErrorKind::Transport);
}

TEST_CASE("Anything but READY after INIT is a protocol error") {
    ScriptedPeer peer([](SocketTransport& t) {
        std::string line;
        if (!recv(t, line)) return;
        send(t, "HELLO");
        wait_for_hangup(t);
    });
    NodeHandle h("rude", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    CHECK_FALSE(h.initialize({}, 1000));
    CHECK(h.state() == NodeState::Failed);
    CHECK(h.failure().kind == ErrorKind::Protocol);
    CHECK(h.failure().cycle == 0);
}

TEST_CASE("An emitted event older than the cycle start is a scheduling error; the response is discarded") {
    ScriptedPeer peer([](SocketTransport& t) {
        std::string line;
        if (!recv(t, line)) return;
        send(t, "READY");
        recv(t, line); recv(t, line);
        send(t, "DONE"); send(t, "[]");
        recv(t, line); recv(t, line);
        send(t, "DONE");
        send(t, R"([{"event_type":"OK","time_us":1500,"source":"r"},)"
                R"({"event_type":"OLD","time_us":999,"source":"r"}])");
        wait_for_hangup(t);
    });
    NodeHandle h("r", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));
    REQUIRE(h.advance(1000, 1000, 1));

    CHECK_FALSE(h.advance(2000, 1000, 2));
    CHECK(h.failure().kind == ErrorKind::Scheduling);
    CHECK(h.failure().cycle == 2);
    CHECK(h.emitted().empty());
    CHECK(h.events_emitted() == 0);
}

TEST_CASE("abort() from another thread cuts a blocked advance short") {
    ScriptedPeer peer(fake_node(1, "silent"));
    NodeHandle h("stuck", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));

    std::thread killer([&h] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        h.abort(ErrorKind::Timeout);
    });
    const auto t0 = std::chrono::steady_clock::now();
    CHECK_FALSE(h.advance(1000, 10000, 1));
    killer.join();

    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
    CHECK(h.aborted());
    CHECK(h.failure().kind == ErrorKind::Timeout);
}

TEST_CASE("Binary garbage from a node is escaped in the failure and the summary still serializes") {
    ScriptedPeer peer([](SocketTransport& t) {
        std::string line;
        if (!recv(t, line)) return;
        send(t, "READY");
        recv(t, line); recv(t, line);
        send(t, "D\xc3\xa9\xff\xfe");
        wait_for_hangup(t);
    });
    NodeHandle h("bin", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));

    CHECK_FALSE(h.advance(1000, 1000, 1));
    CHECK(h.failure().kind == ErrorKind::Protocol);
    CHECK(h.failure().detail.find("\\xc3\\xa9\\xff\\xfe") != std::string::npos);
    for (unsigned char c : h.failure().detail) CHECK((c >= 0x20 && c < 0x7f));

    RunSummary s;
    s.nodes.push_back(make_node_report(h));
    std::string text;
    CHECK_NOTHROW(text = summary_to_json(s).dump(2));
    CHECK(nlohmann::json::parse(text)["nodes"][0]["error"] == "protocol");
    std::ostringstream os;
    print_summary(os, s);
    CHECK(os.str().find("error=protocol failed_cycle=1") != std::string::npos);
}

TEST_CASE("An event claiming another node as its source is a protocol error") {
    ScriptedPeer peer([](SocketTransport& t) {
        std::string line;
        if (!recv(t, line)) return;
        send(t, "READY");
        recv(t, line); recv(t, line);
        send(t, "DONE");
        send(t, R"([{"event_type":"TRANSMIT","time_us":10,"source":"someone_else","destination":"gw"}])");
        wait_for_hangup(t);
    });
    NodeHandle h("honest", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));

    CHECK_FALSE(h.advance(1000, 1000, 1));
    CHECK(h.failure().kind == ErrorKind::Protocol);
    CHECK(h.failure().detail.find("source_mismatch") == 0);
    CHECK(h.emitted().empty());
    CHECK(h.events_emitted() == 0);
}

TEST_CASE("Inbound events are not counted as delivered when the node fails that cycle") {
    ScriptedPeer peer(fake_node(1, "garbage"));
    NodeHandle h("bad", peer.take_coordinator_end());
    REQUIRE(h.connect(1, 0));
    REQUIRE(h.initialize({}, 1000));

    Event e;
    e.event_type  = "TRANSMIT";
    e.time_us     = 10;
    e.source      = "s1";
    e.destination = std::string("bad");
    h.enqueue_inbound(e);

    CHECK_FALSE(h.advance(1000, 1000, 1));
    CHECK(h.events_delivered() == 0);
    CHECK(h.pending_inbound().empty());
}

TEST_CASE("abort() stops a node handle that is still retrying its connect") {
    Endpoint ep;
    std::string err;
    REQUIRE(parse_endpoint("unix:/nonexistent-fedsim-dir/late.sock", ep, err));
    NodeHandle h("late", ep);

    std::thread killer([&h] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        h.abort(ErrorKind::Timeout);
    });
    const auto t0 = std::chrono::steady_clock::now();
    CHECK_FALSE(h.connect(1000, 200, 200));
    killer.join();

    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
    CHECK(h.state() == NodeState::Failed);
    CHECK(h.failure().kind == ErrorKind::Timeout);
    CHECK(h.failure().detail.find("connect aborted") == 0);
}

TEST_CASE("Connecting to nothing fails with a transport error at cycle 0") {
    Endpoint ep;
    std::string err;
    REQUIRE(parse_endpoint("unix:/nonexistent-fedsim-dir/node.sock", ep, err));
    NodeHandle h("ghost", ep);
    CHECK_FALSE(h.connect(2, 10));
    CHECK(h.state() == NodeState::Failed);
    CHECK(h.failure().kind == ErrorKind::Transport);
    CHECK(h.failure().cycle == 0);
    CHECK(h.failure().detail.find("connect_failed") == 0);
}

TEST_CASE("NodeHandle reaches a node server over a Unix socket") {
    Endpoint ep;
    std::string err;
    const std::string path = "/tmp/fedsim-test-" + std::to_string(::getpid()) + ".sock";
    REQUIRE(parse_endpoint("unix:" + path, ep, err));

    NodeSession session(make_model("sensor"));
    bool served = false;
    std::string serve_err;
    std::thread server([&] { served = run_node_server(ep, session, 5000, serve_err); });

    {
        NodeHandle h("s1", ep);
        REQUIRE(h.connect(50, 20));                 // server may not be listening yet
        REQUIRE(h.initialize({{"seed", 1}}, 1000));
        REQUIRE(h.advance(1500000, 1000, 1));
        CHECK(h.events_emitted() == 1);
        h.shutdown(1000);
        CHECK(h.state() == NodeState::ShutDown);
    }
    server.join();
    CHECK(served);
    CHECK(::access(path.c_str(), F_OK) != 0);       // socket file removed
}

TEST_CASE("node_state_name") {
    CHECK(std::string(node_state_name(NodeState::AwaitingDone)) == "awaiting_done");
    CHECK(std::string(node_state_name(NodeState::ShutDown)) == "shutdown");
}
