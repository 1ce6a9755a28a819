#include <doctest/doctest.h>
#include "fedsim/codec.hpp"
#include "fedsim/models.hpp"
#include "fedsim/node_session.hpp"
using namespace fedsim;

static void init_sensor(NodeSession& s, const char* id = "s1") {
    std::vector<std::string> replies;
    REQUIRE(s.handle_line(std::string("INIT ") + id + " {\"seed\":7}", replies));
    REQUIRE(replies == std::vector<std::string>{"READY"});
}

TEST_CASE("Session: INIT -> READY, ADVANCE + events -> DONE + events, SHUTDOWN -> closed") {
    NodeSession s(make_model("sensor"));
    init_sensor(s);
    CHECK(s.state() == NodeSession::State::Ready);
    CHECK(s.core().node_id() == "s1");

    std::vector<std::string> replies;
    REQUIRE(s.handle_line("ADVANCE 2000001", replies));
    CHECK(replies.empty());
    CHECK(s.state() == NodeSession::State::AwaitingEvents);
    CHECK(s.pending_target() == 2000001);

    REQUIRE(s.handle_line("[]", replies));
    REQUIRE(replies.size() == 2);
    CHECK(replies[0] == "DONE");

    std::vector<Event> out;
    std::string err;
    REQUIRE(codec::decode_events(replies[1], out, err));
    CHECK(out.size() == 2);                       // samples at 1e6 and 2e6
    CHECK(s.core().now() == 2000001);

    replies.clear();
    REQUIRE(s.handle_line("SHUTDOWN", replies));
    CHECK(replies.empty());
    CHECK(s.closed());
}

TEST_CASE("Session: ADVANCE before INIT is a protocol error") {
    NodeSession s(make_model("sensor"));
    std::vector<std::string> replies;
    CHECK_FALSE(s.handle_line("ADVANCE 10", replies));
    CHECK(s.faulted());
    CHECK(s.error_kind() == ErrorKind::Protocol);
    CHECK(s.last_error() == "expected_init");
    CHECK(replies.empty());

    CHECK_FALSE(s.handle_line("INIT s1 {}", replies));   // faults are sticky
}

TEST_CASE("Session: a non-JSON event line is a protocol error") {
    NodeSession s(make_model("sensor"));
    init_sensor(s);
    std::vector<std::string> replies;
    REQUIRE(s.handle_line("ADVANCE 10", replies));
    CHECK_FALSE(s.handle_line("garbage", replies));
    CHECK(s.error_kind() == ErrorKind::Protocol);
    CHECK(replies.empty());
}

TEST_CASE("Session: second INIT, backwards ADVANCE and unknown lines are rejected") {
    {
        NodeSession s(make_model("sensor"));
        init_sensor(s);
        std::vector<std::string> replies;
        CHECK_FALSE(s.handle_line("INIT s1 {}", replies));
        CHECK(s.last_error() == "duplicate_init");
    }
    {
        NodeSession s(make_model("sensor"));
        init_sensor(s);
        std::vector<std::string> replies;
        REQUIRE(s.handle_line("ADVANCE 100", replies));
        REQUIRE(s.handle_line("[]", replies));
        replies.clear();
        CHECK_FALSE(s.handle_line("ADVANCE 50", replies));
        CHECK(s.last_error().find("advance_backwards") == 0);
    }
    {
        NodeSession s(make_model("sensor"));
        init_sensor(s);
        std::vector<std::string> replies;
        CHECK_FALSE(s.handle_line("HELLO", replies));
        CHECK(s.last_error() == "unknown_command");
    }
}

TEST_CASE("Session: inbound events delivered late are clamped, not rejected") {
    NodeSession s(make_model("gateway"));
    std::vector<std::string> replies;
    REQUIRE(s.handle_line("INIT gateway {\"seed\":0}", replies));
    replies.clear();

    REQUIRE(s.handle_line("ADVANCE 1000", replies));
    REQUIRE(s.handle_line("[]", replies));
    replies.clear();

    REQUIRE(s.handle_line("ADVANCE 2000", replies));
    REQUIRE(s.handle_line(R"([{"event_type":"TRANSMIT","time_us":500,"source":"s1","destination":"gateway","payload":{"temperature":20.0}}])",
                          replies));
    CHECK(replies.size() == 2);
    CHECK(s.core().late_deliveries() == 1);
    CHECK_FALSE(s.faulted());
}

TEST_CASE("Session: a line after SHUTDOWN is a protocol error") {
    NodeSession s(make_model("sensor"));
    init_sensor(s);
    std::vector<std::string> replies;
    REQUIRE(s.handle_line("SHUTDOWN", replies));
    CHECK_FALSE(s.handle_line("ADVANCE 5", replies));
    CHECK(s.last_error() == "line_after_shutdown");
    CHECK(std::string(session_state_name(s.state())) == "faulted");
}
