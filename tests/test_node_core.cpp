#include <doctest/doctest.h>
#include <stdexcept>
#include <vector>
#include "fedsim/node_core.hpp"
using namespace fedsim;

// Collect every TICK the core processes, with the clock seen by the handler.
struct Recorder {
    std::vector<TimeUs> seen;
    void attach(NodeCore& core) {
        core.on("TICK", [this](NodeCore& c, const Event&) { seen.push_back(c.now()); });
    }
};

static std::vector<Event> drain(NodeCore& core) {
    std::vector<Event> out;
    Event ev;
    while (core.get_event(ev)) out.push_back(ev);
    return out;
}

TEST_CASE("NodeCore reset sets identity and clears state") {
    NodeCore core;
    core.reset("n1", 5);
    CHECK(core.node_id() == "n1");
    CHECK(core.now() == 0);
    CHECK(core.pending() == 0);
    CHECK(core.outbox_size() == 0);
    CHECK_FALSE(core.faulted());
}

TEST_CASE("Boundary rule: an event at exactly the target runs in the next cycle") {
    NodeCore core;
    core.reset("n1", 0);
    Recorder rec;
    rec.attach(core);

    REQUIRE(core.schedule(1000, "TICK"));
    REQUIRE(core.advance(1000));
    CHECK(rec.seen.empty());           // deferred
    CHECK(core.now() == 1000);
    CHECK(core.pending() == 1);

    REQUIRE(core.advance(2000));
    REQUIRE(rec.seen.size() == 1);
    CHECK(rec.seen[0] == 1000);        // clock moved to the event before the handler
    CHECK(core.now() == 2000);
}

TEST_CASE("advance processes in time order and ends exactly at the target") {
    NodeCore core;
    core.reset("n1", 0);
    Recorder rec;
    rec.attach(core);

    core.schedule(700, "TICK");
    core.schedule(100, "TICK");
    core.schedule(400, "TICK");
    REQUIRE(core.advance(1000));
    CHECK(rec.seen == std::vector<TimeUs>{100, 400, 700});
    CHECK(core.now() == 1000);
    CHECK(core.processed() == 3);
}

TEST_CASE("Scheduling in the past faults the core instead of clamping") {
    NodeCore core;
    core.reset("n1", 0);
    REQUIRE(core.advance(5000));

    CHECK(core.schedule(5000, "TICK"));          // now is allowed
    CHECK_FALSE(core.schedule(4999, "TICK"));
    CHECK(core.faulted());
    CHECK(core.fault().find("schedule_in_past") == 0);

    CHECK_FALSE(core.advance(6000));             // sticky
    CHECK_FALSE(core.schedule(9000, "TICK"));
}

TEST_CASE("A handler that schedules into the past faults the advance") {
    NodeCore core;
    core.reset("n1", 0);
    core.on("BAD", [](NodeCore& c, const Event&) { c.schedule(c.now() - 1, "BAD"); });
    core.schedule(10, "BAD");

    CHECK_FALSE(core.advance(100));
    CHECK(core.faulted());
    CHECK(core.now() == 10);                     // stopped at the faulting event
}

TEST_CASE("Late inbound events are delivered at the current time and counted") {
    NodeCore core;
    core.reset("gw", 0);
    std::vector<TimeUs> at;
    std::vector<TimeUs> stamped;
    core.on("MSG", [&](NodeCore& c, const Event& ev) { at.push_back(c.now()); stamped.push_back(ev.time_us); });
    REQUIRE(core.advance(2000));

    Event late;
    late.event_type = "MSG";
    late.time_us    = 1500;
    late.source     = "s1";
    late.destination = std::string("gw");

    Event future = late;
    future.time_us = 2500;

    REQUIRE(core.deliver(future));
    REQUIRE(core.deliver(late));
    CHECK(core.late_deliveries() == 1);

    REQUIRE(core.advance(3000));
    CHECK(at == std::vector<TimeUs>{2000, 2500});
    CHECK(stamped == std::vector<TimeUs>{1500, 2500});   // sender's timestamp preserved
}

TEST_CASE("emit stamps the source and rejects past timestamps") {
    NodeCore core;
    core.reset("n1", 0);
    REQUIRE(core.advance(100));

    REQUIRE(core.emit_now("PING", std::string("n2"), {{"k", 1}}));
    Event ev;
    ev.event_type = "X";
    ev.time_us    = 150;
    ev.source     = "spoofed";
    REQUIRE(core.emit(ev));

    auto out = drain(core);
    REQUIRE(out.size() == 2);
    CHECK(out[0].event_type == "PING");
    CHECK(out[0].time_us == 100);
    CHECK(out[0].source == "n1");
    CHECK(out[0].destination == std::optional<std::string>("n2"));
    CHECK(out[0].payload["k"] == 1);
    CHECK(out[1].source == "n1");
    CHECK(core.emitted() == 2);

    ev.time_us = 99;
    CHECK_FALSE(core.emit(ev));
    CHECK(core.faulted());
    CHECK(core.fault().find("emit_in_past") == 0);
}

TEST_CASE("Unknown event types are counted, not fatal") {
    NodeCore core;
    core.reset("n1", 0);
    core.schedule(10, "NOBODY_LISTENS");
    REQUIRE(core.advance(100));
    CHECK(core.unknown_events() == 1);
    CHECK(core.processed() == 0);
    CHECK_FALSE(core.faulted());
}

TEST_CASE("A throwing handler faults the core") {
    NodeCore core;
    core.reset("n1", 0);
    core.on("BOOM", [](NodeCore&, const Event&) { throw std::runtime_error("kaput"); });
    core.schedule(1, "BOOM");
    CHECK_FALSE(core.advance(10));
    CHECK(core.fault().find("handler_error") == 0);
}

TEST_CASE("advance backwards is a fault") {
    NodeCore core;
    core.reset("n1", 0);
    REQUIRE(core.advance(500));
    CHECK_FALSE(core.advance(400));
    CHECK(core.faulted());
}
