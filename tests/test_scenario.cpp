#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "scenario.hpp"
using namespace fedsim;
using nlohmann::json;

static json sample_doc() {
    return json::parse(R"({
        "simulation": {"duration_us": 10000000, "time_quantum_us": 500000, "seed": 42},
        "nodes": [
            {"id": "sensor1", "endpoint": "127.0.0.1:5001",
             "config": {"sample_period_us": 250000, "destination": "gateway"}},
            {"id": "gateway", "endpoint": "unix:/tmp/gw.sock", "deterministic": false}
        ],
        "network": {"model": "latency", "default_latency_us": 200,
                    "links": [{"src": "sensor1", "dst": "gateway", "latency_us": 900, "loss_rate": 0.25}]},
        "timeouts": {"cycle_ms": 3000, "connect_retries": 2, "connect_timeout_ms": 750},
        "metrics_path": "out.jsonl",
        "notes": "ignored"
    })");
}

TEST_CASE("Parse a full scenario") {
    Scenario sc;
    std::string err;
    REQUIRE_MESSAGE(parse_scenario(sample_doc(), sc, err), err);

    CHECK(sc.duration_us == 10000000);
    CHECK(sc.quantum_us == 500000);
    CHECK(sc.seed == 42);
    REQUIRE(sc.nodes.size() == 2);
    CHECK(sc.nodes[0].id == "sensor1");
    CHECK(sc.nodes[0].endpoint.kind == Endpoint::Kind::Tcp);
    CHECK(sc.nodes[0].endpoint.port == 5001);
    CHECK(sc.nodes[0].config["sample_period_us"] == 250000);
    CHECK(sc.nodes[0].deterministic);
    CHECK(sc.nodes[1].endpoint.kind == Endpoint::Kind::Unix);
    CHECK(sc.nodes[1].endpoint.path == "/tmp/gw.sock");
    CHECK_FALSE(sc.nodes[1].deterministic);
    CHECK(sc.nodes[1].config == json::object());

    CHECK(sc.network.model == "latency");
    CHECK(sc.network.default_latency_us == 200);
    REQUIRE(sc.network.links.size() == 1);
    CHECK(sc.network.links[0].latency_us == 900);
    CHECK(sc.network.links[0].loss_rate == doctest::Approx(0.25));

    CHECK(sc.timeouts.cycle_ms == 3000);
    CHECK(sc.timeouts.init_ms == 5000);          // default kept
    CHECK(sc.timeouts.connect_retries == 2);
    CHECK(sc.timeouts.connect_timeout_ms == 750);
    CHECK(sc.metrics_path == "out.jsonl");

    CHECK(validate_scenario(sc, err));
}

TEST_CASE("duration_s and defaults") {
    Scenario sc;
    std::string err;
    const json doc = {{"simulation", {{"duration_s", 2.5}}},
                      {"nodes", json::array({{{"id", "a"}, {"endpoint", "localhost:7000"}}})}};
    REQUIRE(parse_scenario(doc, sc, err));
    CHECK(sc.duration_us == 2500000);
    CHECK(sc.quantum_us == 1000);
    CHECK(sc.seed == 0);
    CHECK(sc.network.model == "direct");
    CHECK(sc.metrics_path.empty());
}

TEST_CASE("Parse errors name the offending key") {
    Scenario sc;
    std::string err;

    json doc = sample_doc();
    doc["nodes"][1]["endpoint"] = 17;
    CHECK_FALSE(parse_scenario(doc, sc, err));
    CHECK(err.find("nodes[1].endpoint") == 0);

    doc = sample_doc();
    doc["nodes"][0].erase("id");
    CHECK_FALSE(parse_scenario(doc, sc, err));
    CHECK(err == "nodes[0].id: missing");

    doc = sample_doc();
    doc["simulation"]["seed"] = "x";
    CHECK_FALSE(parse_scenario(doc, sc, err));
    CHECK(err.find("simulation.seed") == 0);

    doc = sample_doc();
    doc.erase("simulation");
    CHECK_FALSE(parse_scenario(doc, sc, err));

    doc = sample_doc();
    doc["network"]["links"] = json::array({5});
    CHECK_FALSE(parse_scenario(doc, sc, err));
    CHECK(err == "network.links[0]: expected object");

    CHECK_FALSE(parse_scenario(json::array(), sc, err));
}

TEST_CASE("Validation rejects inconsistent scenarios") {
    Scenario base;
    std::string err;
    REQUIRE(parse_scenario(sample_doc(), base, err));

    Scenario sc = base;
    sc.quantum_us = 0;
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.duration_us = 0;
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.nodes.clear();
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.nodes[1].id = "sensor1";
    CHECK_FALSE(validate_scenario(sc, err));
    CHECK(err.find("duplicate") == 0);

    sc = base;
    sc.network.model = "mesh";
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.network.links[0].dst = "nobody";
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.network.links[0].loss_rate = 1.5;
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.timeouts.cycle_ms = 0;
    CHECK_FALSE(validate_scenario(sc, err));

    sc = base;
    sc.timeouts.connect_timeout_ms = 0;
    CHECK_FALSE(validate_scenario(sc, err));
    CHECK(err == "connect timeout must be > 0");
}

TEST_CASE("Command-line nodes add to or override the roster") {
    Scenario sc;
    std::string err;
    REQUIRE(parse_scenario(sample_doc(), sc, err));

    NodeSpec ns;
    REQUIRE(parse_node_arg("gateway=127.0.0.1:6000", ns, err));
    merge_node(sc, ns);
    REQUIRE(sc.nodes.size() == 2);
    CHECK(sc.nodes[1].endpoint.kind == Endpoint::Kind::Tcp);
    CHECK(sc.nodes[1].endpoint.port == 6000);
    CHECK_FALSE(sc.nodes[1].deterministic);      // file settings survive

    REQUIRE(parse_node_arg("extra=unix:/tmp/x.sock", ns, err));
    merge_node(sc, ns);
    CHECK(sc.nodes.size() == 3);

    CHECK_FALSE(parse_node_arg("noequals", ns, err));
    CHECK_FALSE(parse_node_arg("=127.0.0.1:1", ns, err));
    CHECK_FALSE(parse_node_arg("a=", ns, err));
}

TEST_CASE("Network model and coordinator settings come from the scenario") {
    Scenario sc;
    std::string err;
    REQUIRE(parse_scenario(sample_doc(), sc, err));

    auto m = make_network_model(sc.network);
    REQUIRE(m != nullptr);
    CHECK(std::string(m->name()) == "latency");
    auto* lat = dynamic_cast<net::LatencyNetworkModel*>(m.get());
    REQUIRE(lat != nullptr);
    CHECK(lat->link("sensor1", "gateway").latency_us == 900);
    CHECK(lat->link("gateway", "sensor1").latency_us == 200);

    NetworkSpec unknown;
    unknown.model = "mesh";
    CHECK(make_network_model(unknown) == nullptr);

    const CoordinatorConfig c = coordinator_config(sc);
    CHECK(c.seed == 42);
    CHECK(c.cycle_timeout_ms == 3000);
    CHECK(c.connect_retries == 2);
    CHECK(c.connect_timeout_ms == 750);

    const json cfg = node_configs(sc);
    CHECK(cfg["sensor1"]["destination"] == "gateway");
    CHECK(cfg["gateway"] == json::object());
}

TEST_CASE("load_scenario reports unreadable and malformed files") {
    Scenario sc;
    std::string err;
    CHECK_FALSE(load_scenario("/nonexistent/scenario.json", sc, err));
    CHECK(err.find("open") == 0);

    const std::string path = "/tmp/fedsim-scenario-" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream ofs(path);
        ofs << "{ not json";
    }
    CHECK_FALSE(load_scenario(path, sc, err));
    CHECK(err.find(path) == 0);

    {
        std::ofstream ofs(path);
        ofs << sample_doc().dump();
    }
    CHECK(load_scenario(path, sc, err));
    CHECK(sc.nodes.size() == 2);
    std::remove(path.c_str());
}
