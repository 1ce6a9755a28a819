// ============================================================================
// scenario.cpp: implementation for scenario.hpp
// For the file layout see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "scenario.hpp"

#include <cmath>      // std::llround for duration_s
#include <fstream>    // std::ifstream for load_scenario
#include <set>        // duplicate id detection

#include "fedsim/codec.hpp"   // codec::valid_node_id

namespace fedsim {

using nlohmann::json;


// -------- helpers --------

/*
 * read_u64() / read_int() / read_rate()
 * -------------------------------------
 * Optional-key readers. A missing key leaves `out` untouched; a present key of the
 * wrong type is an error naming `where.key`.
 */
static bool read_u64(const json& obj, const char* key, const std::string& where,
                     uint64_t& out, std::string& err) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (v.is_number_unsigned()) { out = v.get<uint64_t>(); return true; }
    if (v.is_number_integer() && v.get<int64_t>() >= 0) { out = static_cast<uint64_t>(v.get<int64_t>()); return true; }
    err = where + key + ": expected non-negative integer";
    return false;
}

static bool read_int(const json& obj, const char* key, const std::string& where,
                     int& out, std::string& err) {
    uint64_t v = static_cast<uint64_t>(out < 0 ? 0 : out);
    if (!read_u64(obj, key, where, v, err)) return false;
    if (v > 0x7fffffffULL) { err = where + key + ": out of range"; return false; }
    out = static_cast<int>(v);
    return true;
}

static bool read_rate(const json& obj, const char* key, const std::string& where,
                      double& out, std::string& err) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_number()) { err = where + key + ": expected number"; return false; }
    out = v.get<double>();
    return true;
}

static bool read_string(const json& obj, const char* key, const std::string& where,
                        std::string& out, std::string& err) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_string()) { err = where + key + ": expected string"; return false; }
    out = v.get<std::string>();
    return true;
}


/*
 * parse_node()
 * ------------
 * One entry of "nodes". `id` and `endpoint` are required; the endpoint text is
 * parsed here so that a typo is reported against the node that carries it.
 */
static bool parse_node(const json& j, std::size_t index, NodeSpec& out, std::string& err) {
    const std::string where = "nodes[" + std::to_string(index) + "].";
    if (!j.is_object()) { err = "nodes[" + std::to_string(index) + "]: expected object"; return false; }

    if (!j.contains("id"))       { err = where + "id: missing"; return false; }
    if (!j.contains("endpoint")) { err = where + "endpoint: missing"; return false; }
    if (!read_string(j, "id", where, out.id, err)) return false;
    if (!read_string(j, "endpoint", where, out.endpoint_text, err)) return false;

    std::string perr;
    if (!parse_endpoint(out.endpoint_text, out.endpoint, perr)) {
        err = where + "endpoint: " + perr;
        return false;
    }

    if (j.contains("deterministic")) {
        if (!j["deterministic"].is_boolean()) { err = where + "deterministic: expected boolean"; return false; }
        out.deterministic = j["deterministic"].get<bool>();
    }

    if (j.contains("config")) {
        if (!j["config"].is_object()) { err = where + "config: expected object"; return false; }
        out.config = j["config"];
    }
    return true;
}


static bool parse_network(const json& j, NetworkSpec& out, std::string& err) {
    if (!j.is_object()) { err = "network: expected object"; return false; }
    if (!read_string(j, "model", "network.", out.model, err)) return false;

    uint64_t lat = out.default_latency_us;
    if (!read_u64(j, "default_latency_us", "network.", lat, err)) return false;
    out.default_latency_us = lat;
    if (!read_rate(j, "default_loss_rate", "network.", out.default_loss_rate, err)) return false;

    if (!j.contains("links")) return true;
    if (!j["links"].is_array()) { err = "network.links: expected array"; return false; }

    std::size_t i = 0;
    for (const auto& l : j["links"]) {
        const std::string where = "network.links[" + std::to_string(i++) + "].";
        if (!l.is_object()) { err = where.substr(0, where.size() - 1) + ": expected object"; return false; }

        LinkSpec ls;
        ls.latency_us = out.default_latency_us;
        ls.loss_rate  = out.default_loss_rate;
        if (!l.contains("src") || !l.contains("dst")) { err = where + "src/dst: missing"; return false; }
        if (!read_string(l, "src", where, ls.src, err)) return false;
        if (!read_string(l, "dst", where, ls.dst, err)) return false;

        uint64_t llat = ls.latency_us;
        if (!read_u64(l, "latency_us", where, llat, err)) return false;
        ls.latency_us = llat;
        if (!read_rate(l, "loss_rate", where, ls.loss_rate, err)) return false;
        out.links.push_back(std::move(ls));
    }
    return true;
}


static bool parse_timeouts(const json& j, TimeoutSpec& out, std::string& err) {
    if (!j.is_object()) { err = "timeouts: expected object"; return false; }
    return read_int(j, "init_ms", "timeouts.", out.init_ms, err) &&
           read_int(j, "cycle_ms", "timeouts.", out.cycle_ms, err) &&
           read_int(j, "shutdown_ms", "timeouts.", out.shutdown_ms, err) &&
           read_int(j, "connect_retries", "timeouts.", out.connect_retries, err) &&
           read_int(j, "connect_retry_delay_ms", "timeouts.", out.connect_retry_delay_ms, err) &&
           read_int(j, "connect_timeout_ms", "timeouts.", out.connect_timeout_ms, err);
}


// -------- public API --------

bool parse_scenario(const json& doc, Scenario& out, std::string& err) {
    if (!doc.is_object()) { err = "scenario: expected object"; return false; }
    out = Scenario{};

    if (!doc.contains("simulation") || !doc["simulation"].is_object()) {
        err = "simulation: missing or not an object";
        return false;
    }
    const json& sim = doc["simulation"];

    if (sim.contains("duration_us")) {
        if (!read_u64(sim, "duration_us", "simulation.", out.duration_us, err)) return false;
    } else if (sim.contains("duration_s")) {
        if (!sim["duration_s"].is_number() || sim["duration_s"].get<double>() < 0.0) {
            err = "simulation.duration_s: expected non-negative number";
            return false;
        }
        out.duration_us = static_cast<TimeUs>(std::llround(sim["duration_s"].get<double>() * 1e6));
    }
    if (!read_u64(sim, "time_quantum_us", "simulation.", out.quantum_us, err)) return false;
    if (!read_u64(sim, "seed", "simulation.", out.seed, err)) return false;

    if (!doc.contains("nodes") || !doc["nodes"].is_array()) {
        err = "nodes: missing or not an array";
        return false;
    }
    std::size_t i = 0;
    for (const auto& n : doc["nodes"]) {
        NodeSpec ns;
        if (!parse_node(n, i++, ns, err)) return false;
        out.nodes.push_back(std::move(ns));
    }

    if (doc.contains("network")  && !parse_network(doc["network"], out.network, err)) return false;
    if (doc.contains("timeouts") && !parse_timeouts(doc["timeouts"], out.timeouts, err)) return false;
    if (!read_string(doc, "metrics_path", "", out.metrics_path, err)) return false;
    return true;
}


bool load_scenario(const std::string& path, Scenario& out, std::string& err) {
    std::ifstream ifs(path);
    if (!ifs) { err = "open " + path + " failed"; return false; }

    json doc;
    try {
        ifs >> doc;
    } catch (const json::exception& e) {
        err = path + ": " + e.what();
        return false;
    }
    if (!parse_scenario(doc, out, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}


/*
 * validate_scenario()
 * -------------------
 * Cross-field checks. Runs after any command-line overrides were applied.
 */
bool validate_scenario(const Scenario& sc, std::string& err) {
    if (sc.duration_us == 0) { err = "duration must be > 0"; return false; }
    if (sc.quantum_us == 0)  { err = "time quantum must be > 0"; return false; }
    if (sc.nodes.empty())    { err = "no nodes configured"; return false; }

    std::set<std::string> ids;
    for (const auto& n : sc.nodes) {
        if (!codec::valid_node_id(n.id)) { err = "invalid node id \"" + n.id + "\""; return false; }
        if (!ids.insert(n.id).second)    { err = "duplicate node id " + n.id; return false; }
    }

    if (sc.network.model != "direct" && sc.network.model != "latency") {
        err = "unknown network model " + sc.network.model;
        return false;
    }
    if (sc.network.default_loss_rate < 0.0 || sc.network.default_loss_rate > 1.0) {
        err = "network.default_loss_rate must be within [0,1]";
        return false;
    }
    for (const auto& l : sc.network.links) {
        if (!ids.count(l.src) || !ids.count(l.dst)) {
            err = "link " + l.src + "->" + l.dst + " names an unknown node";
            return false;
        }
        if (l.loss_rate < 0.0 || l.loss_rate > 1.0) {
            err = "link " + l.src + "->" + l.dst + " loss_rate must be within [0,1]";
            return false;
        }
    }

    const TimeoutSpec& t = sc.timeouts;
    if (t.init_ms <= 0 || t.cycle_ms <= 0) { err = "init and cycle timeouts must be > 0"; return false; }
    if (t.connect_timeout_ms <= 0) { err = "connect timeout must be > 0"; return false; }
    return true;
}


bool parse_node_arg(const std::string& text, NodeSpec& out, std::string& err) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        err = "expected id=endpoint, got \"" + text + "\"";
        return false;
    }
    out = NodeSpec{};
    out.id            = text.substr(0, eq);
    out.endpoint_text = text.substr(eq + 1);
    if (!parse_endpoint(out.endpoint_text, out.endpoint, err)) {
        err = out.id + ": " + err;
        return false;
    }
    return true;
}


void merge_node(Scenario& sc, const NodeSpec& spec) {
    for (auto& n : sc.nodes) {
        if (n.id == spec.id) {
            n.endpoint_text = spec.endpoint_text;   // keep the file's config and flags
            n.endpoint      = spec.endpoint;
            return;
        }
    }
    sc.nodes.push_back(spec);
}


std::unique_ptr<net::INetworkModel> make_network_model(const NetworkSpec& spec) {
    if (spec.model == "direct") return std::make_unique<net::DirectNetworkModel>();
    if (spec.model == "latency") {
        net::LinkParams defaults;
        defaults.latency_us = spec.default_latency_us;
        defaults.loss_rate  = spec.default_loss_rate;
        auto m = std::make_unique<net::LatencyNetworkModel>(defaults);
        for (const auto& l : spec.links) {
            net::LinkParams p;
            p.latency_us = l.latency_us;
            p.loss_rate  = l.loss_rate;
            m->set_link(l.src, l.dst, p);
        }
        return m;
    }
    return nullptr;
}


CoordinatorConfig coordinator_config(const Scenario& sc) {
    CoordinatorConfig c;
    c.seed                   = sc.seed;
    c.init_timeout_ms        = sc.timeouts.init_ms;
    c.cycle_timeout_ms       = sc.timeouts.cycle_ms;
    c.shutdown_grace_ms      = sc.timeouts.shutdown_ms;
    c.connect_retries        = sc.timeouts.connect_retries;
    c.connect_retry_delay_ms = sc.timeouts.connect_retry_delay_ms;
    c.connect_timeout_ms     = sc.timeouts.connect_timeout_ms;
    return c;
}


json node_configs(const Scenario& sc) {
    json out = json::object();
    for (const auto& n : sc.nodes) out[n.id] = n.config;
    return out;
}

} // namespace fedsim
