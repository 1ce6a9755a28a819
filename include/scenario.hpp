#pragma once
/**
 * @page fs-scenario fedsim Scenario Files
 * @file scenario.hpp
 * @brief Load, validate and apply the JSON scenario description of one run.
 *
 * @details
 * PURPOSE
 * -------
 * A scenario names everything the coordinator needs before the first cycle: how long
 * to run and in which quanta, the scenario seed, the node roster with each node's
 * endpoint and configuration, the network model, and the deadlines. This header is the
 * only place that knows the file layout; the coordinator itself takes plain values.
 *
 * FILE LAYOUT
 * -----------
 * @code{.json}
 *   {
 *     "simulation": {"duration_us": 10000000, "time_quantum_us": 1000000, "seed": 42},
 *     "nodes": [
 *       {"id": "sensor1", "endpoint": "127.0.0.1:5001", "deterministic": true,
 *        "config": {"sample_period_us": 1000000, "destination": "gateway"}},
 *       {"id": "gateway", "endpoint": "unix:/tmp/gateway.sock"}
 *     ],
 *     "network": {"model": "latency", "default_latency_us": 200, "default_loss_rate": 0.0,
 *                 "links": [{"src": "sensor1", "dst": "gateway", "latency_us": 500, "loss_rate": 0.1}]},
 *     "timeouts": {"init_ms": 5000, "cycle_ms": 10000, "shutdown_ms": 1000,
 *                  "connect_retries": 10, "connect_retry_delay_ms": 500,
 *                  "connect_timeout_ms": 2000},
 *     "metrics_path": "metrics.jsonl"
 *   }
 * @endcode
 *
 * - `duration_s` (seconds, may be fractional) is accepted instead of `duration_us`.
 * - `time_quantum_us` defaults to 1000; `seed` to 0.
 * - Every section except `simulation` and `nodes` is optional.
 * - Unknown keys are ignored so that files can carry notes for other tools.
 *
 * VALIDATION
 * ----------
 * validate_scenario() is separate from parsing because the CLI may add nodes or
 * override values after the file is read. It rejects: zero duration or quantum, an
 * empty roster, duplicate or malformed node ids, unparseable endpoints, unknown
 * network models, links naming unknown nodes, and loss rates outside [0, 1].
 *
 * EXAMPLE
 * -------
 * @code
 *   fedsim::Scenario sc;
 *   std::string err;
 *   if (!fedsim::load_scenario("scenario.json", sc, err) ||
 *       !fedsim::validate_scenario(sc, err)) {
 *       std::cerr << "status=error reason=bad_scenario detail=\"" << err << "\"\n";
 *       return 2;
 *   }
 * @endcode
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/coordinator.hpp"
#include "fedsim/event.hpp"
#include "fedsim/network_model.hpp"
#include "socket_io.hpp"

namespace fedsim {

/**
 * @struct NodeSpec
 * @brief One roster entry: who the node is, where to reach it, what to send on INIT.
 */
struct NodeSpec {
    std::string    id;
    std::string    endpoint_text;               /**< As written; parsed into `endpoint`. */
    Endpoint       endpoint;
    bool           deterministic{true};         /**< false = statistical reproducibility only. */
    nlohmann::json config = nlohmann::json::object();
};

struct LinkSpec {
    std::string src;
    std::string dst;
    TimeUs      latency_us{0};
    double      loss_rate{0.0};
};

struct NetworkSpec {
    std::string           model{"direct"};      /**< "direct" or "latency". */
    TimeUs                default_latency_us{0};
    double                default_loss_rate{0.0};
    std::vector<LinkSpec> links;
};

struct TimeoutSpec {
    int init_ms{5000};
    int cycle_ms{10000};
    int shutdown_ms{1000};
    int connect_retries{10};
    int connect_retry_delay_ms{500};
    int connect_timeout_ms{2000};
};

struct Scenario {
    TimeUs                duration_us{0};
    TimeUs                quantum_us{1000};
    uint64_t              seed{0};
    std::vector<NodeSpec> nodes;
    NetworkSpec           network;
    TimeoutSpec           timeouts;
    std::string           metrics_path;         /**< Empty = no metrics file. */
};


/**
 * @brief Fill `out` from an already-parsed JSON document.
 *
 * Type errors are reported with the offending key, e.g.
 * `nodes[1].endpoint: expected string`.
 *
 * @return false with `err` set on the first problem found.
 */
bool parse_scenario(const nlohmann::json& doc, Scenario& out, std::string& err);


/**
 * @brief Read `path` and parse_scenario() it.
 * @return false if the file cannot be read, is not JSON, or does not parse.
 */
bool load_scenario(const std::string& path, Scenario& out, std::string& err);


/**
 * @brief Check the cross-field rules listed in the file comment.
 */
bool validate_scenario(const Scenario& sc, std::string& err);


/**
 * @brief Parse a command-line roster entry `id=endpoint`.
 */
bool parse_node_arg(const std::string& text, NodeSpec& out, std::string& err);


/**
 * @brief Add `spec` to the roster, or replace the endpoint of the node with the same id.
 */
void merge_node(Scenario& sc, const NodeSpec& spec);


/**
 * @brief Build the network model a NetworkSpec describes.
 * @return nullptr for an unknown model name.
 */
std::unique_ptr<net::INetworkModel> make_network_model(const NetworkSpec& spec);


/**
 * @brief Coordinator settings (seed, deadlines, retries) taken from the scenario.
 */
CoordinatorConfig coordinator_config(const Scenario& sc);


/**
 * @brief `{ "<node id>": <config>, ... }` for Coordinator::initialize_all().
 */
nlohmann::json node_configs(const Scenario& sc);

} // namespace fedsim
