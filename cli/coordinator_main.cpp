/**
 * @file coordinator_main.cpp
 * @brief fedsim-coordinator: run one lockstep co-simulation against already-running nodes.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); load the scenario file if one is given.
 *  - Apply command-line overrides on top of the file (flags win).
 *  - Validate, build the coordinator (network model, metrics sink, node handles).
 *  - Run, print the summary as key=value lines, optionally save it as JSON.
 *
 * Exit status:
 *  - 0  run completed (some nodes may have failed; see the summary)
 *  - 1  every node failed
 *  - 2  configuration error (bad flags, bad scenario, unwritable output)
 */

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "fedsim/coordinator.hpp"
#include "fedsim/log.hpp"
#include "fedsim/metrics_sink.hpp"
#include "fedsim/summary.hpp"
#include "scenario.hpp"

using namespace fedsim;

static constexpr int EXIT_CONFIG_ERROR = 2;

static int config_error(const std::string& why) {
  std::cerr << "status=error reason=bad_config detail=\"" << why << "\"\n";
  return EXIT_CONFIG_ERROR;
}

int main(int argc, char** argv) {
  CLI::App app{"fedsim coordinator: lockstep co-simulation of independent node processes"};

  std::string scenario_path;
  uint64_t duration_us = 0, quantum_us = 0, seed = 0;
  std::vector<std::string> node_args;
  int init_timeout_ms = 0, cycle_timeout_ms = 0, shutdown_grace_ms = 0, connect_retries = 0;
  int connect_timeout_ms = 0;
  std::string metrics_out, summary_out;
  std::string log_level = "info";

  app.add_option("--scenario", scenario_path, "Scenario JSON file")->check(CLI::ExistingFile);
  auto* opt_duration = app.add_option("--duration-us", duration_us, "Simulated duration (us)");
  auto* opt_quantum  = app.add_option("--quantum-us", quantum_us, "Time quantum per cycle (us)");
  auto* opt_seed     = app.add_option("--seed", seed, "Scenario seed");
  app.add_option("--node", node_args, "Node as id=endpoint (host:port or unix:<path>); repeatable");
  auto* opt_init     = app.add_option("--init-timeout-ms", init_timeout_ms, "INIT/READY deadline");
  auto* opt_cycle    = app.add_option("--cycle-timeout-ms", cycle_timeout_ms, "Per-cycle deadline per node");
  auto* opt_grace    = app.add_option("--shutdown-grace-ms", shutdown_grace_ms, "Wait for nodes to close after SHUTDOWN");
  auto* opt_retries  = app.add_option("--connect-retries", connect_retries, "Connect attempts per node");
  auto* opt_conn_to  = app.add_option("--connect-timeout-ms", connect_timeout_ms, "Deadline per connect attempt");
  app.add_option("--metrics-out", metrics_out, "JSON Lines file for undelivered/undirected events");
  app.add_option("--summary-out", summary_out, "Write the run summary as JSON");
  app.add_option("--log-level", log_level, "error|warn|info|debug|trace|off");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : EXIT_CONFIG_ERROR;
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) return config_error("unknown log level " + log_level);
  Logger::instance().set_level(lvl);

  // ---- scenario: file first, then flags ----
  Scenario sc;
  std::string err;
  if (!scenario_path.empty() && !load_scenario(scenario_path, sc, err)) return config_error(err);

  if (*opt_duration) sc.duration_us = duration_us;
  if (*opt_quantum)  sc.quantum_us  = quantum_us;
  if (*opt_seed)     sc.seed        = seed;
  if (*opt_init)     sc.timeouts.init_ms         = init_timeout_ms;
  if (*opt_cycle)    sc.timeouts.cycle_ms        = cycle_timeout_ms;
  if (*opt_grace)    sc.timeouts.shutdown_ms     = shutdown_grace_ms;
  if (*opt_retries)  sc.timeouts.connect_retries = connect_retries;
  if (*opt_conn_to)  sc.timeouts.connect_timeout_ms = connect_timeout_ms;
  if (!metrics_out.empty()) sc.metrics_path = metrics_out;

  for (const auto& a : node_args) {
    NodeSpec ns;
    if (!parse_node_arg(a, ns, err)) return config_error(err);
    merge_node(sc, ns);
  }

  if (!validate_scenario(sc, err)) return config_error(err);

  // ---- build ----
  Coordinator coord(coordinator_config(sc));

  auto net = make_network_model(sc.network);
  if (!net) return config_error("unknown network model " + sc.network.model);
  coord.set_network_model(std::move(net));

  if (!sc.metrics_path.empty()) {
    auto sink = std::make_unique<JsonLinesSink>();
    if (!sink->open(sc.metrics_path, err)) return config_error(err);
    coord.set_metrics_sink(std::move(sink));
  }

  for (const auto& n : sc.nodes) {
    if (!coord.add_node(std::make_unique<NodeHandle>(n.id, n.endpoint, n.deterministic), err))
      return config_error(err);
  }

  // ---- run ----
  coord.initialize_all(node_configs(sc));
  const RunSummary summary = coord.run(sc.duration_us, sc.quantum_us);

  print_summary(std::cout, summary);

  if (!summary_out.empty() && !save_summary(summary_out, summary, err)) {
    FEDSIM_ERROR("main", "status=error reason=summary_write detail=\"%s\"", err.c_str());
    return EXIT_CONFIG_ERROR;
  }

  return summary.exit_code();
}
