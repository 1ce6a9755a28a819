#ifndef FEDSIM_COORDINATOR_HPP
#define FEDSIM_COORDINATOR_HPP
/**
 * @file coordinator.hpp
 * @brief Lockstep coordinator: owns the scenario clock, fans cycles out to the nodes,
 *        routes their events at cycle boundaries.
 *
 * @details
 * One cycle:
 *
 * ```
 *   target = min(global_time_us + quantum_us, duration_us)
 *   for each live node, concurrently:   ADVANCE target + pending inbound -> DONE + events
 *   barrier (bounded by cycle timeout; stragglers are aborted -> Failed, kind=timeout)
 *   route emitted events, in node registration order:
 *       undirected / unknown destination / failed destination -> metrics sink
 *       otherwise -> network model -> destination's pending inbound
 *   global_time_us = target
 * ```
 *
 * Guarantees
 * ----------
 * - The clock is a member of the Coordinator and is written only by begin() and step(), on the
 *   calling thread. Node tasks never see it; they only receive their target.
 * - No node is asked past `global_time_us + quantum_us`; a node's reached time is
 *   non-decreasing across cycles.
 * - Routing happens after every task of the cycle was joined, so `pending_inbound`
 *   is never written concurrently.
 * - Routing order is registration order, never completion order.
 *
 * Known approximation
 * -------------------
 * Nodes advancing in the same cycle are causally independent: an event node A emits
 * at t inside `[g, g+q)` reaches node B only at the next cycle boundary, and B has
 * already run to `g+q`. B's runtime delivers such an event at its current time and
 * counts it as late. Only end-of-quantum consistency is guaranteed; a smaller quantum
 * narrows the gap.
 *
 * Failure policy
 * --------------
 * Every per-node error ends in that node's Failed state (see node_handle.hpp) and
 * never stops the loop for the others. The run stops early only when no node is
 * live; the summary then reports every node failed.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/cycle_barrier.hpp"
#include "fedsim/event.hpp"
#include "fedsim/metrics_sink.hpp"
#include "fedsim/network_model.hpp"
#include "fedsim/node_handle.hpp"
#include "fedsim/summary.hpp"

namespace fedsim {

/// The only simulation-wide state. Owned by exactly one Coordinator.
struct ScenarioClock {
  TimeUs   global_time_us{0};
  TimeUs   quantum_us{0};
  TimeUs   duration_us{0};
  uint64_t cycle{0};          ///< Cycles started so far; the first cycle is 1

  /// Target of the next cycle: `min(global + quantum, duration)`.
  TimeUs next_target() const;
  bool   finished() const { return global_time_us >= duration_us; }
};

struct CoordinatorConfig {
  uint64_t seed{0};
  int      init_timeout_ms{5000};
  int      cycle_timeout_ms{10000};
  int      shutdown_grace_ms{1000};
  int      connect_retries{10};
  int      connect_retry_delay_ms{500};
  int      connect_timeout_ms{2000};      ///< per connect attempt
  uint64_t progress_every{1000};   ///< progress record every N cycles (0 = never)
};

class Coordinator {
public:
  explicit Coordinator(CoordinatorConfig cfg = {});
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  /// Register a node. Registration order is routing order. Ids must be unique.
  bool add_node(std::unique_ptr<NodeHandle> node, std::string& err);

  /// Replace the network model (default: DirectNetworkModel).
  void set_network_model(std::unique_ptr<net::INetworkModel> model);

  /// Replace the sink for undeliverable events (default: CountingSink).
  void set_metrics_sink(std::unique_ptr<IMetricsSink> sink);

  /**
   * @brief Connect to and INIT every node, concurrently.
   *
   * @param configs  Per-node configuration by node id (missing = `{}`). "seed" is
   *                 added from CoordinatorConfig::seed.
   * @return number of nodes that reached Idle.
   */
  std::size_t initialize_all(const nlohmann::json& configs);

  /**
   * @brief Run the lockstep loop to `duration_us`, shut every node down, summarize.
   *
   * Equivalent to begin(), step() until it returns false, finish().
   */
  RunSummary run(TimeUs duration_us, TimeUs quantum_us);

  /// Reset the clock and the network model for a run. Calls initialize_all({}) if needed.
  void begin(TimeUs duration_us, TimeUs quantum_us);

  /// One cycle. False when there is nothing left to do (finished or no live node).
  bool step();

  /// Shut every node down and build the summary.
  RunSummary finish();

  /// SHUTDOWN every node (bounded by the grace period) and close connections.
  void shutdown_all();

  RunSummary summarize() const;

  const ScenarioClock& clock() const { return clock_; }
  std::size_t live_count() const;
  std::size_t node_count() const { return nodes_.size(); }

  /// nullptr if `id` is not registered.
  const NodeHandle* node(const std::string& id) const;

  const net::INetworkModel& network() const { return *network_; }
  const IMetricsSink& sink() const { return *sink_; }

private:
  void advance_live(TimeUs target);
  void route_emitted(TimeUs next_target);
  NodeHandle* find_node(const std::string& id);
  void log_progress() const;

  CoordinatorConfig cfg_;
  ScenarioClock     clock_;

  std::vector<std::unique_ptr<NodeHandle>> nodes_;
  std::unique_ptr<net::INetworkModel>      network_;
  std::unique_ptr<IMetricsSink>            sink_;
  CycleBarrier                             barrier_;

  bool initialized_{false};
  bool shut_down_{false};
  std::chrono::steady_clock::time_point started_;
  double wall_seconds_{0.0};
};

} // namespace fedsim

#endif // FEDSIM_COORDINATOR_HPP
