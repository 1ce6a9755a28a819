/**
 * @file node_core.hpp
 * @brief fedsim NodeCore: the node-side runtime (deliver -> advance -> drain loop).
 *
 * @details
 * ## Field Brief
 * NodeCore is the runtime a deterministic node runs inside. It does not know sockets,
 * the wire format or the coordinator. It only knows **events in**, **virtual time
 * forward**, **events out**. NodeSession (node_session.hpp) speaks the protocol and
 * feeds this loop; a NodeModel (sensor, gateway, ...) installs the handlers.
 *
 * ---
 *
 * @par What This File Provides
 * - `fedsim::NodeCore`, which:
 *   - Owns the node identity, its virtual clock and its seeded PRNG.
 *   - Accepts inbound events from the coordinator via `deliver()`.
 *   - Schedules local future events via `schedule()`.
 *   - On `advance(target)`, processes every queued event with time strictly below
 *     `target`, in (time, insertion sequence) order, then parks the clock at `target`.
 *   - Queues outbound events, retrievable with `get_event()`.
 * - `fedsim::NodeModel`, the interface node behaviours implement.
 *
 * ---
 *
 * @par Processing Model
 * ```
 *   deliver(ev) ──► EventQueue (time, seq) ──► advance(target)
 *                                                 │  pop while at < target
 *                                                 │  clock = at
 *                                                 │  handlers_[event_type](core, ev)
 *                                                 ▼
 *                           get_event() ◄── outbox (bounded)
 * ```
 *
 * - **Boundary rule.** An event at exactly `target` is *not* processed by
 *   `advance(target)`; it runs in the next call whose target is greater.
 * - **Handlers** are looked up by `event_type` in a table filled with `on()`.
 *   Unknown types are counted and skipped.
 *
 * ---
 *
 * @par Failure Model
 * Every violation below puts the core into a sticky *faulted* state. `advance()`
 * returns false, nothing more is processed, and `fault()` says why:
 * - `schedule()` with a time earlier than `now()`. Never clamped.
 * - `emit()` of an event timestamped before `now()`.
 * - `advance()` to a target earlier than `now()`.
 * - Event queue or outbox at capacity.
 * - A handler throwing.
 *
 * Inbound events are different: an event the coordinator delivers with a timestamp
 * before `now()` is a consequence of end-of-quantum batching, not a bug in this node.
 * It is processed at `now()` and counted in `late_deliveries()`.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * fedsim::NodeCore core;
 * core.reset("sensor1", fedsim::derive_node_seed("sensor1", 42));
 * core.on("SAMPLE", [](fedsim::NodeCore& c, const fedsim::Event&) {
 *   c.emit_now("TRANSMIT", std::string("gateway"), {{"temperature", 20.5}});
 *   c.schedule(c.now() + 1000000, "SAMPLE");
 * });
 * core.schedule(1000000, "SAMPLE");
 *
 * core.advance(2000000);                // processes the sample at 1e6
 * fedsim::Event out;
 * while (core.get_event(out)) { ... }
 * @endcode
 */
#ifndef FEDSIM_NODE_CORE_HPP
#define FEDSIM_NODE_CORE_HPP

#include <stdint.h>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "etl/deque.h"

#include <nlohmann/json.hpp>

#include "fedsim/determinism.hpp"
#include "fedsim/event.hpp"
#include "fedsim/event_queue.hpp"

namespace fedsim {

/**
 * @class NodeCore
 * @brief Single-threaded, transport-agnostic event loop for one simulated node.
 *
 * @note
 * The public loop has three calls, mirroring the protocol cycle:
 *   1. `deliver()`: inbound events from the coordinator.
 *   2. `advance()`: run virtual time forward to the cycle target.
 *   3. `get_event()`: drain what the node emitted during the cycle.
 */
class NodeCore {
public:
  /// @name Capacities
  ///@{

  /**
   * @brief Maximum outbound events buffered between two drains.
   *
   * @details
   * A node that emits more than this within one advance faults instead of dropping
   * events. Large quanta with chatty models may need a bigger value.
   */
  static constexpr size_t OUTBOX_CAP = 1024;
  ///@}

  /// Handler invoked for one processed event. `now()` equals the processing time.
  using Handler = std::function<void(NodeCore&, const Event&)>;

  NodeCore() = default;

  /**
   * @brief Start (or restart) the node's lifetime.
   *
   * @details
   * Clears the clock, the queue, the outbox, counters, handlers and any fault, sets the
   * identity, and reseeds the PRNG. Called once per INIT.
   *
   * @param node_id  Identity used as `source` of every emitted event.
   * @param seed     PRNG seed, normally `derive_node_seed(node_id, scenario_seed)`.
   */
  void reset(const std::string& node_id, uint64_t seed);

  const std::string& node_id() const { return node_id_; }
  TimeUs now() const { return now_; }
  DeterministicRng& rng() { return rng_; }

  /// Register (or replace) the handler for `event_type`.
  void on(const std::string& event_type, Handler h);

  /**
   * @brief Hand an inbound event to the node.
   *
   * @details
   * Queued at `max(ev.time_us, now())`. The event itself is not modified, so handlers
   * still see the sender's timestamp.
   *
   * @return false (and the core faults) if the queue is full.
   */
  bool deliver(const Event& ev);

  /**
   * @brief Schedule a local event of type `event_type` at `at`.
   *
   * @details
   * The event is addressed to this node (`source == destination == node_id()`).
   * `at` may equal `now()`; it may never be earlier.
   *
   * @return false (and the core faults) on a past time or a full queue.
   */
  bool schedule(TimeUs at, const std::string& event_type,
                const nlohmann::json& payload = nlohmann::json::object());

  /**
   * @brief Queue an outbound event for the coordinator.
   *
   * @details
   * `source` is overwritten with `node_id()`. The timestamp must be `>= now()`.
   *
   * @return false (and the core faults) on a past timestamp or a full outbox.
   */
  bool emit(Event ev);

  /// Emit `event_type` at `now()` to `destination` (nullopt for a metric event).
  bool emit_now(const std::string& event_type,
                const std::optional<std::string>& destination,
                const nlohmann::json& payload = nlohmann::json::object());

  /**
   * @brief Process every queued event with processing time `< target`, then set the
   *        clock to exactly `target`.
   *
   * @return false if the core is (or becomes) faulted. The clock is left at the last
   *         processed event's time in that case.
   */
  bool advance(TimeUs target);

  /// Pop the oldest outbound event. Returns false when the outbox is empty.
  bool get_event(Event& out);

  size_t outbox_size() const { return outbox_.size(); }
  size_t pending() const     { return queue_.size(); }

  bool faulted() const { return !fault_.empty(); }
  const std::string& fault() const { return fault_; }

  /// @name Counters (reset by `reset()`)
  ///@{
  uint64_t processed() const       { return processed_; }
  uint64_t emitted() const         { return emitted_; }
  uint64_t late_deliveries() const { return late_deliveries_; }
  uint64_t unknown_events() const  { return unknown_events_; }
  ///@}

private:
  void set_fault(const std::string& why);
  void dispatch(const Event& ev);

  std::string      node_id_;
  TimeUs           now_{0};
  DeterministicRng rng_;

  std::map<std::string, Handler> handlers_;
  EventQueue                     queue_;
  etl::deque<Event, OUTBOX_CAP>  outbox_;

  std::string fault_;

  uint64_t processed_{0};
  uint64_t emitted_{0};
  uint64_t late_deliveries_{0};
  uint64_t unknown_events_{0};
};

/**
 * @class NodeModel
 * @brief A node behaviour: installs handlers and initial events into a NodeCore.
 *
 * @details
 * `install()` runs once per INIT, right after `NodeCore::reset()`. It reads the
 * node's configuration object, registers handlers with `on()` and seeds the queue with
 * `schedule()`. A model must keep any state it needs in itself; the core is reset
 * before each install.
 */
class NodeModel {
public:
  virtual ~NodeModel() = default;

  /// Short name ("sensor", "gateway") for logs.
  virtual const char* name() const = 0;

  /// False for models wrapping a genuinely non-deterministic backend.
  virtual bool deterministic() const { return true; }

  /**
   * @param core    Freshly reset runtime.
   * @param config  INIT configuration object (includes "seed").
   * @param err     Reason on failure.
   * @return false if the configuration is unusable.
   */
  virtual bool install(NodeCore& core, const nlohmann::json& config, std::string& err) = 0;
};

} // namespace fedsim

#endif // FEDSIM_NODE_CORE_HPP
