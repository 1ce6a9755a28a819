#pragma once
/**
 * @file node_handle.hpp
 * @brief Coordinator-side proxy for one node process.
 *
 * @details
 * A NodeHandle owns the connection to one node and enforces the protocol from the
 * coordinator's side:
 *
 * ```
 *   Connecting --INIT sent--> AwaitingReady --READY--> Idle
 *   Idle --ADVANCE + [events] sent--> Advancing --> AwaitingDone --DONE + [events]--> Idle
 *   Idle --SHUTDOWN, peer closes (or grace expires)--> ShutDown
 *   Connecting | AwaitingReady | Advancing | AwaitingDone --error--> Failed
 * ```
 *
 * `Failed` and `ShutDown` are terminal. Entering either closes the connection; the
 * connection is closed exactly once.
 *
 * Every failure is caught here and turned into a `Failed` transition plus a
 * structured log record (`node= cycle= kind= detail=`). Nothing propagates.
 *
 * Threading: `advance()` and `initialize()` run on a per-node task thread. `abort()`
 * may be called concurrently from the coordinator thread to cut a stuck task short;
 * everything else is coordinator-thread only, and only while no task is running.
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/determinism.hpp"
#include "fedsim/error.hpp"
#include "fedsim/event.hpp"
#include "fedsim/transport/transport_base.hpp"
#include "socket_io.hpp"

namespace fedsim {

enum class NodeState : uint8_t {
  Connecting    = 0,
  AwaitingReady = 1,
  Idle          = 2,
  Advancing     = 3,
  AwaitingDone  = 4,
  Failed        = 5,
  ShutDown      = 6
};

const char* node_state_name(NodeState s);

struct NodeFailure {
  ErrorKind   kind{ErrorKind::None};
  uint64_t    cycle{0};     ///< Cycle in which the node failed (0 = during setup)
  std::string detail;
};

class NodeHandle {
public:
  /// Handle for a node reached at `endpoint`; call connect() before initialize().
  NodeHandle(std::string node_id, Endpoint endpoint, bool deterministic = true);

  /// Handle over an already-established connection (socketpair, accepted socket).
  NodeHandle(std::string node_id, std::unique_ptr<transport::ITransport> conn,
             bool deterministic = true);

  ~NodeHandle();

  NodeHandle(const NodeHandle&) = delete;
  NodeHandle& operator=(const NodeHandle&) = delete;

  /**
   * @brief Establish the connection (no-op if one was supplied).
   *
   * Each attempt is bounded by `attempt_timeout_ms`; abort() cancels the retry loop.
   * @return false (and Failed, kind=transport, cycle 0) if every attempt failed;
   *         after abort() the failure kind is the one passed to abort().
   */
  bool connect(int attempts, int retry_delay_ms, int attempt_timeout_ms = 2000);

  /**
   * @brief Send INIT and wait for READY.
   * @param config  Configuration object sent on the INIT line.
   */
  bool initialize(const nlohmann::json& config, int timeout_ms);

  /**
   * @brief One lockstep cycle: send ADVANCE + pending inbound, wait for DONE + events.
   *
   * Pending inbound events are cleared once sent. Emitted events replace emitted().
   * An emitted event older than this node's time at cycle start is a scheduling
   * error, and one whose source is not this node is a protocol error; either way the
   * whole response is discarded and the node fails. events_delivered() counts inbound
   * events only for cycles the node answered.
   */
  bool advance(TimeUs target, int timeout_ms, uint64_t cycle);

  /**
   * @brief Send SHUTDOWN and wait up to `grace_ms` for the node to close.
   *
   * Only an Idle node is asked; any other state just has its connection released.
   * A node that does not close in time is force-closed. Ends in ShutDown unless
   * already Failed.
   */
  void shutdown(int grace_ms);

  /**
   * @brief Cancel whatever this handle is blocked on. Thread-safe.
   *
   * The running task returns promptly and records `kind` as the failure.
   */
  void abort(ErrorKind kind);

  /// Mark failed from outside (e.g. the coordinator's own checks).
  void fail(ErrorKind kind, uint64_t cycle, const std::string& detail);

  void enqueue_inbound(const Event& ev) { pending_inbound_.push_back(ev); }
  const std::vector<Event>& pending_inbound() const { return pending_inbound_; }

  const std::vector<Event>& emitted() const { return emitted_; }

  const std::string& node_id() const  { return node_id_; }
  const Endpoint&    endpoint() const { return endpoint_; }
  NodeState          state() const    { return state_; }
  bool               live() const     { return state_ != NodeState::Failed && state_ != NodeState::ShutDown; }
  bool               deterministic() const { return deterministic_; }
  bool               aborted() const  { return abort_kind_.load() != 0; }
  TimeUs             current_time_us() const { return current_time_us_; }
  const NodeFailure& failure() const  { return failure_; }

  uint64_t events_emitted() const   { return events_emitted_; }
  uint64_t events_delivered() const { return events_delivered_; }
  uint64_t cycles_completed() const { return cycles_completed_; }

  const StreamDigest& digest() const { return digest_; }

private:
  bool io_fail(transport::IoResult r, uint64_t cycle, const char* during);
  void release_connection();

  std::string node_id_;
  Endpoint    endpoint_;
  bool        deterministic_{true};

  std::unique_ptr<transport::ITransport> conn_;
  std::mutex           conn_mu_;         ///< abort() vs release_connection()
  std::atomic<uint8_t> abort_kind_{0};   ///< ErrorKind set by abort(), 0 = none

  NodeState   state_{NodeState::Connecting};
  TimeUs      current_time_us_{0};
  NodeFailure failure_;

  std::vector<Event> pending_inbound_;
  std::vector<Event> emitted_;

  uint64_t     events_emitted_{0};
  uint64_t     events_delivered_{0};
  uint64_t     cycles_completed_{0};
  StreamDigest digest_;
};

} // namespace fedsim
