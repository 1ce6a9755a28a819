#pragma once
/**
 * @file harness.hpp
 * @brief DeterminismHarness: drive one node implementation through the protocol, no network.
 *
 * @details
 * The harness plays the coordinator for a single NodeSession. Every exchange goes
 * through the real codec (encode command line, encode event array, parse the replies),
 * so a node verified here behaves the same behind a socket.
 *
 * It records the node's emitted events in order, with their canonical encoding, and
 * checks the same things the coordinator checks:
 * - replies are exactly READY / DONE + one event-array line;
 * - no emitted event is older than the node's time at the start of its cycle;
 * - the node's reached time never decreases.
 *
 * Typical use:
 * @code
 *   fedsim::DeterminismHarness a(fedsim::make_model("sensor"));
 *   fedsim::DeterminismHarness b(fedsim::make_model("sensor"));
 *   a.init("s1", {{"seed", 7}});  b.init("s1", {{"seed", 7}});
 *   a.run(10000000, 1000000);      b.run(10000000, 1000000);
 *   CHECK(a.stream_bytes() == b.stream_bytes());
 * @endcode
 */

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/determinism.hpp"
#include "fedsim/error.hpp"
#include "fedsim/event.hpp"
#include "fedsim/node_session.hpp"

namespace fedsim {

class DeterminismHarness {
public:
  explicit DeterminismHarness(std::unique_ptr<NodeModel> model);

  /// INIT the node. `config` should carry "seed"; it is sent as-is.
  bool init(const std::string& node_id, const nlohmann::json& config);

  /**
   * @brief One ADVANCE cycle.
   *
   * @param target    Cycle target (must not be below the node's current time).
   * @param inbound   Events delivered with this ADVANCE.
   * @param outbound  Events the node returned (cleared first).
   * @return false on any failure; see error_kind() / last_error().
   */
  bool advance(TimeUs target, const std::vector<Event>& inbound, std::vector<Event>& outbound);

  /**
   * @brief Advance in quanta from the current time to `duration_us`, with no inbound events.
   *
   * Targets are `min(now + quantum, duration)`, as the coordinator computes them.
   */
  bool run(TimeUs duration_us, TimeUs quantum_us);

  /// Send SHUTDOWN. The session must end up closed.
  bool shutdown();

  const std::vector<Event>& stream() const { return stream_; }

  /// Canonical encoding of every emitted event, one per line, in emission order.
  const std::string& stream_bytes() const { return stream_bytes_; }

  uint64_t    stream_digest() const { return digest_.value(); }
  std::string stream_digest_hex() const { return digest_.hex(); }

  TimeUs   now() const    { return now_; }
  uint64_t cycles() const { return cycles_; }

  /// Times reached after each cycle, in order.
  const std::vector<TimeUs>& time_trace() const { return trace_; }

  ErrorKind          error_kind() const { return error_kind_; }
  const std::string& last_error() const { return last_error_; }

  const NodeSession& session() const { return session_; }

private:
  bool exchange(const std::string& line, std::vector<std::string>& replies);
  bool fail(ErrorKind kind, const std::string& why);

  NodeSession         session_;
  std::string         node_id_;
  TimeUs              now_{0};
  uint64_t            cycles_{0};
  std::vector<Event>  stream_;
  std::string         stream_bytes_;
  StreamDigest        digest_;
  std::vector<TimeUs> trace_;
  ErrorKind           error_kind_{ErrorKind::None};
  std::string         last_error_;
};

} // namespace fedsim
