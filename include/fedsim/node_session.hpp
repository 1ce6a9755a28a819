#pragma once
/**
 * @file node_session.hpp
 * @brief Node-side protocol state machine: protocol lines in, reply lines out.
 *
 * @details
 * NodeSession sits between a transport and a NodeCore + NodeModel. It does no I/O
 * itself, so the same object serves a real socket (node_server.hpp) and the in-memory
 * DeterminismHarness.
 *
 * ```
 *   AwaitingInit --INIT--> Ready --ADVANCE--> AwaitingEvents --[events]--> Ready
 *                            |                                   (replies DONE + [events])
 *                            +--SHUTDOWN--> Closed
 *   any state --bad line / scheduling fault--> Faulted   (no reply; caller closes)
 * ```
 *
 * INIT config keys used here: "seed" (non-negative integer, default 0). The whole
 * object is passed to the model's install().
 */

#include <memory>
#include <string>
#include <vector>

#include "fedsim/error.hpp"
#include "fedsim/node_core.hpp"

namespace fedsim {

class NodeSession {
public:
  enum class State : uint8_t { AwaitingInit = 0, Ready = 1, AwaitingEvents = 2, Closed = 3, Faulted = 4 };

  explicit NodeSession(std::unique_ptr<NodeModel> model);

  /**
   * @brief Consume one received line.
   *
   * @param line     Protocol line without its terminator.
   * @param replies  Lines to send back, appended in order (possibly none).
   * @return false if the session faulted. Nothing must be sent for this line and
   *         the connection should be closed.
   */
  bool handle_line(const std::string& line, std::vector<std::string>& replies);

  State state() const { return state_; }
  bool  closed() const { return state_ == State::Closed; }
  bool  faulted() const { return state_ == State::Faulted; }

  ErrorKind          error_kind() const { return error_kind_; }
  const std::string& last_error() const { return last_error_; }

  const NodeCore&  core() const  { return core_; }
  const NodeModel& model() const { return *model_; }

  /// Target of the ADVANCE currently waiting for its event line.
  TimeUs pending_target() const { return target_; }

private:
  bool on_command(const std::string& line, std::vector<std::string>& replies);
  bool on_events(const std::string& line, std::vector<std::string>& replies);
  bool fail(ErrorKind kind, const std::string& why);

  std::unique_ptr<NodeModel> model_;
  NodeCore                   core_;
  State                      state_{State::AwaitingInit};
  TimeUs                     target_{0};
  ErrorKind                  error_kind_{ErrorKind::None};
  std::string                last_error_;
};

const char* session_state_name(NodeSession::State s);

} // namespace fedsim
