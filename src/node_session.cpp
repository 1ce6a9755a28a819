// -----------------------------------------------------------------------------
// node_session.cpp: node-side protocol handling
//
// API: include/fedsim/node_session.hpp
// Tests: tests/test_node_session.cpp, tests/test_harness.cpp
// -----------------------------------------------------------------------------
#include "fedsim/node_session.hpp"

#include "fedsim/codec.hpp"
#include "fedsim/determinism.hpp"
#include "fedsim/log.hpp"

namespace fedsim {

const char* session_state_name(NodeSession::State s) {
  switch (s) {
    case NodeSession::State::AwaitingInit:   return "awaiting_init";
    case NodeSession::State::Ready:          return "ready";
    case NodeSession::State::AwaitingEvents: return "awaiting_events";
    case NodeSession::State::Closed:         return "closed";
    case NodeSession::State::Faulted:        return "faulted";
  }
  return "unknown";
}

NodeSession::NodeSession(std::unique_ptr<NodeModel> model)
: model_(std::move(model)) {}

// ---------- public ----------

bool NodeSession::handle_line(const std::string& line, std::vector<std::string>& replies) {
  switch (state_) {
    case State::AwaitingInit:
    case State::Ready:
      return on_command(line, replies);
    case State::AwaitingEvents:
      return on_events(line, replies);
    case State::Closed:
      return fail(ErrorKind::Protocol, "line_after_shutdown");
    case State::Faulted:
      return false;                               // sticky
  }
  return false;
}

// ---------- private ----------

bool NodeSession::on_command(const std::string& line, std::vector<std::string>& replies) {
  codec::Command cmd;
  std::string err;
  if (!codec::parse_command(line, cmd, err)) return fail(ErrorKind::Protocol, err);

  if (state_ == State::AwaitingInit) {
    if (cmd.type != codec::CommandType::Init) return fail(ErrorKind::Protocol, "expected_init");

    uint64_t scenario_seed = 0;
    const auto s = cmd.config.find("seed");
    if (s != cmd.config.end()) {
      if (!s->is_number_unsigned() && !(s->is_number_integer() && s->get<int64_t>() >= 0))
        return fail(ErrorKind::Protocol, "init_bad_seed");
      scenario_seed = s->get<uint64_t>();
    }

    core_.reset(cmd.node_id, derive_node_seed(cmd.node_id, scenario_seed));
    if (!model_) return fail(ErrorKind::Protocol, "no_model");
    if (!model_->install(core_, cmd.config, err)) return fail(ErrorKind::Protocol, "install_failed " + err);

    FEDSIM_INFO("node", "event=init node=%s model=%s seed=%llu",
                cmd.node_id.c_str(), model_->name(), static_cast<unsigned long long>(scenario_seed));
    state_ = State::Ready;
    replies.emplace_back(codec::KW_READY);
    return true;
  }

  // State::Ready
  switch (cmd.type) {
    case codec::CommandType::Init:
      return fail(ErrorKind::Protocol, "duplicate_init");

    case codec::CommandType::Advance:
      if (cmd.target_us < core_.now())
        return fail(ErrorKind::Protocol, "advance_backwards target=" + std::to_string(cmd.target_us));
      target_ = cmd.target_us;
      state_  = State::AwaitingEvents;            // event array line comes next
      return true;

    case codec::CommandType::Shutdown:
      FEDSIM_INFO("node", "event=shutdown node=%s time_us=%llu processed=%llu emitted=%llu",
                  core_.node_id().c_str(), static_cast<unsigned long long>(core_.now()),
                  static_cast<unsigned long long>(core_.processed()),
                  static_cast<unsigned long long>(core_.emitted()));
      state_ = State::Closed;
      return true;
  }
  return fail(ErrorKind::Protocol, "unknown_command");
}

// -----------------------------------------------------------------------------
// on_events(): second half of ADVANCE.
// POLICY:
//   - Inbound events go to the queue in arrival order; the queue orders them.
//   - Any NodeCore fault is a scheduling error; no DONE is sent.
// OUT:
//   - "DONE" then one event-array line.
// -----------------------------------------------------------------------------
bool NodeSession::on_events(const std::string& line, std::vector<std::string>& replies) {
  std::vector<Event> inbound;
  std::string err;
  if (!codec::decode_events(line, inbound, err)) return fail(ErrorKind::Protocol, err);

  for (const auto& ev : inbound) {
    if (!core_.deliver(ev)) return fail(ErrorKind::Scheduling, core_.fault());
  }

  if (!core_.advance(target_)) return fail(ErrorKind::Scheduling, core_.fault());

  std::vector<Event> out;
  out.reserve(core_.outbox_size());
  Event ev;
  while (core_.get_event(ev)) out.push_back(std::move(ev));

  FEDSIM_TRACE("node", "event=advance node=%s target_us=%llu inbound=%zu outbound=%zu",
               core_.node_id().c_str(), static_cast<unsigned long long>(target_),
               inbound.size(), out.size());

  state_ = State::Ready;
  replies.emplace_back(codec::KW_DONE);
  replies.push_back(codec::encode_events(out));
  return true;
}

bool NodeSession::fail(ErrorKind kind, const std::string& why) {
  if (state_ != State::Faulted) {
    error_kind_ = kind;
    last_error_ = why;
    state_      = State::Faulted;
    FEDSIM_ERROR("node", "node=%s kind=%s detail=\"%s\"",
                 core_.node_id().empty() ? "-" : core_.node_id().c_str(),
                 error_kind_name(kind), why.c_str());
  }
  return false;
}

} // namespace fedsim
