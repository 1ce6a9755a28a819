// -----------------------------------------------------------------------------
// node_handle.cpp: coordinator-side protocol state machine for one node
//
// API: include/fedsim/node_handle.hpp
// Tests: tests/test_node_handle.cpp
// -----------------------------------------------------------------------------
#include "fedsim/node_handle.hpp"

#include "fedsim/codec.hpp"
#include "fedsim/log.hpp"
#include "fedsim/transport/transport_socket.hpp"

namespace fedsim {

using transport::IoResult;

const char* node_state_name(NodeState s) {
  switch (s) {
    case NodeState::Connecting:    return "connecting";
    case NodeState::AwaitingReady: return "awaiting_ready";
    case NodeState::Idle:          return "idle";
    case NodeState::Advancing:     return "advancing";
    case NodeState::AwaitingDone:  return "awaiting_done";
    case NodeState::Failed:        return "failed";
    case NodeState::ShutDown:      return "shutdown";
  }
  return "unknown";
}

NodeHandle::NodeHandle(std::string node_id, Endpoint endpoint, bool deterministic)
: node_id_(std::move(node_id)), endpoint_(std::move(endpoint)), deterministic_(deterministic) {}

NodeHandle::NodeHandle(std::string node_id, std::unique_ptr<transport::ITransport> conn, bool deterministic)
: node_id_(std::move(node_id)), deterministic_(deterministic), conn_(std::move(conn)) {}

NodeHandle::~NodeHandle() {
  release_connection();
}

// ---------- setup ----------

bool NodeHandle::connect(int attempts, int retry_delay_ms, int attempt_timeout_ms) {
  if (state_ != NodeState::Connecting) return false;
  if (conn_) return true;                         // supplied already connected

  std::string err;
  const int fd = connect_with_retries(endpoint_, attempts, retry_delay_ms, attempt_timeout_ms, err,
                                      [this] { return abort_kind_.load() != 0; });
  if (fd < 0) {
    const auto aborted = static_cast<ErrorKind>(abort_kind_.load());
    if (aborted != ErrorKind::None) {
      fail(aborted, 0, "connect aborted endpoint=" + endpoint_.str());
      return false;
    }
    fail(ErrorKind::Transport, 0, "connect_failed endpoint=" + endpoint_.str() + " " + err);
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(conn_mu_);
    conn_ = std::make_unique<transport::SocketTransport>(fd, endpoint_.str());
  }
  if (abort_kind_.load() != 0) {                  // cancelled while still retrying
    fail(static_cast<ErrorKind>(abort_kind_.load()), 0, "connect aborted");
    return false;
  }
  FEDSIM_DEBUG("handle", "node=%s event=connected endpoint=%s", node_id_.c_str(), endpoint_.str().c_str());
  return true;
}

bool NodeHandle::initialize(const nlohmann::json& config, int timeout_ms) {
  if (state_ != NodeState::Connecting) return false;
  if (!conn_) { fail(ErrorKind::Transport, 0, "not_connected"); return false; }

  const auto dl = transport::deadline_in_ms(timeout_ms);

  IoResult r = conn_->send_line(codec::encode_init(node_id_, config), dl);
  if (r != IoResult::Ok) return io_fail(r, 0, "send_init");
  state_ = NodeState::AwaitingReady;

  std::string line;
  r = conn_->recv_line(line, dl);
  if (r != IoResult::Ok) return io_fail(r, 0, "await_ready");

  codec::ResponseType rt;
  std::string err;
  if (!codec::parse_response(line, rt, err) || rt != codec::ResponseType::Ready) {
    fail(ErrorKind::Protocol, 0, "expected_ready got=\"" + line.substr(0, 64) + "\"");
    return false;
  }

  state_ = NodeState::Idle;
  FEDSIM_INFO("handle", "node=%s event=ready", node_id_.c_str());
  return true;
}

// ---------- cycle ----------

// -----------------------------------------------------------------------------
// advance(): one request/response exchange.
// PRE:   state_ == Idle; target >= current_time_us_.
// POLICY:
//   - One deadline covers the whole exchange.
//   - Response is exactly "DONE" then one JSON array line.
//   - Events older than the cycle start are rejected, never clamped.
//   - Every emitted event must carry this node's id as its source.
//   - Inbound events count as delivered only once the node answered the cycle.
// OUT:   emitted_ holds this cycle's events; current_time_us_ == target.
// -----------------------------------------------------------------------------
bool NodeHandle::advance(TimeUs target, int timeout_ms, uint64_t cycle) {
  emitted_.clear();
  if (state_ != NodeState::Idle) return false;
  if (target < current_time_us_) {
    fail(ErrorKind::Protocol, cycle, "target_before_node_time");
    return false;
  }

  const auto dl = transport::deadline_in_ms(timeout_ms);
  state_ = NodeState::Advancing;

  IoResult r = conn_->send_line(codec::encode_advance(target), dl);
  if (r != IoResult::Ok) return io_fail(r, cycle, "send_advance");

  r = conn_->send_line(codec::encode_events(pending_inbound_), dl);
  if (r != IoResult::Ok) return io_fail(r, cycle, "send_events");
  const std::size_t sent_inbound = pending_inbound_.size();
  pending_inbound_.clear();

  state_ = NodeState::AwaitingDone;

  std::string line;
  r = conn_->recv_line(line, dl);
  if (r != IoResult::Ok) return io_fail(r, cycle, "await_done");

  codec::ResponseType rt;
  std::string err;
  if (!codec::parse_response(line, rt, err) || rt != codec::ResponseType::Done) {
    fail(ErrorKind::Protocol, cycle, "expected_done got=\"" + line.substr(0, 64) + "\"");
    return false;
  }

  r = conn_->recv_line(line, dl);
  if (r != IoResult::Ok) return io_fail(r, cycle, "await_events");

  std::vector<Event> events;
  if (!codec::decode_events(line, events, err)) {
    fail(ErrorKind::Protocol, cycle, err);
    return false;
  }

  for (const auto& ev : events) {
    if (ev.source != node_id_) {
      fail(ErrorKind::Protocol, cycle, "source_mismatch type=" + ev.event_type + " source=" + ev.source);
      return false;
    }
    if (ev.time_us < current_time_us_) {
      fail(ErrorKind::Scheduling, cycle,
           "emitted_in_past type=" + ev.event_type + " time_us=" + std::to_string(ev.time_us) +
           " cycle_start=" + std::to_string(current_time_us_));
      return false;                               // whole response discarded
    }
  }

  for (const auto& ev : events) digest_.add(codec::encode_event(ev));
  events_emitted_   += events.size();
  events_delivered_ += sent_inbound;
  emitted_ = std::move(events);

  current_time_us_ = target;
  ++cycles_completed_;
  state_ = NodeState::Idle;
  return true;
}

// ---------- teardown ----------

void NodeHandle::shutdown(int grace_ms) {
  if (state_ == NodeState::Failed || state_ == NodeState::ShutDown) {
    release_connection();
    return;
  }

  if (state_ == NodeState::Idle && conn_) {
    const auto dl = transport::deadline_in_ms(grace_ms);
    const IoResult r = conn_->send_line(codec::encode_shutdown(), dl);
    if (r == IoResult::Ok && conn_->wait_closed(dl)) {
      FEDSIM_INFO("handle", "node=%s event=shutdown ack=closed", node_id_.c_str());
    } else {
      FEDSIM_WARN("handle", "node=%s event=shutdown ack=none forced_close=1", node_id_.c_str());
    }
  }

  release_connection();
  state_ = NodeState::ShutDown;
}

void NodeHandle::abort(ErrorKind kind) {
  uint8_t expected = 0;
  abort_kind_.compare_exchange_strong(expected, static_cast<uint8_t>(kind));
  std::lock_guard<std::mutex> lk(conn_mu_);
  if (conn_) conn_->abort();
}

void NodeHandle::fail(ErrorKind kind, uint64_t cycle, const std::string& detail) {
  if (state_ == NodeState::Failed) return;

  failure_.kind   = kind;
  failure_.cycle  = cycle;
  failure_.detail = codec::printable(detail);
  state_ = NodeState::Failed;
  emitted_.clear();
  pending_inbound_.clear();

  FEDSIM_WARN("handle", "node=%s cycle=%llu kind=%s detail=\"%s\"",
              node_id_.c_str(), static_cast<unsigned long long>(cycle),
              error_kind_name(kind), failure_.detail.c_str());
  release_connection();
}

// ---------- private ----------

// io_fail(): classify a transport result; an abort overrides what the I/O saw.
bool NodeHandle::io_fail(IoResult r, uint64_t cycle, const char* during) {
  const auto aborted = static_cast<ErrorKind>(abort_kind_.load());
  if (aborted != ErrorKind::None) {
    fail(aborted, cycle, std::string(during) + " aborted");
    return false;
  }

  ErrorKind kind = ErrorKind::Transport;
  if (r == IoResult::Timeout)  kind = ErrorKind::Timeout;
  if (r == IoResult::Overflow) kind = ErrorKind::Protocol;

  std::string detail = std::string(during) + " " + transport::io_result_name(r);
  if (r == IoResult::Error && conn_) detail += " " + conn_->last_error();
  fail(kind, cycle, detail);
  return false;
}

void NodeHandle::release_connection() {
  std::lock_guard<std::mutex> lk(conn_mu_);
  if (conn_) {
    conn_->close();                               // idempotent; fd closed once
    conn_.reset();
  }
}

} // namespace fedsim
