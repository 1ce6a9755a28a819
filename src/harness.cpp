// -----------------------------------------------------------------------------
// harness.cpp: in-memory protocol driver for one NodeSession
// -----------------------------------------------------------------------------
#include "fedsim/harness.hpp"

#include <algorithm>

#include "fedsim/codec.hpp"

namespace fedsim {

DeterminismHarness::DeterminismHarness(std::unique_ptr<NodeModel> model)
: session_(std::move(model)) {}

// ---------- public ----------

bool DeterminismHarness::init(const std::string& node_id, const nlohmann::json& config) {
  if (error_kind_ != ErrorKind::None) return false;
  if (!codec::valid_node_id(node_id)) return fail(ErrorKind::Protocol, "bad_node_id");

  std::vector<std::string> replies;
  if (!exchange(codec::encode_init(node_id, config), replies)) return false;

  codec::ResponseType rt;
  std::string err;
  if (replies.size() != 1 || !codec::parse_response(replies[0], rt, err) ||
      rt != codec::ResponseType::Ready) {
    return fail(ErrorKind::Protocol, "expected_ready");
  }

  node_id_ = node_id;
  now_     = 0;
  return true;
}

bool DeterminismHarness::advance(TimeUs target, const std::vector<Event>& inbound,
                                 std::vector<Event>& outbound) {
  outbound.clear();
  if (error_kind_ != ErrorKind::None) return false;
  if (target < now_) return fail(ErrorKind::Protocol, "target_before_node_time");

  std::vector<std::string> replies;
  if (!exchange(codec::encode_advance(target), replies)) return false;
  if (!replies.empty()) return fail(ErrorKind::Protocol, "reply_before_events");
  if (!exchange(codec::encode_events(inbound), replies)) return false;

  codec::ResponseType rt;
  std::string err;
  if (replies.size() != 2 || !codec::parse_response(replies[0], rt, err) ||
      rt != codec::ResponseType::Done) {
    return fail(ErrorKind::Protocol, "expected_done");
  }
  if (!codec::decode_events(replies[1], outbound, err)) return fail(ErrorKind::Protocol, err);

  // no retroactive events: nothing older than the cycle's start time
  for (const auto& ev : outbound) {
    if (ev.time_us < now_) {
      outbound.clear();
      return fail(ErrorKind::Scheduling, "emitted_in_past time_us=" + std::to_string(ev.time_us) +
                                         " cycle_start=" + std::to_string(now_));
    }
  }

  for (const auto& ev : outbound) {
    const std::string bytes = codec::encode_event(ev);
    stream_bytes_ += bytes;
    stream_bytes_ += '\n';
    digest_.add(bytes);
    stream_.push_back(ev);
  }

  now_ = target;
  ++cycles_;
  trace_.push_back(now_);
  return true;
}

bool DeterminismHarness::run(TimeUs duration_us, TimeUs quantum_us) {
  if (quantum_us == 0) return fail(ErrorKind::Protocol, "zero_quantum");

  std::vector<Event> none;
  std::vector<Event> out;
  while (now_ < duration_us) {
    const TimeUs target = std::min(now_ + quantum_us, duration_us);
    if (!advance(target, none, out)) return false;
  }
  return true;
}

bool DeterminismHarness::shutdown() {
  if (error_kind_ != ErrorKind::None) return false;
  std::vector<std::string> replies;
  if (!exchange(codec::encode_shutdown(), replies)) return false;
  if (!replies.empty() || !session_.closed()) return fail(ErrorKind::Protocol, "shutdown_not_acknowledged");
  return true;
}

// ---------- private ----------

// exchange(): hand one line to the session; a session fault becomes ours.
bool DeterminismHarness::exchange(const std::string& line, std::vector<std::string>& replies) {
  if (!session_.handle_line(line, replies)) {
    return fail(session_.error_kind() == ErrorKind::None ? ErrorKind::Protocol : session_.error_kind(),
                session_.last_error());
  }
  return true;
}

bool DeterminismHarness::fail(ErrorKind kind, const std::string& why) {
  if (error_kind_ == ErrorKind::None) {
    error_kind_ = kind;
    last_error_ = why;
  }
  return false;
}

} // namespace fedsim
