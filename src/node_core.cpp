// -----------------------------------------------------------------------------
// node_core.cpp: Implementation of fedsim NodeCore
//
// API & field descriptions:
//   see include/fedsim/node_core.hpp
//
// Usage tests:
//   see tests/test_node_core.cpp, tests/test_harness.cpp
//
// NOTE: This file covers the guard conditions and ordering policy.
// External-facing API contracts live in the header.
// -----------------------------------------------------------------------------
#include "fedsim/node_core.hpp"

#include <exception>

namespace fedsim {

// ---------- public ----------

void NodeCore::reset(const std::string& node_id, uint64_t seed) {
  node_id_ = node_id;
  now_     = 0;                       // every lifetime starts at t=0
  rng_.reseed(seed);

  handlers_.clear();
  queue_.clear();                     // also restarts the insertion counter
  outbox_.clear();
  fault_.clear();

  processed_       = 0;
  emitted_         = 0;
  late_deliveries_ = 0;
  unknown_events_  = 0;
}

void NodeCore::on(const std::string& event_type, Handler h) {
  handlers_[event_type] = std::move(h);
}

// deliver(): inbound from the coordinator; late events run at now().
bool NodeCore::deliver(const Event& ev) {
  if (faulted()) return false;

  TimeUs at = ev.time_us;
  if (at < now_) {                    // batching artefact, not a node bug
    at = now_;
    ++late_deliveries_;
  }

  const ScheduleResult r = queue_.push_at(at, ev, now_);
  if (r != ScheduleResult::Ok) {
    set_fault(std::string("deliver_") + schedule_result_name(r));
    return false;
  }
  return true;
}

bool NodeCore::schedule(TimeUs at, const std::string& event_type, const nlohmann::json& payload) {
  if (faulted()) return false;

  Event ev;
  ev.event_type  = event_type;
  ev.time_us     = at;
  ev.source      = node_id_;
  ev.destination = node_id_;
  ev.payload     = payload.is_null() ? nlohmann::json::object() : payload;

  const ScheduleResult r = queue_.push(ev, now_);
  if (r == ScheduleResult::InPast) {
    set_fault("schedule_in_past type=" + event_type + " at=" + std::to_string(at) +
              " now=" + std::to_string(now_));
    return false;
  }
  if (r == ScheduleResult::Full) {
    set_fault("schedule_queue_full type=" + event_type);
    return false;
  }
  return true;
}

bool NodeCore::emit(Event ev) {
  if (faulted()) return false;

  if (ev.time_us < now_) {            // no retroactive events, ever
    set_fault("emit_in_past type=" + ev.event_type + " time_us=" + std::to_string(ev.time_us) +
              " now=" + std::to_string(now_));
    return false;
  }
  if (outbox_.full()) {
    set_fault("outbox_full");
    return false;
  }

  ev.source = node_id_;
  outbox_.push_back(std::move(ev));
  ++emitted_;
  return true;
}

bool NodeCore::emit_now(const std::string& event_type,
                        const std::optional<std::string>& destination,
                        const nlohmann::json& payload) {
  Event ev;
  ev.event_type  = event_type;
  ev.time_us     = now_;
  ev.destination = destination;
  ev.payload     = payload.is_null() ? nlohmann::json::object() : payload;
  return emit(std::move(ev));
}

// -----------------------------------------------------------------------------
// advance(): run the clock forward to `target`.
// PRE:
//   - target >= now_ (the coordinator never moves a node backwards).
// POLICY:
//   - Pop strictly below target; an event at exactly `target` waits a cycle.
//   - Clock jumps to each event's processing time before its handler runs.
//   - Stop at the first fault; the rest of the queue stays put.
// OUT:
//   - now_ == target on success.
// -----------------------------------------------------------------------------
bool NodeCore::advance(TimeUs target) {
  if (faulted()) return false;
  if (target < now_) {
    set_fault("advance_backwards target=" + std::to_string(target) + " now=" + std::to_string(now_));
    return false;
  }

  ScheduledEvent next;
  while (queue_.pop_before(target, next)) {
    now_ = next.at;
    dispatch(next.event);
    if (faulted()) return false;
  }

  now_ = target;
  return true;
}

bool NodeCore::get_event(Event& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

// ---------- private ----------

void NodeCore::set_fault(const std::string& why) {
  if (fault_.empty()) fault_ = why;   // first fault wins
}

void NodeCore::dispatch(const Event& ev) {
  auto it = handlers_.find(ev.event_type);
  if (it == handlers_.end()) {
    ++unknown_events_;
    return;
  }

  ++processed_;
  try {
    it->second(*this, ev);
  } catch (const std::exception& e) {
    set_fault("handler_error type=" + ev.event_type + " what=" + e.what());
  }
}

} // namespace fedsim
