// -----------------------------------------------------------------------------
// event_queue.cpp: implementation for event_queue.hpp
// -----------------------------------------------------------------------------
#include "fedsim/event_queue.hpp"

namespace fedsim {

ScheduleResult EventQueue::push(const Event& ev, TimeUs now) {
  return push_at(ev.time_us, ev, now);
}

ScheduleResult EventQueue::push_at(TimeUs at, const Event& ev, TimeUs now) {
  if (at < now)     return ScheduleResult::InPast;   // never clamp a local schedule
  if (heap_.full()) return ScheduleResult::Full;     // etl asserts may be no-ops

  ScheduledEvent se;
  se.at       = at;
  se.sequence = next_seq_++;                          // deterministic tie-break
  se.event    = ev;
  heap_.push(se);
  return ScheduleResult::Ok;
}

bool EventQueue::pop_before(TimeUs target, ScheduledEvent& out) {
  if (heap_.empty()) return false;
  if (heap_.top().at >= target) return false;         // boundary: == target waits a cycle
  out = heap_.top();
  heap_.pop();
  return true;
}

bool EventQueue::next_time(TimeUs& out) const {
  if (heap_.empty()) return false;
  out = heap_.top().at;
  return true;
}

void EventQueue::clear() {
  heap_.clear();
  next_seq_ = 0;
}

} // namespace fedsim
