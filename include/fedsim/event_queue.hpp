#pragma once
/**
 * @file event_queue.hpp
 * @brief Per-node priority queue of future events, ordered by (time, insertion sequence).
 *
 * @details
 * This is the ordering authority inside a deterministic node. Two events with the same
 * timestamp come out in the order they were pushed, because ties are broken by a
 * counter owned by the queue, not by addresses or wall-clock time.
 *
 * The queue keeps two timestamps per entry:
 * - `at`: when the node will process it (the sort key).
 * - `event.time_us`: the event's own timestamp, left untouched.
 * They differ only for late deliveries (see NodeCore::deliver).
 *
 * Storage is a fixed-capacity ETL heap. `push()` checks `full()` first; ETL's own
 * overflow checks may be compiled out, so the queue never relies on them.
 *
 * @code
 *   fedsim::EventQueue q;
 *   q.push(ev, now);                  // ScheduleResult::InPast if ev.time_us < now
 *   fedsim::ScheduledEvent next;
 *   while (q.pop_before(target, next)) { ... }   // strictly < target
 * @endcode
 */

#include <cstddef>
#include <cstdint>

#include "etl/priority_queue.h"
#include "etl/vector.h"

#include "fedsim/event.hpp"

namespace fedsim {

enum class ScheduleResult : uint8_t { Ok = 0, InPast = 1, Full = 2 };

inline const char* schedule_result_name(ScheduleResult r) {
  switch (r) {
    case ScheduleResult::Ok:     return "ok";
    case ScheduleResult::InPast: return "in_past";
    case ScheduleResult::Full:   return "queue_full";
  }
  return "unknown";
}

struct ScheduledEvent {
  TimeUs   at{0};        ///< Processing time (sort key).
  uint64_t sequence{0};  ///< Insertion counter (tie-break).
  Event    event;
};

class EventQueue {
public:
  static constexpr std::size_t CAPACITY = 512;   ///< Max pending events per node

  /// Schedule `ev` at its own timestamp. Rejects timestamps before `now`.
  ScheduleResult push(const Event& ev, TimeUs now);

  /// Schedule `ev` for processing at `at` (used for clamped late deliveries).
  ScheduleResult push_at(TimeUs at, const Event& ev, TimeUs now);

  /// Pop the earliest entry if its processing time is strictly before `target`.
  bool pop_before(TimeUs target, ScheduledEvent& out);

  /// Processing time of the earliest entry, if any.
  bool next_time(TimeUs& out) const;

  std::size_t size() const  { return heap_.size(); }
  bool        empty() const { return heap_.empty(); }
  bool        full() const  { return heap_.full(); }
  void        clear();

  /// Sequence number the next push will receive.
  uint64_t next_sequence() const { return next_seq_; }

private:
  /// Heap comparator: "a sorts after b". ETL's heap keeps the greatest on top,
  /// so reversing the order puts the earliest (time, sequence) there.
  struct Later {
    bool operator()(const ScheduledEvent& a, const ScheduledEvent& b) const {
      if (a.at != b.at) return a.at > b.at;
      return a.sequence > b.sequence;
    }
  };

  using Storage = etl::vector<ScheduledEvent, CAPACITY>;

  etl::priority_queue<ScheduledEvent, CAPACITY, Storage, Later> heap_;
  uint64_t next_seq_ = 0;
};

} // namespace fedsim
