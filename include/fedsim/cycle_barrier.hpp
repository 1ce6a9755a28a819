#pragma once
/**
 * @file cycle_barrier.hpp
 * @brief End-of-cycle join point for the per-node advance tasks.
 *
 * The coordinator reset()s the barrier with the number of tasks it is about to
 * start, each task calls worker_done() exactly once, and the coordinator blocks in
 * wait_for_all() with a deadline. On timeout it can ask completed(i) which tasks
 * are still outstanding.
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

namespace fedsim {

class CycleBarrier {
public:
  explicit CycleBarrier(std::size_t workers = 0);

  /// Arm the barrier for `workers` tasks. Must not race with worker_done().
  void reset(std::size_t workers);

  /// Report task `id` finished. Repeated or out-of-range reports are ignored.
  void worker_done(std::size_t id, bool success);

  /// Block until every task reported, or `timeout_ms` elapsed. False on timeout.
  bool wait_for_all(int timeout_ms);

  bool completed(std::size_t id) const;
  bool all_succeeded() const;
  std::size_t done_count() const;
  std::size_t workers() const;

private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::vector<bool>       completed_;
  std::vector<bool>       success_;
  std::size_t             done_count_ = 0;
};

} // namespace fedsim
