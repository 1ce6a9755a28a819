// -----------------------------------------------------------------------------
// cycle_barrier.cpp: implementation for cycle_barrier.hpp
// -----------------------------------------------------------------------------
#include "fedsim/cycle_barrier.hpp"

#include <chrono>

namespace fedsim {

CycleBarrier::CycleBarrier(std::size_t workers) {
  reset(workers);
}

void CycleBarrier::reset(std::size_t workers) {
  std::lock_guard<std::mutex> lk(mutex_);
  completed_.assign(workers, false);
  success_.assign(workers, false);
  done_count_ = 0;
}

void CycleBarrier::worker_done(std::size_t id, bool success) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (id >= completed_.size() || completed_[id]) return;
    completed_[id] = true;
    success_[id]   = success;
    ++done_count_;
  }
  cv_.notify_all();
}

bool CycleBarrier::wait_for_all(int timeout_ms) {
  std::unique_lock<std::mutex> lk(mutex_);
  return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                      [this] { return done_count_ == completed_.size(); });
}

bool CycleBarrier::completed(std::size_t id) const {
  std::lock_guard<std::mutex> lk(mutex_);
  return id < completed_.size() && completed_[id];
}

bool CycleBarrier::all_succeeded() const {
  std::lock_guard<std::mutex> lk(mutex_);
  if (done_count_ != completed_.size()) return false;
  for (bool s : success_) if (!s) return false;
  return true;
}

std::size_t CycleBarrier::done_count() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return done_count_;
}

std::size_t CycleBarrier::workers() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return completed_.size();
}

} // namespace fedsim
