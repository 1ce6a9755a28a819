// -----------------------------------------------------------------------------
// coordinator.cpp: lockstep cycle loop, fan-out/fan-in, boundary routing
//
// API: include/fedsim/coordinator.hpp
// Tests: tests/test_coordinator.cpp
// -----------------------------------------------------------------------------
#include "fedsim/coordinator.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <thread>

#include "fedsim/log.hpp"

namespace fedsim {

// Extra time the barrier grants on top of the per-node deadline before it starts
// aborting tasks. A task normally ends on its own deadline first.
static constexpr int BARRIER_SLACK_MS = 1000;

// Barrier waits are summed in 64 bits and saturate at INT_MAX ms (about 24 days).
static int saturate_ms(int64_t ms) {
  if (ms < 0) return 0;
  return ms > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : static_cast<int>(ms);
}

TimeUs ScenarioClock::next_target() const {
  if (global_time_us >= duration_us) return duration_us;
  const TimeUs left = duration_us - global_time_us;
  return global_time_us + std::min(quantum_us, left);
}

Coordinator::Coordinator(CoordinatorConfig cfg)
: cfg_(cfg),
  network_(std::make_unique<net::DirectNetworkModel>()),
  sink_(std::make_unique<CountingSink>()) {}

Coordinator::~Coordinator() {
  shutdown_all();
}

bool Coordinator::add_node(std::unique_ptr<NodeHandle> node, std::string& err) {
  if (!node) { err = "null node"; return false; }
  if (initialized_) { err = "nodes must be added before initialization"; return false; }
  if (find_node(node->node_id())) { err = "duplicate node id " + node->node_id(); return false; }
  nodes_.push_back(std::move(node));
  return true;
}

void Coordinator::set_network_model(std::unique_ptr<net::INetworkModel> model) {
  if (model) network_ = std::move(model);
}

void Coordinator::set_metrics_sink(std::unique_ptr<IMetricsSink> sink) {
  if (sink) sink_ = std::move(sink);
}

// -----------------------------------------------------------------------------
// initialize_all(): connect + INIT, one task per node.
// POLICY:
//   - A node that cannot be reached or does not answer READY is Failed at cycle 0;
//     the others carry on.
//   - The barrier waits for the whole retry budget (delay plus connect deadline per
//     attempt) plus the INIT deadline.
// -----------------------------------------------------------------------------
std::size_t Coordinator::initialize_all(const nlohmann::json& configs) {
  initialized_ = true;
  if (nodes_.empty()) return 0;

  std::vector<nlohmann::json> init_cfg;
  init_cfg.reserve(nodes_.size());
  for (const auto& h : nodes_) {
    nlohmann::json c = nlohmann::json::object();
    if (configs.is_object() && configs.contains(h->node_id()) && configs[h->node_id()].is_object())
      c = configs[h->node_id()];
    c["seed"] = cfg_.seed;
    init_cfg.push_back(std::move(c));
  }

  barrier_.reset(nodes_.size());
  std::vector<std::thread> tasks;
  tasks.reserve(nodes_.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    NodeHandle* h = nodes_[i].get();
    const nlohmann::json* c = &init_cfg[i];
    tasks.emplace_back([this, h, c, i] {
      const bool ok = h->connect(cfg_.connect_retries, cfg_.connect_retry_delay_ms, cfg_.connect_timeout_ms) &&
                      h->initialize(*c, cfg_.init_timeout_ms);
      barrier_.worker_done(i, ok);
    });
  }

  const int64_t per_attempt = int64_t{std::max(0, cfg_.connect_retry_delay_ms)} +
                              int64_t{std::max(0, cfg_.connect_timeout_ms)};
  const int budget = saturate_ms(int64_t{std::max(1, cfg_.connect_retries)} * per_attempt +
                                 cfg_.init_timeout_ms + BARRIER_SLACK_MS);
  if (!barrier_.wait_for_all(budget)) {
    for (std::size_t i = 0; i < nodes_.size(); ++i)
      if (!barrier_.completed(i)) nodes_[i]->abort(ErrorKind::Timeout);
  }
  for (auto& t : tasks) t.join();

  std::size_t ready = 0;
  for (auto& h : nodes_) {
    if (h->live() && h->aborted()) h->fail(ErrorKind::Timeout, 0, "init_deadline_exceeded");
    if (h->state() == NodeState::Idle) ++ready;
  }
  FEDSIM_INFO("coord", "event=initialized nodes=%zu ready=%zu", nodes_.size(), ready);
  return ready;
}

// ---------- run ----------

RunSummary Coordinator::run(TimeUs duration_us, TimeUs quantum_us) {
  begin(duration_us, quantum_us);
  while (step()) {}
  return finish();
}

void Coordinator::begin(TimeUs duration_us, TimeUs quantum_us) {
  if (!initialized_) initialize_all(nlohmann::json::object());

  clock_ = ScenarioClock{};
  clock_.duration_us = duration_us;
  clock_.quantum_us  = quantum_us;
  network_->reset(cfg_.seed);

  started_ = std::chrono::steady_clock::now();
  FEDSIM_INFO("coord", "event=start duration_us=%llu quantum_us=%llu nodes=%zu live=%zu seed=%llu",
              static_cast<unsigned long long>(duration_us), static_cast<unsigned long long>(quantum_us),
              nodes_.size(), live_count(), static_cast<unsigned long long>(cfg_.seed));
  if (quantum_us == 0) FEDSIM_ERROR("coord", "status=error reason=zero_quantum");
}

RunSummary Coordinator::finish() {
  wall_seconds_ = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

  if (live_count() == 0) {
    FEDSIM_ERROR("coord", "status=error reason=all_nodes_failed cycle=%llu time_us=%llu",
                 static_cast<unsigned long long>(clock_.cycle),
                 static_cast<unsigned long long>(clock_.global_time_us));
  }

  shutdown_all();
  sink_->flush();

  RunSummary s = summarize();
  FEDSIM_INFO("coord", "event=finished cycles=%llu time_us=%llu failed=%llu wall_s=%.3f",
              static_cast<unsigned long long>(s.cycles), static_cast<unsigned long long>(s.final_time_us),
              static_cast<unsigned long long>(s.failed_count()), s.wall_seconds);
  return s;
}

// -----------------------------------------------------------------------------
// step(): one cycle.
// PRE:   clock_ not finished; at least one live node.
// OUT:   global_time_us == target; emitted events routed; nodes that failed this
//        cycle have their in-flight traffic dropped.
// -----------------------------------------------------------------------------
bool Coordinator::step() {
  if (clock_.quantum_us == 0 || clock_.finished()) return false;
  if (live_count() == 0) return false;

  const TimeUs target = clock_.next_target();
  ++clock_.cycle;

  std::vector<bool> was_live(nodes_.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) was_live[i] = nodes_[i]->live();

  advance_live(target);

  for (std::size_t i = 0; i < nodes_.size(); ++i)
    if (was_live[i] && !nodes_[i]->live()) network_->drop_destination(nodes_[i]->node_id());

  const TimeUs release_before = std::min(target + clock_.quantum_us, clock_.duration_us);
  route_emitted(release_before);

  clock_.global_time_us = target;

  if (cfg_.progress_every != 0 && clock_.cycle % cfg_.progress_every == 0) log_progress();
  return true;
}

// advance_live(): fan out one task per live node, fan in at the barrier.
void Coordinator::advance_live(TimeUs target) {
  std::vector<NodeHandle*> live;
  for (auto& h : nodes_) if (h->live()) live.push_back(h.get());

  const uint64_t cycle = clock_.cycle;
  barrier_.reset(live.size());
  std::vector<std::thread> tasks;
  tasks.reserve(live.size());
  for (std::size_t i = 0; i < live.size(); ++i) {
    NodeHandle* h = live[i];
    tasks.emplace_back([this, h, i, target, cycle] {
      const bool ok = h->advance(target, cfg_.cycle_timeout_ms, cycle);
      barrier_.worker_done(i, ok);
    });
  }

  if (!barrier_.wait_for_all(saturate_ms(int64_t{cfg_.cycle_timeout_ms} + BARRIER_SLACK_MS))) {
    for (std::size_t i = 0; i < live.size(); ++i)
      if (!barrier_.completed(i)) live[i]->abort(ErrorKind::Timeout);
  }
  for (auto& t : tasks) t.join();

  // A task that finished just as it was aborted has lost its connection anyway.
  for (NodeHandle* h : live)
    if (h->live() && h->aborted()) h->fail(ErrorKind::Timeout, cycle, "cycle_deadline_exceeded");
}

// -----------------------------------------------------------------------------
// route_emitted(): boundary routing.
// POLICY:
//   - Nodes in registration order, each node's events in emission order.
//   - Undirected, unknown-destination and failed-destination events go to the sink.
//   - The network model releases everything due before the next cycle's target.
//   - Inbound order per node is arrival order; the node's queue orders by time.
// -----------------------------------------------------------------------------
void Coordinator::route_emitted(TimeUs release_before) {
  const uint64_t cycle = clock_.cycle;
  std::vector<Event> ready;

  auto deliver = [&](const Event& ev) {
    NodeHandle* dst = ev.destination ? find_node(*ev.destination) : nullptr;
    if (!dst) { sink_->record(cycle, ev, "unknown_destination"); return; }
    if (!dst->live()) { sink_->record(cycle, ev, "destination_not_live"); return; }
    dst->enqueue_inbound(ev);
  };

  for (auto& src : nodes_) {
    for (const auto& ev : src->emitted()) {
      if (!ev.directed()) { sink_->record(cycle, ev, "undirected"); continue; }

      NodeHandle* dst = find_node(*ev.destination);
      if (!dst) {
        FEDSIM_DEBUG("coord", "cycle=%llu event=unroutable src=%s dst=%s",
                     static_cast<unsigned long long>(cycle), src->node_id().c_str(), ev.destination->c_str());
        sink_->record(cycle, ev, "unknown_destination");
        continue;
      }
      if (!dst->live()) { sink_->record(cycle, ev, "destination_not_live"); continue; }

      ready.clear();
      network_->route(ev, ready);
      for (const auto& r : ready) deliver(r);
    }
  }

  ready.clear();
  network_->release(release_before, ready);
  for (const auto& r : ready) deliver(r);
}

// ---------- teardown / reporting ----------

void Coordinator::shutdown_all() {
  if (shut_down_) return;
  shut_down_ = true;
  for (auto& h : nodes_) h->shutdown(cfg_.shutdown_grace_ms);
}

RunSummary Coordinator::summarize() const {
  RunSummary s;
  s.cycles        = clock_.cycle;
  s.final_time_us = clock_.global_time_us;
  s.duration_us   = clock_.duration_us;
  s.completed     = clock_.duration_us > 0 && clock_.finished();
  s.wall_seconds  = wall_seconds_;
  s.sink_records  = sink_->records();
  s.network_model = network_->name();
  s.network       = network_->metrics();

  for (const auto& h : nodes_) s.nodes.push_back(make_node_report(*h));
  s.all_failed = s.failed_count() == s.nodes.size();
  if (s.all_failed) s.completed = false;
  return s;
}

std::size_t Coordinator::live_count() const {
  std::size_t n = 0;
  for (const auto& h : nodes_) if (h->live()) ++n;
  return n;
}

const NodeHandle* Coordinator::node(const std::string& id) const {
  for (const auto& h : nodes_) if (h->node_id() == id) return h.get();
  return nullptr;
}

NodeHandle* Coordinator::find_node(const std::string& id) {
  for (auto& h : nodes_) if (h->node_id() == id) return h.get();
  return nullptr;
}

void Coordinator::log_progress() const {
  const double pct = clock_.duration_us
                   ? 100.0 * static_cast<double>(clock_.global_time_us) / static_cast<double>(clock_.duration_us)
                   : 100.0;
  const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
  FEDSIM_INFO("coord", "event=progress cycle=%llu time_us=%llu pct=%.1f wall_s=%.3f live=%zu",
              static_cast<unsigned long long>(clock_.cycle),
              static_cast<unsigned long long>(clock_.global_time_us), pct, wall, live_count());
}

} // namespace fedsim
