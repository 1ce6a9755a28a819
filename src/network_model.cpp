// -----------------------------------------------------------------------------
// network_model.cpp: direct and latency/loss network models
// -----------------------------------------------------------------------------
#include "fedsim/network_model.hpp"

namespace fedsim {
namespace net {

// ---------- metrics ----------

void NetworkMetrics::record_delivery(TimeUs latency_us) {
  if (delivered == 0) {
    min_latency_us = max_latency_us = latency_us;
  } else {
    if (latency_us < min_latency_us) min_latency_us = latency_us;
    if (latency_us > max_latency_us) max_latency_us = latency_us;
  }
  ++delivered;
  total_latency_us += latency_us;
}

nlohmann::json NetworkMetrics::to_json() const {
  return {
    {"sent", sent},
    {"delivered", delivered},
    {"dropped", dropped},
    {"min_latency_us", min_latency_us},
    {"max_latency_us", max_latency_us},
    {"avg_latency_us", avg_latency_us()},
    {"total_latency_us", total_latency_us}
  };
}

// ---------- direct ----------

void DirectNetworkModel::route(const Event& ev, std::vector<Event>& ready) {
  metrics_.record_sent();
  metrics_.record_delivery(0);
  ready.push_back(ev);
}

// ---------- latency ----------

LatencyNetworkModel::LatencyNetworkModel(LinkParams defaults)
: defaults_(defaults) {}

void LatencyNetworkModel::set_link(const std::string& src, const std::string& dst, LinkParams p) {
  links_[LinkKey(src, dst)] = p;
}

LinkParams LatencyNetworkModel::link(const std::string& src, const std::string& dst) const {
  const auto it = links_.find(LinkKey(src, dst));
  return it == links_.end() ? defaults_ : it->second;
}

void LatencyNetworkModel::reset(uint64_t scenario_seed) {
  seed_ = scenario_seed;
  rngs_.clear();                                   // recreated lazily from the new seed
  flight_ = decltype(flight_)();
  next_seq_ = 0;
  metrics_ = NetworkMetrics{};
}

DeterministicRng& LatencyNetworkModel::link_rng(const LinkKey& key) {
  auto it = rngs_.find(key);
  if (it == rngs_.end()) {
    const uint64_t s = derive_node_seed(key.first + "_" + key.second, seed_);
    it = rngs_.emplace(key, DeterministicRng(s)).first;
  }
  return it->second;
}

void LatencyNetworkModel::route(const Event& ev, std::vector<Event>&) {
  metrics_.record_sent();

  const LinkKey key(ev.source, ev.destination.value_or(std::string()));
  const LinkParams p = link(key.first, key.second);

  if (link_rng(key).chance(p.loss_rate)) {         // one draw per packet, in routing order
    metrics_.record_drop();
    return;
  }

  InFlight f;
  f.deliver_at    = ev.time_us + p.latency_us;
  f.sequence      = next_seq_++;
  f.sent_at       = ev.time_us;
  f.event         = ev;
  f.event.time_us = f.deliver_at;
  flight_.push(std::move(f));
}

void LatencyNetworkModel::release(TimeUs before_us, std::vector<Event>& ready) {
  while (!flight_.empty() && flight_.top().deliver_at < before_us) {
    const InFlight& f = flight_.top();
    metrics_.record_delivery(f.deliver_at - f.sent_at);
    ready.push_back(f.event);
    flight_.pop();
  }
}

void LatencyNetworkModel::drop_destination(const std::string& node_id) {
  std::vector<InFlight> keep;
  keep.reserve(flight_.size());
  while (!flight_.empty()) {
    const InFlight& f = flight_.top();
    if (f.event.destination && *f.event.destination == node_id) metrics_.record_drop();
    else keep.push_back(f);
    flight_.pop();
  }
  for (auto& f : keep) flight_.push(std::move(f));
}

} // namespace net
} // namespace fedsim
