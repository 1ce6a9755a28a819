#pragma once
/**
 * @file network_model.hpp
 * @brief Network models applied by the coordinator's routing step.
 *
 * @details
 * Every directed event a node emits, whose destination is a live node, passes
 * through the active model:
 *
 * - `DirectNetworkModel`: delivered unchanged, zero latency, no loss.
 * - `LatencyNetworkModel`: per-link latency and loss. A delivered copy keeps every field
 *   except `time_us`, which becomes `sent time + latency`. Copies wait in flight
 *   until the coordinator releases everything due before the next cycle's target.
 *
 * Loss is drawn from one PRNG per directed link, seeded from
 * `derive_node_seed("<src>_<dst>", scenario_seed)`. Combined with the coordinator's
 * fixed routing order, a given scenario and seed drop the same packets on every run.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/determinism.hpp"
#include "fedsim/event.hpp"

namespace fedsim {
namespace net {

struct NetworkMetrics {
  uint64_t sent{0};
  uint64_t delivered{0};
  uint64_t dropped{0};
  TimeUs   min_latency_us{0};
  TimeUs   max_latency_us{0};
  uint64_t total_latency_us{0};

  void record_sent() { ++sent; }
  void record_drop() { ++dropped; }
  void record_delivery(TimeUs latency_us);

  double avg_latency_us() const {
    return delivered ? static_cast<double>(total_latency_us) / static_cast<double>(delivered) : 0.0;
  }

  nlohmann::json to_json() const;
};

struct LinkParams {
  TimeUs latency_us{0};
  double loss_rate{0.0};   ///< probability in [0, 1]
};

class INetworkModel {
public:
  virtual ~INetworkModel() = default;

  virtual const char* name() const = 0;

  /// Forget in-flight events and metrics; reseed per-link PRNGs.
  virtual void reset(uint64_t scenario_seed) = 0;

  /// Accept one directed event. Anything deliverable right away is appended to `ready`.
  virtual void route(const Event& ev, std::vector<Event>& ready) = 0;

  /// Append every in-flight event with delivery time `< before_us` to `ready`, earliest first.
  virtual void release(TimeUs before_us, std::vector<Event>& ready) = 0;

  /// Drop in-flight events addressed to `node_id` (it failed); counted as dropped.
  virtual void drop_destination(const std::string& node_id) = 0;

  virtual std::size_t in_flight() const = 0;

  virtual const NetworkMetrics& metrics() const = 0;
};

class DirectNetworkModel : public INetworkModel {
public:
  const char* name() const override { return "direct"; }
  void reset(uint64_t) override { metrics_ = NetworkMetrics{}; }
  void route(const Event& ev, std::vector<Event>& ready) override;
  void release(TimeUs, std::vector<Event>&) override {}
  void drop_destination(const std::string&) override {}
  std::size_t in_flight() const override { return 0; }
  const NetworkMetrics& metrics() const override { return metrics_; }

private:
  NetworkMetrics metrics_;
};

class LatencyNetworkModel : public INetworkModel {
public:
  explicit LatencyNetworkModel(LinkParams defaults = {});

  /// Override parameters for the directed link src -> dst.
  void set_link(const std::string& src, const std::string& dst, LinkParams p);

  LinkParams link(const std::string& src, const std::string& dst) const;

  const char* name() const override { return "latency"; }
  void reset(uint64_t scenario_seed) override;
  void route(const Event& ev, std::vector<Event>& ready) override;
  void release(TimeUs before_us, std::vector<Event>& ready) override;
  void drop_destination(const std::string& node_id) override;
  std::size_t in_flight() const override { return flight_.size(); }
  const NetworkMetrics& metrics() const override { return metrics_; }

private:
  struct InFlight {
    TimeUs   deliver_at{0};
    uint64_t sequence{0};
    TimeUs   sent_at{0};
    Event    event;
  };

  struct Later {
    bool operator()(const InFlight& a, const InFlight& b) const {
      if (a.deliver_at != b.deliver_at) return a.deliver_at > b.deliver_at;
      return a.sequence > b.sequence;
    }
  };

  using LinkKey = std::pair<std::string, std::string>;

  DeterministicRng& link_rng(const LinkKey& key);

  LinkParams                          defaults_;
  std::map<LinkKey, LinkParams>       links_;
  std::map<LinkKey, DeterministicRng> rngs_;
  uint64_t                            seed_{0};

  std::priority_queue<InFlight, std::vector<InFlight>, Later> flight_;
  uint64_t       next_seq_{0};
  NetworkMetrics metrics_;
};

} // namespace net
} // namespace fedsim
