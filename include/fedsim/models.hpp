#pragma once
/**
 * @file models.hpp
 * @brief Reference node models: a periodic temperature sensor and an aggregating gateway.
 *
 * Both are deterministic: all variation comes from the NodeCore PRNG, the clock and the
 * delivered events.
 *
 * sensor config keys (all optional):
 *   sample_period_us   default 1000000
 *   first_sample_us    default = sample_period_us
 *   destination        default "gateway"; null emits undirected metric events
 *   mean_c, stddev_c   default 20.0, 2.0
 *
 * gateway config keys (all optional):
 *   processing_latency_us  default 100
 *   aggregate_period_us    default 5000000
 */

#include <memory>
#include <string>

#include "fedsim/node_core.hpp"

namespace fedsim {

class SensorModel : public NodeModel {
public:
  const char* name() const override { return "sensor"; }
  bool install(NodeCore& core, const nlohmann::json& config, std::string& err) override;

  uint64_t samples() const { return sample_id_; }

private:
  TimeUs period_us_{1000000};
  std::optional<std::string> destination_;
  double mean_c_{20.0};
  double stddev_c_{2.0};
  uint64_t sample_id_{0};
};

class GatewayModel : public NodeModel {
public:
  const char* name() const override { return "gateway"; }
  bool install(NodeCore& core, const nlohmann::json& config, std::string& err) override;

  uint64_t received() const  { return received_; }
  uint64_t processed() const { return count_; }

private:
  void on_transmit(NodeCore& core, const Event& ev);
  void on_process(NodeCore& core, const Event& ev);
  void on_aggregate(NodeCore& core);

  TimeUs   latency_us_{100};
  TimeUs   aggregate_us_{5000000};
  uint64_t received_{0};
  uint64_t count_{0};
  double   sum_{0.0};
  double   min_{0.0};
  double   max_{0.0};
};

/// Build a model by name ("sensor" | "gateway"). Returns nullptr for unknown names.
std::unique_ptr<NodeModel> make_model(const std::string& name);

} // namespace fedsim
