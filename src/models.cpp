// -----------------------------------------------------------------------------
// models.cpp: reference sensor and gateway models
// -----------------------------------------------------------------------------
#include "fedsim/models.hpp"

namespace fedsim {

// -------- helpers --------

// read_time(): optional non-negative integer field with a default.
static bool read_time(const nlohmann::json& cfg, const char* key, TimeUs& out, std::string& err) {
  if (!cfg.contains(key)) return true;
  const auto& v = cfg.at(key);
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
    err = std::string("bad_config key=") + key;
    return false;
  }
  out = v.get<TimeUs>();
  return true;
}

static bool read_real(const nlohmann::json& cfg, const char* key, double& out, std::string& err) {
  if (!cfg.contains(key)) return true;
  const auto& v = cfg.at(key);
  if (!v.is_number()) {
    err = std::string("bad_config key=") + key;
    return false;
  }
  out = v.get<double>();
  return true;
}

// -------- sensor --------

bool SensorModel::install(NodeCore& core, const nlohmann::json& config, std::string& err) {
  period_us_   = 1000000;
  destination_ = std::string("gateway");
  mean_c_      = 20.0;
  stddev_c_    = 2.0;
  sample_id_   = 0;

  if (!config.is_object()) { err = "config_not_object"; return false; }

  if (!read_time(config, "sample_period_us", period_us_, err)) return false;
  if (period_us_ == 0) { err = "bad_config key=sample_period_us"; return false; }

  TimeUs first = period_us_;
  if (!read_time(config, "first_sample_us", first, err)) return false;

  if (config.contains("destination")) {
    const auto& d = config.at("destination");
    if (d.is_null())        destination_.reset();
    else if (d.is_string()) destination_ = d.get<std::string>();
    else { err = "bad_config key=destination"; return false; }
  }

  if (!read_real(config, "mean_c", mean_c_, err))     return false;
  if (!read_real(config, "stddev_c", stddev_c_, err)) return false;

  core.on("SAMPLE", [this](NodeCore& c, const Event&) {
    const double temperature = c.rng().gaussian(mean_c_, stddev_c_);
    nlohmann::json payload = {
      {"temperature", temperature},
      {"unit", "C"},
      {"sample_id", sample_id_}
    };
    ++sample_id_;
    if (!c.emit_now("TRANSMIT", destination_, payload)) return;
    c.schedule(c.now() + period_us_, "SAMPLE");
  });

  if (!core.schedule(first, "SAMPLE")) { err = core.fault(); return false; }
  return true;
}

// -------- gateway --------

bool GatewayModel::install(NodeCore& core, const nlohmann::json& config, std::string& err) {
  latency_us_   = 100;
  aggregate_us_ = 5000000;
  received_     = 0;
  count_        = 0;
  sum_ = min_ = max_ = 0.0;

  if (!config.is_object()) { err = "config_not_object"; return false; }

  if (!read_time(config, "processing_latency_us", latency_us_, err)) return false;
  if (!read_time(config, "aggregate_period_us", aggregate_us_, err)) return false;
  if (aggregate_us_ == 0) { err = "bad_config key=aggregate_period_us"; return false; }

  core.on("TRANSMIT",  [this](NodeCore& c, const Event& ev) { on_transmit(c, ev); });
  core.on("PROCESS",   [this](NodeCore& c, const Event& ev) { on_process(c, ev); });
  core.on("AGGREGATE", [this](NodeCore& c, const Event&)    { on_aggregate(c); });

  if (!core.schedule(aggregate_us_, "AGGREGATE")) { err = core.fault(); return false; }
  return true;
}

void GatewayModel::on_transmit(NodeCore& core, const Event& ev) {
  ++received_;
  // processing starts `latency_us_` after the transmit, but never before now
  TimeUs at = ev.time_us + latency_us_;
  if (at < core.now()) at = core.now();

  nlohmann::json payload = ev.payload;
  payload["from"] = ev.source;
  core.schedule(at, "PROCESS", payload);
}

void GatewayModel::on_process(NodeCore&, const Event& ev) {
  const auto it = ev.payload.find("temperature");
  if (it == ev.payload.end() || !it->is_number()) return;   // nothing to aggregate

  const double t = it->get<double>();
  if (count_ == 0) { min_ = max_ = t; }
  else {
    if (t < min_) min_ = t;
    if (t > max_) max_ = t;
  }
  sum_ += t;
  ++count_;
}

void GatewayModel::on_aggregate(NodeCore& core) {
  if (count_ > 0) {
    nlohmann::json payload = {
      {"count", count_},
      {"avg", sum_ / static_cast<double>(count_)},
      {"min", min_},
      {"max", max_}
    };
    if (!core.emit_now("AGGREGATE", std::nullopt, payload)) return;
  }
  core.schedule(core.now() + aggregate_us_, "AGGREGATE");
}

// -------- factory --------

std::unique_ptr<NodeModel> make_model(const std::string& name) {
  if (name == "sensor")  return std::make_unique<SensorModel>();
  if (name == "gateway") return std::make_unique<GatewayModel>();
  return nullptr;
}

} // namespace fedsim
