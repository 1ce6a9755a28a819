// -----------------------------------------------------------------------------
// summary.cpp: run summary rendering
// -----------------------------------------------------------------------------
#include "fedsim/summary.hpp"

#include <fstream>
#include <iomanip>

namespace fedsim {

double RunSummary::speedup() const {
  if (wall_seconds <= 0.0) return 0.0;
  return (static_cast<double>(final_time_us) / 1e6) / wall_seconds;
}

uint64_t RunSummary::failed_count() const {
  uint64_t n = 0;
  for (const auto& r : nodes) if (r.state == NodeState::Failed) ++n;
  return n;
}

NodeReport make_node_report(const NodeHandle& h) {
  NodeReport r;
  r.node_id       = h.node_id();
  r.state         = h.state();
  r.time_us       = h.current_time_us();
  r.error         = h.failure().kind;
  r.failed_cycle  = h.failure().cycle;
  r.detail        = h.failure().detail;
  r.emitted       = h.events_emitted();
  r.delivered     = h.events_delivered();
  r.digest        = h.digest().hex();
  r.deterministic = h.deterministic();
  return r;
}

// print_summary(): key=value lines, grep/awk friendly.
void print_summary(std::ostream& os, const RunSummary& s) {
  const auto flags = os.flags();
  os << std::fixed << std::setprecision(3);

  os << "run status=" << (s.all_failed ? "failed" : (s.completed ? "completed" : "incomplete"))
     << " cycles=" << s.cycles
     << " final_time_us=" << s.final_time_us
     << " duration_us=" << s.duration_us
     << " wall_s=" << s.wall_seconds
     << " speedup=" << s.speedup()
     << " nodes=" << s.nodes.size()
     << " failed=" << s.failed_count()
     << " sink_records=" << s.sink_records << "\n";

  os << "network model=" << s.network_model
     << " sent=" << s.network.sent
     << " delivered=" << s.network.delivered
     << " dropped=" << s.network.dropped
     << " min_latency_us=" << s.network.min_latency_us
     << " max_latency_us=" << s.network.max_latency_us
     << " avg_latency_us=" << s.network.avg_latency_us() << "\n";

  for (const auto& n : s.nodes) {
    os << "node id=" << n.node_id
       << " state=" << node_state_name(n.state)
       << " time_us=" << n.time_us
       << " emitted=" << n.emitted
       << " delivered=" << n.delivered
       << " digest=" << n.digest
       << " reproducibility=" << (n.deterministic ? "exact" : "statistical");
    if (n.state == NodeState::Failed) {
      os << " error=" << error_kind_name(n.error)
         << " failed_cycle=" << n.failed_cycle
         << " detail=\"" << n.detail << "\"";
    }
    os << "\n";
  }

  os.flags(flags);
}

nlohmann::json summary_to_json(const RunSummary& s) {
  nlohmann::json j;
  j["completed"]     = s.completed;
  j["all_failed"]    = s.all_failed;
  j["cycles"]        = s.cycles;
  j["final_time_us"] = s.final_time_us;
  j["duration_us"]   = s.duration_us;
  j["wall_seconds"]  = s.wall_seconds;
  j["speedup"]       = s.speedup();
  j["sink_records"]  = s.sink_records;
  j["network"]       = s.network.to_json();
  j["network"]["model"] = s.network_model;

  nlohmann::json nodes = nlohmann::json::array();
  for (const auto& n : s.nodes) {
    nlohmann::json r;
    r["id"]              = n.node_id;
    r["state"]           = node_state_name(n.state);
    r["time_us"]         = n.time_us;
    r["emitted"]         = n.emitted;
    r["delivered"]       = n.delivered;
    r["digest"]          = n.digest;
    r["reproducibility"] = n.deterministic ? "exact" : "statistical";
    if (n.state == NodeState::Failed) {
      r["error"]        = error_kind_name(n.error);
      r["failed_cycle"] = n.failed_cycle;
      r["detail"]       = n.detail;
    }
    nodes.push_back(std::move(r));
  }
  j["nodes"] = std::move(nodes);
  return j;
}

bool save_summary(const std::string& path, const RunSummary& s, std::string& err) {
  std::ofstream ofs(path);
  if (!ofs) { err = "open " + path + " failed"; return false; }
  ofs << summary_to_json(s).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  if (!ofs) { err = "write " + path + " failed"; return false; }
  return true;
}

} // namespace fedsim
