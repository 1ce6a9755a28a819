#pragma once
/**
 * @file summary.hpp
 * @brief End-of-run report: overall outcome plus one record per node.
 *
 * Printed as key=value lines (one `run` line, one `network` line, one `node` line per
 * node) and optionally saved as JSON.
 */

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/error.hpp"
#include "fedsim/event.hpp"
#include "fedsim/network_model.hpp"
#include "fedsim/node_handle.hpp"

namespace fedsim {

struct NodeReport {
  std::string node_id;
  NodeState   state{NodeState::Connecting};
  TimeUs      time_us{0};          ///< Last virtual time the node reached
  ErrorKind   error{ErrorKind::None};
  uint64_t    failed_cycle{0};     ///< Meaningful only when state == Failed
  std::string detail;
  uint64_t    emitted{0};
  uint64_t    delivered{0};
  std::string digest;              ///< Stream digest (hex)
  bool        deterministic{true};
};

struct RunSummary {
  bool     completed{false};       ///< Clock reached the configured duration
  bool     all_failed{false};
  uint64_t cycles{0};
  TimeUs   final_time_us{0};
  TimeUs   duration_us{0};
  double   wall_seconds{0.0};
  uint64_t sink_records{0};
  std::string          network_model;
  net::NetworkMetrics  network;
  std::vector<NodeReport> nodes;

  /// Virtual seconds per wall second (0 when no wall time elapsed).
  double speedup() const;

  uint64_t failed_count() const;

  /// 0 completed (partial failures allowed), 1 every node failed.
  int exit_code() const { return all_failed ? 1 : 0; }
};

NodeReport make_node_report(const NodeHandle& h);

void print_summary(std::ostream& os, const RunSummary& s);

nlohmann::json summary_to_json(const RunSummary& s);

/// Write summary_to_json() to `path`. Returns false with `err` set on failure.
bool save_summary(const std::string& path, const RunSummary& s, std::string& err);

} // namespace fedsim
