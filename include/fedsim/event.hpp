/**
 * @file event.hpp
 * @brief fedsim Event: the immutable record that flows between nodes and the coordinator.
 *
 * An Event says "something of kind `event_type` happened at virtual time `time_us`
 * on node `source`", optionally addressed to another node. The coordinator only
 * looks at the routing fields (`time_us`, `source`, `destination`); `payload` is
 * carried through untouched.
 *
 * ### Wire shape
 *     {"event_type": "...", "time_us": 123, "source": "...",
 *      "destination": "..." | null, "payload": {...}}
 *
 * Encoding and decoding live in codec.hpp; this header is just the value type.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fedsim {

/// Virtual time in microseconds. Never negative.
using TimeUs = std::uint64_t;

struct Event {
  std::string event_type;                  ///< Domain tag; opaque to the coordinator beyond routing.
  TimeUs      time_us{0};                  ///< Virtual timestamp (us).
  std::string source;                      ///< Node that produced the event.
  std::optional<std::string> destination;  ///< Target node; empty means metric/log only.
  nlohmann::json payload = nlohmann::json::object();  ///< Passed through unmodified.

  /// True if the event is addressed to a node (not a metric/log record).
  bool directed() const { return destination.has_value() && !destination->empty(); }

  bool operator==(const Event& o) const {
    return event_type == o.event_type && time_us == o.time_us && source == o.source &&
           destination == o.destination && payload == o.payload;
  }
  bool operator!=(const Event& o) const { return !(*this == o); }
};

} // namespace fedsim
