#pragma once
/**
 * @file codec.hpp
 * @brief Protocol codec: control lines, response lines and event arrays.
 *
 * @details
 *   Wire grammar (one line each, '\n' added by the framer):
 *
 *     INIT <node_id> <config-json-object>
 *     ADVANCE <target_time_us>
 *     SHUTDOWN
 *     READY
 *     DONE
 *     [<event>, <event>, ...]
 *
 *   Event object: {"event_type": str, "time_us": uint, "source": str,
 *                  "destination": str|null, "payload": object}
 *
 *   ## Strictness
 *   - Keywords are matched exactly (case-sensitive, single spaces). Anything else is
 *     rejected with a reason string; nothing is silently skipped.
 *   - `[]` is the normal "no events" line.
 *   - Event leniency: missing `destination` reads as null, missing or null `payload`
 *     reads as `{}`, unknown keys are ignored. `time_us` must be a non-negative integer.
 *
 *   ## Canonical form
 *   Encoding goes through nlohmann::json, whose objects keep keys sorted, so a given
 *   Event always encodes to the same bytes. Stream digests rely on this.
 *
 *   All parse functions return false plus a reason in `err`; no exception escapes.
 */

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fedsim/event.hpp"

namespace fedsim {
namespace codec {

static constexpr const char* KW_INIT     = "INIT";
static constexpr const char* KW_ADVANCE  = "ADVANCE";
static constexpr const char* KW_SHUTDOWN = "SHUTDOWN";
static constexpr const char* KW_READY    = "READY";
static constexpr const char* KW_DONE     = "DONE";

// -------- events --------

nlohmann::json event_to_json(const Event& ev);
bool event_from_json(const nlohmann::json& j, Event& out, std::string& err);

/// Canonical single-line JSON for one event.
std::string encode_event(const Event& ev);

/// JSON array line (no terminator) for a list of events. Empty list -> "[]".
std::string encode_events(const std::vector<Event>& events);

/// Parse an event-array line. `out` is cleared first.
bool decode_events(const std::string& line, std::vector<Event>& out, std::string& err);

// -------- commands (coordinator -> node) --------

enum class CommandType : uint8_t { Init = 0, Advance = 1, Shutdown = 2 };

struct Command {
  CommandType    type{CommandType::Shutdown};
  std::string    node_id;                         ///< INIT only
  nlohmann::json config = nlohmann::json::object();  ///< INIT only
  TimeUs         target_us{0};                    ///< ADVANCE only
};

std::string encode_init(const std::string& node_id, const nlohmann::json& config);
std::string encode_advance(TimeUs target_us);
std::string encode_shutdown();

bool parse_command(const std::string& line, Command& out, std::string& err);

// -------- responses (node -> coordinator) --------

enum class ResponseType : uint8_t { Ready = 0, Done = 1 };

bool parse_response(const std::string& line, ResponseType& out, std::string& err);

/// Node ids travel as a single INIT token: non-empty, no whitespace or control bytes.
bool valid_node_id(const std::string& id);

// -------- diagnostics --------

/**
 * @brief Peer bytes made safe for logs, summaries and JSON.
 *
 * Printable ASCII passes through; every other byte becomes `\xNN`. At most
 * `max_bytes` input bytes are kept, the rest is replaced by `...`.
 */
std::string printable(const std::string& bytes, std::size_t max_bytes = 256);

} // namespace codec
} // namespace fedsim
