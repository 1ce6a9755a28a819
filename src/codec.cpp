/**
 * @file codec.cpp
 * @brief Conversion between protocol lines and fedsim values.
 *
 * @details
 *   nlohmann::json does the JSON work. Its exceptions (parse_error, type_error,
 *   out_of_range) are caught here and turned into `false` + reason, so callers only
 *   ever deal with the bool/err convention.
 *
 *   Reasons are short snake_case tokens, optionally followed by detail, because they
 *   end up verbatim in `detail=` fields of log records and summaries.
 */

#include "fedsim/codec.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

using nlohmann::json;

namespace fedsim {
namespace codec {

// -------- helpers --------

static bool is_uint_json(const json& v) {
  if (v.is_number_unsigned()) return true;
  return v.is_number_integer() && v.get<int64_t>() >= 0;
}

// parse_uint(): decimal digits only, no sign, no spaces, no overflow.
static bool parse_uint(const std::string& s, TimeUs& out) {
  if (s.empty() || s.size() > 20) return false;
  TimeUs v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    const TimeUs d = static_cast<TimeUs>(c - '0');
    if (v > (std::numeric_limits<TimeUs>::max() - d) / 10) return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

bool valid_node_id(const std::string& id) {
  if (id.empty()) return false;
  for (unsigned char c : id) {
    if (std::isspace(c) || std::iscntrl(c)) return false;
  }
  return true;
}

std::string printable(const std::string& bytes, std::size_t max_bytes) {
  static const char* HEX = "0123456789abcdef";
  std::string out;
  out.reserve(std::min(bytes.size(), max_bytes) + 8);
  for (std::size_t i = 0; i < bytes.size() && i < max_bytes; ++i) {
    const unsigned char c = static_cast<unsigned char>(bytes[i]);
    if (c >= 0x20 && c < 0x7f) { out += static_cast<char>(c); continue; }
    out += "\\x";
    out += HEX[c >> 4];
    out += HEX[c & 0x0f];
  }
  if (bytes.size() > max_bytes) out += "...";
  return out;
}

// -------- events --------

json event_to_json(const Event& ev) {
  json j;
  j["event_type"]  = ev.event_type;
  j["time_us"]     = ev.time_us;
  j["source"]      = ev.source;
  j["destination"] = ev.destination ? json(*ev.destination) : json(nullptr);
  j["payload"]     = ev.payload.is_null() ? json::object() : ev.payload;
  return j;
}

bool event_from_json(const json& j, Event& out, std::string& err) {
  if (!j.is_object()) { err = "event_not_object"; return false; }

  const auto t = j.find("event_type");
  if (t == j.end() || !t->is_string()) { err = "event_type_missing_or_not_string"; return false; }

  const auto tu = j.find("time_us");
  if (tu == j.end() || !is_uint_json(*tu)) { err = "time_us_not_non_negative_integer"; return false; }

  const auto s = j.find("source");
  if (s == j.end() || !s->is_string()) { err = "source_missing_or_not_string"; return false; }

  Event ev;
  ev.event_type = t->get<std::string>();
  ev.time_us    = tu->get<TimeUs>();
  ev.source     = s->get<std::string>();

  const auto d = j.find("destination");
  if (d != j.end() && !d->is_null()) {
    if (!d->is_string()) { err = "destination_not_string"; return false; }
    ev.destination = d->get<std::string>();
  }

  const auto p = j.find("payload");
  if (p != j.end() && !p->is_null()) {
    if (!p->is_object()) { err = "payload_not_object"; return false; }
    ev.payload = *p;
  }

  out = std::move(ev);
  return true;
}

std::string encode_event(const Event& ev) {
  return event_to_json(ev).dump();
}

std::string encode_events(const std::vector<Event>& events) {
  json arr = json::array();
  for (const auto& ev : events) arr.push_back(event_to_json(ev));
  return arr.dump();
}

bool decode_events(const std::string& line, std::vector<Event>& out, std::string& err) {
  out.clear();
  try {
    const json j = json::parse(line);
    if (!j.is_array()) { err = "expected_event_array"; return false; }

    out.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
      Event ev;
      std::string why;
      if (!event_from_json(j[i], ev, why)) {
        err = "bad_event index=" + std::to_string(i) + " " + why;
        out.clear();
        return false;
      }
      out.push_back(std::move(ev));
    }
    return true;
  } catch (const json::exception& e) {
    err = std::string("invalid_json ") + e.what();
    out.clear();
    return false;
  }
}

// -------- commands --------

std::string encode_init(const std::string& node_id, const json& config) {
  return std::string(KW_INIT) + " " + node_id + " " + config.dump();
}

std::string encode_advance(TimeUs target_us) {
  return std::string(KW_ADVANCE) + " " + std::to_string(target_us);
}

std::string encode_shutdown() {
  return KW_SHUTDOWN;
}

// -----------------------------------------------------------------------------
// parse_command(): one coordinator control line.
// POLICY:
//   - Keyword is everything up to the first space (or the whole line).
//   - Exactly one space between tokens; no trailing junk.
//   - INIT config must be a JSON object.
// -----------------------------------------------------------------------------
bool parse_command(const std::string& line, Command& out, std::string& err) {
  const std::size_t sp = line.find(' ');
  const std::string kw = line.substr(0, sp);

  if (kw == KW_SHUTDOWN) {
    if (sp != std::string::npos) { err = "shutdown_takes_no_arguments"; return false; }
    out = Command{};
    out.type = CommandType::Shutdown;
    return true;
  }

  if (kw == KW_ADVANCE) {
    if (sp == std::string::npos) { err = "advance_missing_target"; return false; }
    TimeUs target = 0;
    if (!parse_uint(line.substr(sp + 1), target)) { err = "advance_bad_target"; return false; }
    out = Command{};
    out.type      = CommandType::Advance;
    out.target_us = target;
    return true;
  }

  if (kw == KW_INIT) {
    if (sp == std::string::npos) { err = "init_missing_node_id"; return false; }
    const std::size_t sp2 = line.find(' ', sp + 1);
    if (sp2 == std::string::npos) { err = "init_missing_config"; return false; }

    const std::string id = line.substr(sp + 1, sp2 - sp - 1);
    if (!valid_node_id(id)) { err = "init_bad_node_id"; return false; }

    try {
      json cfg = json::parse(line.substr(sp2 + 1));
      if (!cfg.is_object()) { err = "init_config_not_object"; return false; }
      out = Command{};
      out.type    = CommandType::Init;
      out.node_id = id;
      out.config  = std::move(cfg);
      return true;
    } catch (const json::exception& e) {
      err = std::string("init_config_invalid_json ") + e.what();
      return false;
    }
  }

  err = "unknown_command";
  return false;
}

// -------- responses --------

bool parse_response(const std::string& line, ResponseType& out, std::string& err) {
  if (line == KW_READY) { out = ResponseType::Ready; return true; }
  if (line == KW_DONE)  { out = ResponseType::Done;  return true; }
  err = "unexpected_response";
  return false;
}

} // namespace codec
} // namespace fedsim
