// -----------------------------------------------------------------------------
// metrics_sink.cpp: JSON Lines sink for undelivered events
// -----------------------------------------------------------------------------
#include "fedsim/metrics_sink.hpp"

#include <cerrno>
#include <cstring>

#include <nlohmann/json.hpp>

#include "fedsim/codec.hpp"
#include "fedsim/log.hpp"

namespace fedsim {

JsonLinesSink::~JsonLinesSink() {
  if (f_) std::fclose(f_);
}

bool JsonLinesSink::open(const std::string& path, std::string& err) {
  if (f_) { std::fclose(f_); f_ = nullptr; }
  f_ = std::fopen(path.c_str(), "w");
  if (!f_) {
    err = "open " + path + ": " + std::strerror(errno);
    return false;
  }
  path_ = path;
  return true;
}

void JsonLinesSink::record(uint64_t cycle, const Event& ev, const char* reason) {
  ++records_;
  if (!f_) return;

  nlohmann::json rec;
  rec["cycle"]  = cycle;
  rec["event"]  = codec::event_to_json(ev);
  rec["reason"] = reason;

  const std::string line = rec.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
  if (std::fwrite(line.data(), 1, line.size(), f_) != line.size()) {
    if (write_errors_++ == 0)
      FEDSIM_ERROR("metrics", "status=error reason=write_failed path=%s", path_.c_str());
  }
}

void JsonLinesSink::flush() {
  if (f_) std::fflush(f_);
}

} // namespace fedsim
