// -----------------------------------------------------------------------------
// log.cpp: implementation for log.hpp
// -----------------------------------------------------------------------------
#include "fedsim/log.hpp"

namespace fedsim {

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
    case LogLevel::Trace: return "trace";
    case LogLevel::Off:   return "off";
  }
  return "unknown";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
  if      (name == "error") out = LogLevel::Error;
  else if (name == "warn")  out = LogLevel::Warn;
  else if (name == "info")  out = LogLevel::Info;
  else if (name == "debug") out = LogLevel::Debug;
  else if (name == "trace") out = LogLevel::Trace;
  else if (name == "off")   out = LogLevel::Off;
  else return false;
  return true;
}

Logger& Logger::instance() {
  static Logger g;
  return g;
}

void Logger::set_level(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mu_);
  level_ = lvl;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mu_);
  return level_;
}

void Logger::set_sink(FILE* f) {
  std::lock_guard<std::mutex> lk(mu_);
  sink_ = f;
}

bool Logger::enabled(LogLevel lvl) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (level_ == LogLevel::Off || lvl == LogLevel::Off) return false;
  return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level_);
}

void Logger::logf(LogLevel lvl, const char* comp, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlogf(lvl, comp, fmt, args);
  va_end(args);
}

void Logger::vlogf(LogLevel lvl, const char* comp, const char* fmt, va_list args) {
  if (!enabled(lvl)) return;

  char buf[1024];
  std::vsnprintf(buf, sizeof(buf), fmt, args);   // long records are truncated, never split

  std::lock_guard<std::mutex> lk(mu_);
  if (!sink_) return;
  std::fprintf(sink_, "level=%s comp=%s %s\n", log_level_name(lvl), comp ? comp : "-", buf);
  std::fflush(sink_);
}

} // namespace fedsim
