#pragma once
/**
 * @file log.hpp
 * @brief Process-wide key=value logger for the coordinator, node servers and tools.
 *
 * Every record is one line on the sink:
 *
 *     level=warn comp=coordinator node=sensor2 cycle=17 kind=timeout detail="no DONE"
 *
 * The leading `level=` and `comp=` pairs are added by the logger; the rest is the
 * caller's printf-style message, which should itself be key=value pairs so the
 * output stays grep- and awk-friendly.
 *
 * The sink is a plain FILE* (stderr by default). Writes are serialized, so worker
 * threads of one coordinator cycle may log concurrently.
 */

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace fedsim {

enum class LogLevel : uint8_t {
  Error = 0,
  Warn  = 1,
  Info  = 2,
  Debug = 3,
  Trace = 4,
  Off   = 255
};

const char* log_level_name(LogLevel lvl);

/// Parse "error|warn|info|debug|trace|off" (case-sensitive). Returns false on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);

class Logger {
public:
  static Logger& instance();

  void set_level(LogLevel lvl);
  LogLevel level() const;

  /// Redirect output. Passing nullptr silences the logger without changing the level.
  void set_sink(FILE* f);

  bool enabled(LogLevel lvl) const;

  void logf(LogLevel lvl, const char* comp, const char* fmt, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 4, 5)))
#endif
      ;

  void vlogf(LogLevel lvl, const char* comp, const char* fmt, va_list args);

private:
  Logger() = default;

  mutable std::mutex mu_;
  LogLevel level_ = LogLevel::Info;
  FILE*    sink_  = stderr;
};

} // namespace fedsim

#define FEDSIM_LOG(lvl, comp, ...)                                          \
  do {                                                                      \
    if (::fedsim::Logger::instance().enabled(lvl))                          \
      ::fedsim::Logger::instance().logf((lvl), (comp), __VA_ARGS__);        \
  } while (0)

#define FEDSIM_ERROR(comp, ...) FEDSIM_LOG(::fedsim::LogLevel::Error, comp, __VA_ARGS__)
#define FEDSIM_WARN(comp, ...)  FEDSIM_LOG(::fedsim::LogLevel::Warn,  comp, __VA_ARGS__)
#define FEDSIM_INFO(comp, ...)  FEDSIM_LOG(::fedsim::LogLevel::Info,  comp, __VA_ARGS__)
#define FEDSIM_DEBUG(comp, ...) FEDSIM_LOG(::fedsim::LogLevel::Debug, comp, __VA_ARGS__)
#define FEDSIM_TRACE(comp, ...) FEDSIM_LOG(::fedsim::LogLevel::Trace, comp, __VA_ARGS__)
