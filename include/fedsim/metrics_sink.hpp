#pragma once
/**
 * @file metrics_sink.hpp
 * @brief Destination for events that are not delivered to a node.
 *
 * The coordinator hands the sink every undirected event, and every event whose
 * destination is unknown or no longer live. `JsonLinesSink` appends one record per
 * event:
 *
 *     {"cycle":3,"event":{"destination":null,"event_type":"AGGREGATE",...},"reason":"undirected"}
 */

#include <cstdint>
#include <cstdio>
#include <string>

#include "fedsim/event.hpp"

namespace fedsim {

class IMetricsSink {
public:
  virtual ~IMetricsSink() = default;

  /// `reason`: "undirected", "unknown_destination" or "destination_not_live".
  virtual void record(uint64_t cycle, const Event& ev, const char* reason) = 0;

  virtual void flush() {}

  virtual uint64_t records() const = 0;
};

/// Counts records and drops them. Used when no metrics file is configured.
class CountingSink : public IMetricsSink {
public:
  void record(uint64_t, const Event&, const char*) override { ++records_; }
  uint64_t records() const override { return records_; }

private:
  uint64_t records_{0};
};

class JsonLinesSink : public IMetricsSink {
public:
  JsonLinesSink() = default;
  ~JsonLinesSink() override;

  JsonLinesSink(const JsonLinesSink&) = delete;
  JsonLinesSink& operator=(const JsonLinesSink&) = delete;

  /// Open (truncate) `path`. Returns false with `err` set on failure.
  bool open(const std::string& path, std::string& err);

  void record(uint64_t cycle, const Event& ev, const char* reason) override;
  void flush() override;
  uint64_t records() const override { return records_; }

  /// Writes that failed (disk full, ...). Logged once, then counted.
  uint64_t write_errors() const { return write_errors_; }

private:
  FILE*       f_{nullptr};
  std::string path_;
  uint64_t    records_{0};
  uint64_t    write_errors_{0};
};

} // namespace fedsim
