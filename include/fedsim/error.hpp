#pragma once
/**
 * @file error.hpp
 * @brief Failure taxonomy shared by the node handle, coordinator and harness.
 *
 * Every per-node failure is classified into one of these kinds. The names are
 * stable: they appear in log records and in the run summary.
 */

#include <cstdint>

namespace fedsim {

enum class ErrorKind : uint8_t {
  None       = 0,
  Protocol   = 1,  ///< Malformed line, or a message that is wrong for the current state.
  Timeout    = 2,  ///< No response before the per-operation deadline.
  Scheduling = 3,  ///< Event scheduled or emitted in the producer's past.
  Transport  = 4   ///< Connection refused, reset, or closed underneath us.
};

inline const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:       return "none";
    case ErrorKind::Protocol:   return "protocol";
    case ErrorKind::Timeout:    return "timeout";
    case ErrorKind::Scheduling: return "scheduling";
    case ErrorKind::Transport:  return "transport";
  }
  return "unknown";
}

} // namespace fedsim
