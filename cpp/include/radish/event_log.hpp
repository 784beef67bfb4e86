#pragma once

#include <cstdint>
#include <string>

namespace radish {

struct DecodeEvent {
  std::string name;    // "scan", "read", "read_sweep"
  std::string path;
  std::string status;  // "ok" or "error"
  int32_t sweep = -1;
  std::string variable;
  std::string message;
  double start = 0.0;
  double end = 0.0;
};

// JSON-lines event log written by a background thread. Enabled by the
// RADISH_EVENT_LOG environment variable (read on first use) or by
// set_event_log_path; an empty path disables it.
void set_event_log_path(const std::string& path);
bool has_event_log();
void log_decode_event(const DecodeEvent& event);
// Blocks until every queued event has been written.
void flush_event_log();

double now_seconds();

// "Component: message" on stderr.
void log_warning(const std::string& component, const std::string& message);
// Same as log_warning, printed only when RADISH_VERBOSE is set and not "0".
void log_verbose(const std::string& component, const std::string& message);

}  // namespace radish
