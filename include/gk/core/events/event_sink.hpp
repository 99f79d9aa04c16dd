// File: include/gk/core/events/event_sink.hpp
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "gk/core/status.hpp"
#include "gk/core/types.hpp"

namespace gk {

// Records handed to the observability sink.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string engine_id;
  std::string instance_id;
  std::string config_path;
  std::string out_dir;
  std::string config_hash;

  std::size_t keep_last_runs = 50;

  TimestampNs start_time_ns;       // logical, always 0
  TimestampNs wall_start_time_ns;  // epoch
};

struct Event {
  std::string type;  // e.g. "admitted", "rejected", "capability_granted"
  TimestampNs t_ns;       // since engine start
  TimestampNs t_wall_ns;  // epoch

  EntityId entity;      // optional
  std::string subject;  // event id, allocation, capability... (optional)
  std::string message;  // optional human-readable hint

  // Extra flat key/value pairs, written as JSON strings in order.
  std::vector<std::pair<std::string, std::string>> fields;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace gk
