// File: include/gk/core/events/jsonl_event_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "gk/core/events/event_sink.hpp"
#include "gk/core/status.hpp"

namespace gk {

// JSONL sink for events.
// Writes every event line to:
//   1) a unique per-run file: events_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: events_latest.jsonl (truncated each run)
// On open, per-run files beyond RunInfo::keep_last_runs are pruned (newest kept).
// Not thread-safe; the engine serializes calls.
class JsonlEventSink final : public EventSink {
 public:
  JsonlEventSink() = default;
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

  static std::string json_escape(const std::string& s);

 private:
  Status write_line_(const std::string& line);
  static void prune_out_dir_(const std::string& out_dir, std::size_t keep_last);

  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

}  // namespace gk
