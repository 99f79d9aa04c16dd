// include/gk/core/config.hpp
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "gk/core/types.hpp"

namespace gk {

// -----------------------------
// Entities (budgets + initial grants)
// -----------------------------
struct EntityConfig {
  EntityId id;

  // Per-kind ceiling. A kind missing here has a budget of zero.
  std::map<ResourceKind, double> budgets;

  // Granted at startup; later changes go through grant/revoke.
  std::vector<CapabilityName> capabilities;
};

// -----------------------------
// Operation limits
// -----------------------------
struct LimitsConfig {
  // Upper bound for an operation's declared execution time limit.
  DurationNs max_time_limit_ns = seconds_to_ns(300.0);
};

// -----------------------------
// Output (events sink)
// -----------------------------
struct OutputConfig {
  // Where to write event JSONL.
  std::string out_dir = "out";

  // Per-run event files kept in out_dir at start (older ones are pruned).
  std::size_t keep_last_runs = 50;
};

struct LoggingConfig {
  std::string level = "info";  // trace | debug | info | warn | error | off
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  std::string engine_id = "engine";

  // Strict mode rejects timestamp ties with parents whose content differs.
  bool strict_ordering = false;

  LimitsConfig limits;
  std::vector<EntityConfig> entities;

  // Operation kind keyword -> capability it requires when none is explicit.
  std::map<std::string, CapabilityName> capability_gates;

  OutputConfig output;
  LoggingConfig logging;
};

}  // namespace gk
