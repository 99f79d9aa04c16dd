// File: include/gk/core/model/engine.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "gk/core/admission/admission_pipeline.hpp"
#include "gk/core/config.hpp"
#include "gk/core/events/event_sink.hpp"
#include "gk/core/ledger/capability_registry.hpp"
#include "gk/core/ledger/event_ledger.hpp"
#include "gk/core/ledger/resource_ledger.hpp"
#include "gk/core/operation.hpp"
#include "gk/core/status.hpp"
#include "gk/core/types.hpp"

namespace gk {

struct EngineStatistics {
  std::size_t event_count = 0;
  std::vector<UsageEntry> resource_usage;
  std::size_t live_allocations = 0;
  std::size_t capability_grants = 0;
  AdmissionCounters admission;
};

struct EngineState {
  std::string engine_id;
  std::string instance_id;
  std::string config_hash;
  bool running = false;
  std::chrono::nanoseconds uptime{0};
  EngineStatistics stats;
};

// Engine owns the ledgers, the pipeline and the run lifecycle.
//
// Lifecycle: create() -> start() -> {admit, grant, revoke, release, ...} -> stop().
// Calls take a shared lifecycle lock; stop() takes it exclusively, so it waits
// for in-flight calls to finish before tearing down.
//
// Time contract for sink records:
//  - t_ns      = relative since start() (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns
class Engine {
 public:
  // Validates `cfg` (kSchemaInvalid on failure; no engine is built).
  static Result<std::unique_ptr<Engine>> create(Config cfg, std::string config_path = {});

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  ~Engine();

  // `sink` is optional and must outlive the engine run.
  Status start(EventSink* sink = nullptr);
  void stop();

  [[nodiscard]] bool running() const;

  AdmitResult admit(const PhysicsOperation& op);

  // Administrative mutations.
  Status grant(const EntityId& entity, const CapabilityName& capability);
  Status revoke(const EntityId& entity, const CapabilityName& capability);
  Result<ResourceAllocation, ValidationFailure> release(const AllocationRef& ref);
  Result<std::size_t> teardown_entity(const EntityId& entity);

  // Read-only introspection.
  [[nodiscard]] EngineStatistics statistics() const;
  [[nodiscard]] EngineState engine_state() const;

  const Config& config() const noexcept { return cfg_; }
  const std::string& instance_id() const noexcept { return instance_id_; }
  const std::string& config_hash() const noexcept { return config_hash_; }

  const EventLedger& events() const noexcept { return events_; }
  const ResourceLedger& resources() const noexcept { return resources_; }
  const CapabilityRegistry& capabilities() const noexcept { return capabilities_; }

 private:
  Engine(Config cfg, std::string config_path);

  static std::string make_instance_id();
  TimestampNs since_start_ns() const;

  // Sink failures are logged, never propagated into admission decisions.
  void emit_(Event e);
  void emit_statistics_(const EngineStatistics& s);

  Config cfg_;
  std::string config_path_;
  std::string instance_id_;
  std::string config_hash_;

  EventLedger events_;
  ResourceLedger resources_;
  CapabilityRegistry capabilities_;
  AdmissionPipeline pipeline_;

  mutable std::shared_mutex lifecycle_mu_;
  bool running_{false};
  std::chrono::steady_clock::time_point t0_steady_{};

  std::mutex sink_mu_;
  EventSink* sink_{nullptr};
};

}  // namespace gk
