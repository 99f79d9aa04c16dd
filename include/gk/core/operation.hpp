// include/gk/core/operation.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gk/core/types.hpp"

namespace gk {

struct EventDescriptor {
  EventId id;
  std::vector<EventId> parents;  // empty => root event
  TimestampNs timestamp;
};

struct ResourceRequest {
  ResourceKind kind = ResourceKind::kMemory;
  double amount = 0.0;  // zero is a no-op success
};

// The unit submitted for admission. Every part except `entity` is optional;
// a part that is absent skips the matching check.
struct PhysicsOperation {
  EntityId entity;

  // Classification keyword, matched against Config::capability_gates.
  std::string kind;

  std::optional<EventDescriptor> event;
  std::optional<ResourceRequest> resource;
  std::optional<CapabilityName> required_capability;

  // Execution time budget handed to the external executor.
  std::optional<DurationNs> time_limit_ns;

  // Opaque; authorized as-is once admitted.
  std::string payload;
};

struct AdmissionReceipt {
  std::uint64_t sequence = 0;
  EntityId entity;

  std::optional<EventId> event_id;
  std::optional<AllocationRef> allocation;  // absent for zero-amount requests
  std::optional<CapabilityName> capability;  // effective (explicit or gated)
  std::optional<DurationNs> time_limit_ns;

  TimestampNs admitted_at;  // wall epoch ns
  std::string payload;
};

}  // namespace gk
