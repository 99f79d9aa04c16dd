// include/gk/core/types.hpp
#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gk {

// -----------------------------
// Basic identifiers
// -----------------------------

using EntityId = std::string;        // e.g. "analyst", "agent-7"
using EventId = std::string;         // caller-assigned, unique within a ledger
using CapabilityName = std::string;  // e.g. "CodeAnalysis"
using AllocationId = std::uint64_t;  // assigned by the resource ledger

// -----------------------------
// Time
// -----------------------------
// Integer nanoseconds. Event timestamps are caller-supplied logical clock
// readings; wall timestamps are epoch ns.

using DurationNs = std::int64_t;

// Largest whole number of seconds whose nanosecond count fits in DurationNs.
inline constexpr double kMaxDurationSeconds = 9'223'372'036.0;

// Saturates at the DurationNs range; NaN maps to zero. Inputs are
// range-checked where they are parsed, so saturation is a backstop.
constexpr DurationNs seconds_to_ns(double seconds) {
  const double ns = seconds * 1'000'000'000.0;
  if (ns != ns) return 0;
  // 2^63 is the first double past the int64 range.
  if (ns >= 9'223'372'036'854'775'808.0) return std::numeric_limits<DurationNs>::max();
  if (ns <= -9'223'372'036'854'775'808.0) return std::numeric_limits<DurationNs>::min();
  return static_cast<DurationNs>(ns);
}

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

// -----------------------------
// Resources
// -----------------------------

enum class ResourceKind : std::uint8_t {
  kMemory = 0,
  kCpu,
  kNetwork,
  kEnergy,
};

inline constexpr std::array<ResourceKind, 4> kAllResourceKinds = {
    ResourceKind::kMemory, ResourceKind::kCpu, ResourceKind::kNetwork, ResourceKind::kEnergy};

// Lowercase names, as they appear in config documents and scripts.
const char* resource_kind_name(ResourceKind kind) noexcept;
std::optional<ResourceKind> parse_resource_kind(std::string_view name);

[[nodiscard]] constexpr bool is_valid_resource_kind(ResourceKind kind) noexcept {
  return static_cast<std::uint8_t>(kind) < kAllResourceKinds.size();
}

struct Resource {
  ResourceKind kind = ResourceKind::kMemory;
  double quantity = 0.0;
};

// -----------------------------
// Causal events
// -----------------------------

// Stored record. Immutable once committed; parents precede children.
struct EventNode {
  EventId id;
  TimestampNs timestamp;
  std::vector<EventId> parents;

  // FNV-1a digest of the issuing operation's (entity, kind, payload).
  std::uint64_t content_hash = 0;

  // Position in the ledger arena (insertion order).
  std::uint64_t seq = 0;
};

// -----------------------------
// Allocations
// -----------------------------

struct AllocationRef {
  EntityId entity;
  ResourceKind kind = ResourceKind::kMemory;
  AllocationId id = 0;

  bool operator==(const AllocationRef& other) const noexcept {
    return id == other.id && kind == other.kind && entity == other.entity;
  }
};

struct ResourceAllocation {
  AllocationRef ref;
  double amount = 0.0;
  TimestampNs allocated_at;  // wall epoch ns
};

std::string to_string(const AllocationRef& ref);

}  // namespace gk
