// File: include/gk/core/ledger/resource_ledger.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "gk/core/config.hpp"
#include "gk/core/types.hpp"

namespace gk {

struct UsageEntry {
  EntityId entity;
  ResourceKind kind = ResourceKind::kMemory;
  double used = 0.0;
  double budget = 0.0;
  std::size_t live_allocations = 0;
};

// Rounding slack allowed when comparing summed amounts against `budget`.
// Amounts like 0.1 are not exact in binary, so three of them overshoot 0.3.
inline double budget_slack(double budget) { return 1e-9 * std::max(1.0, budget); }

// Per-entity, per-kind allocation accounting, sharded by (entity, kind).
//
// The slot table is built once from the configured entities and never changes
// shape afterwards, so slot lookup needs no lock. Each slot has its own mutex;
// the budget check and the increment happen under that one lock. Entities not
// present in the config have no slots and therefore a budget of zero.
class ResourceLedger {
 public:
  struct Slot {
    mutable std::mutex mu;
    double budget = 0.0;
    double used = 0.0;
    std::map<AllocationId, ResourceAllocation> live;
  };

  explicit ResourceLedger(const std::vector<EntityConfig>& entities);
  ResourceLedger(const ResourceLedger&) = delete;
  ResourceLedger& operator=(const ResourceLedger&) = delete;

  // nullptr when the entity is unknown.
  [[nodiscard]] Slot* slot(const EntityId& entity, ResourceKind kind) const;

  [[nodiscard]] double budget(const EntityId& entity, ResourceKind kind) const;
  [[nodiscard]] double usage(const EntityId& entity, ResourceKind kind) const;

  // Caller holds slot->mu and has checked headroom.
  ResourceAllocation commit_locked(Slot& slot, const EntityId& entity, ResourceKind kind,
                                   double amount, TimestampNs now);

  // Removes a live allocation. nullopt if the reference is unknown or was
  // already released.
  std::optional<ResourceAllocation> release(const AllocationRef& ref);

  // Releases every live allocation of `entity`; returns them.
  std::vector<ResourceAllocation> release_all(const EntityId& entity);

  // Every configured (entity, kind) pair, in entity then kind order.
  [[nodiscard]] std::vector<UsageEntry> usage_snapshot() const;

  [[nodiscard]] std::size_t live_count() const;

 private:
  using Key = std::pair<EntityId, ResourceKind>;

  std::map<Key, std::unique_ptr<Slot>> slots_;
  std::atomic<AllocationId> next_id_{1};
};

}  // namespace gk
