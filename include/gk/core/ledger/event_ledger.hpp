// File: include/gk/core/ledger/event_ledger.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "gk/core/types.hpp"

namespace gk {

// Append-only causal DAG store.
//
// Nodes live in an arena addressed by insertion index; `index_` maps ids to
// arena slots and doubles as the "parent exists" lookup. Parent edges are kept
// both as ids (for callers) and as arena slots (for traversal).
//
// Locking: readers take a shared lock. The admission commit takes the write
// lock, re-checks, then calls insert_locked() inside the same critical section
// so that "parents exist" and "insert self" are one atomic step.
class EventLedger {
 public:
  using ReadLock = std::shared_lock<std::shared_mutex>;
  using WriteLock = std::unique_lock<std::shared_mutex>;

  EventLedger() = default;
  EventLedger(const EventLedger&) = delete;
  EventLedger& operator=(const EventLedger&) = delete;

  [[nodiscard]] ReadLock read_lock() const { return ReadLock(mu_); }
  [[nodiscard]] WriteLock write_lock() { return WriteLock(mu_); }

  // Locked convenience reads.
  [[nodiscard]] bool contains(const EventId& id) const;
  [[nodiscard]] std::optional<EventNode> find(const EventId& id) const;
  [[nodiscard]] std::size_t size() const;

  // All ancestors of `id` (transitive parents), nearest first. Empty if unknown.
  [[nodiscard]] std::vector<EventId> ancestors(const EventId& id) const;

  // Caller must hold read_lock() or write_lock().
  [[nodiscard]] const EventNode* find_locked(const EventId& id) const;
  [[nodiscard]] std::size_t size_locked() const noexcept { return nodes_.size(); }

  // Caller must hold write_lock() and must have checked that `node.id` is new
  // and every parent resolves. Returns the assigned sequence number.
  std::uint64_t insert_locked(EventNode node);

 private:
  struct Slot {
    EventNode node;
    std::vector<std::size_t> parent_slots;
  };

  mutable std::shared_mutex mu_;
  std::vector<Slot> nodes_;
  std::unordered_map<EventId, std::size_t> index_;
};

}  // namespace gk
