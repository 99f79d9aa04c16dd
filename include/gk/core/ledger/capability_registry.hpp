// File: include/gk/core/ledger/capability_registry.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "gk/core/config.hpp"
#include "gk/core/types.hpp"

namespace gk {

// Per-entity granted capability sets. Read-mostly.
//
// Two lock levels: `mu_` guards the entity table (entries are only ever added,
// never removed, so entry pointers stay valid), and each entry has its own
// shared_mutex guarding its set. Lookups take shared locks only; grant/revoke
// take the one entry's exclusive lock.
class CapabilityRegistry {
 public:
  // A consistent read of one entity's set, held for as long as the view lives.
  class View {
   public:
    View() = default;

    [[nodiscard]] bool contains(const CapabilityName& capability) const;
    [[nodiscard]] bool known_entity() const noexcept { return caps_ != nullptr; }

   private:
    friend class CapabilityRegistry;

    std::shared_lock<std::shared_mutex> lock_;
    const std::unordered_set<CapabilityName>* caps_ = nullptr;
  };

  CapabilityRegistry() = default;
  explicit CapabilityRegistry(const std::vector<EntityConfig>& entities);
  CapabilityRegistry(const CapabilityRegistry&) = delete;
  CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

  [[nodiscard]] View view(const EntityId& entity) const;
  [[nodiscard]] bool has(const EntityId& entity, const CapabilityName& capability) const;

  // Idempotent. Return true when the set changed.
  bool grant(const EntityId& entity, const CapabilityName& capability);
  bool revoke(const EntityId& entity, const CapabilityName& capability);

  // Drops every capability of `entity`; returns how many were held.
  std::size_t revoke_all(const EntityId& entity);

  [[nodiscard]] std::vector<CapabilityName> capabilities(const EntityId& entity) const;
  [[nodiscard]] std::size_t grant_count() const;

 private:
  struct Entry {
    mutable std::shared_mutex mu;
    std::unordered_set<CapabilityName> caps;
  };

  Entry* find_entry_(const EntityId& entity) const;
  Entry& get_or_create_entry_(const EntityId& entity);

  mutable std::shared_mutex mu_;
  std::unordered_map<EntityId, std::unique_ptr<Entry>> entries_;
};

}  // namespace gk
