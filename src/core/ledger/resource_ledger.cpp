// File: src/core/ledger/resource_ledger.cpp
#include "gk/core/ledger/resource_ledger.hpp"

namespace gk {

ResourceLedger::ResourceLedger(const std::vector<EntityConfig>& entities) {
  for (const auto& e : entities) {
    for (const ResourceKind k : kAllResourceKinds) {
      auto s = std::make_unique<Slot>();
      const auto it = e.budgets.find(k);
      s->budget = it != e.budgets.end() ? it->second : 0.0;
      slots_.emplace(Key{e.id, k}, std::move(s));
    }
  }
}

ResourceLedger::Slot* ResourceLedger::slot(const EntityId& entity, ResourceKind kind) const {
  const auto it = slots_.find(Key{entity, kind});
  return it == slots_.end() ? nullptr : it->second.get();
}

double ResourceLedger::budget(const EntityId& entity, ResourceKind kind) const {
  const Slot* s = slot(entity, kind);
  return s ? s->budget : 0.0;  // budget is immutable
}

double ResourceLedger::usage(const EntityId& entity, ResourceKind kind) const {
  const Slot* s = slot(entity, kind);
  if (!s) return 0.0;
  const std::lock_guard<std::mutex> lk(s->mu);
  return s->used;
}

ResourceAllocation ResourceLedger::commit_locked(Slot& slot, const EntityId& entity,
                                                 ResourceKind kind, double amount,
                                                 TimestampNs now) {
  ResourceAllocation a;
  a.ref = AllocationRef{entity, kind, next_id_.fetch_add(1, std::memory_order_relaxed)};
  a.amount = amount;
  a.allocated_at = now;

  slot.used += amount;
  slot.live.emplace(a.ref.id, a);
  return a;
}

std::optional<ResourceAllocation> ResourceLedger::release(const AllocationRef& ref) {
  Slot* s = slot(ref.entity, ref.kind);
  if (!s) return std::nullopt;

  const std::lock_guard<std::mutex> lk(s->mu);
  const auto it = s->live.find(ref.id);
  if (it == s->live.end()) return std::nullopt;

  ResourceAllocation a = it->second;
  s->live.erase(it);
  s->used -= a.amount;
  // Float drift must not leave dust or a negative remainder.
  if (s->live.empty() || s->used < budget_slack(s->budget)) s->used = 0.0;
  return a;
}

std::vector<ResourceAllocation> ResourceLedger::release_all(const EntityId& entity) {
  std::vector<ResourceAllocation> out;
  for (const ResourceKind k : kAllResourceKinds) {
    Slot* s = slot(entity, k);
    if (!s) continue;
    const std::lock_guard<std::mutex> lk(s->mu);
    for (auto& [id, a] : s->live) out.push_back(a);
    s->live.clear();
    s->used = 0.0;
  }
  return out;
}

std::vector<UsageEntry> ResourceLedger::usage_snapshot() const {
  std::vector<UsageEntry> out;
  out.reserve(slots_.size());
  for (const auto& [key, s] : slots_) {
    UsageEntry u;
    u.entity = key.first;
    u.kind = key.second;
    u.budget = s->budget;
    {
      const std::lock_guard<std::mutex> lk(s->mu);
      u.used = s->used;
      u.live_allocations = s->live.size();
    }
    out.push_back(std::move(u));
  }
  return out;
}

std::size_t ResourceLedger::live_count() const {
  std::size_t n = 0;
  for (const auto& [key, s] : slots_) {
    const std::lock_guard<std::mutex> lk(s->mu);
    n += s->live.size();
  }
  return n;
}

}  // namespace gk
