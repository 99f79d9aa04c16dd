// File: src/core/ledger/capability_registry.cpp
#include "gk/core/ledger/capability_registry.hpp"

#include <algorithm>

namespace gk {

bool CapabilityRegistry::View::contains(const CapabilityName& capability) const {
  return caps_ != nullptr && caps_->count(capability) > 0;
}

CapabilityRegistry::CapabilityRegistry(const std::vector<EntityConfig>& entities) {
  for (const auto& e : entities) {
    Entry& entry = get_or_create_entry_(e.id);
    for (const auto& c : e.capabilities) entry.caps.insert(c);
  }
}

CapabilityRegistry::Entry* CapabilityRegistry::find_entry_(const EntityId& entity) const {
  const std::shared_lock<std::shared_mutex> lk(mu_);
  const auto it = entries_.find(entity);
  return it == entries_.end() ? nullptr : it->second.get();
}

CapabilityRegistry::Entry& CapabilityRegistry::get_or_create_entry_(const EntityId& entity) {
  if (Entry* e = find_entry_(entity)) return *e;

  const std::unique_lock<std::shared_mutex> lk(mu_);
  auto& slot = entries_[entity];
  if (!slot) slot = std::make_unique<Entry>();
  return *slot;
}

CapabilityRegistry::View CapabilityRegistry::view(const EntityId& entity) const {
  View v;
  Entry* e = find_entry_(entity);
  if (!e) return v;
  v.lock_ = std::shared_lock<std::shared_mutex>(e->mu);
  v.caps_ = &e->caps;
  return v;
}

bool CapabilityRegistry::has(const EntityId& entity, const CapabilityName& capability) const {
  return view(entity).contains(capability);
}

bool CapabilityRegistry::grant(const EntityId& entity, const CapabilityName& capability) {
  Entry& e = get_or_create_entry_(entity);
  const std::unique_lock<std::shared_mutex> lk(e.mu);
  return e.caps.insert(capability).second;
}

bool CapabilityRegistry::revoke(const EntityId& entity, const CapabilityName& capability) {
  Entry* e = find_entry_(entity);
  if (!e) return false;
  const std::unique_lock<std::shared_mutex> lk(e->mu);
  return e->caps.erase(capability) > 0;
}

std::size_t CapabilityRegistry::revoke_all(const EntityId& entity) {
  Entry* e = find_entry_(entity);
  if (!e) return 0;
  const std::unique_lock<std::shared_mutex> lk(e->mu);
  const std::size_t n = e->caps.size();
  e->caps.clear();
  return n;
}

std::vector<CapabilityName> CapabilityRegistry::capabilities(const EntityId& entity) const {
  std::vector<CapabilityName> out;
  Entry* e = find_entry_(entity);
  if (!e) return out;
  {
    const std::shared_lock<std::shared_mutex> lk(e->mu);
    out.assign(e->caps.begin(), e->caps.end());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t CapabilityRegistry::grant_count() const {
  const std::shared_lock<std::shared_mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& [id, e] : entries_) {
    const std::shared_lock<std::shared_mutex> elk(e->mu);
    n += e->caps.size();
  }
  return n;
}

}  // namespace gk
