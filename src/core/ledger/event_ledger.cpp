// File: src/core/ledger/event_ledger.cpp
#include "gk/core/ledger/event_ledger.hpp"

#include <deque>
#include <utility>

namespace gk {

bool EventLedger::contains(const EventId& id) const {
  const ReadLock lk(mu_);
  return index_.find(id) != index_.end();
}

std::optional<EventNode> EventLedger::find(const EventId& id) const {
  const ReadLock lk(mu_);
  const EventNode* n = find_locked(id);
  if (!n) return std::nullopt;
  return *n;
}

std::size_t EventLedger::size() const {
  const ReadLock lk(mu_);
  return nodes_.size();
}

const EventNode* EventLedger::find_locked(const EventId& id) const {
  const auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &nodes_[it->second].node;
}

std::uint64_t EventLedger::insert_locked(EventNode node) {
  Slot slot;
  slot.parent_slots.reserve(node.parents.size());
  for (const auto& p : node.parents) {
    // Checked by the caller; a miss here would be a broken invariant.
    const auto it = index_.find(p);
    if (it != index_.end()) slot.parent_slots.push_back(it->second);
  }

  const std::size_t pos = nodes_.size();
  node.seq = static_cast<std::uint64_t>(pos);
  index_.emplace(node.id, pos);
  slot.node = std::move(node);
  nodes_.push_back(std::move(slot));
  return static_cast<std::uint64_t>(pos);
}

std::vector<EventId> EventLedger::ancestors(const EventId& id) const {
  const ReadLock lk(mu_);

  std::vector<EventId> out;
  const auto it = index_.find(id);
  if (it == index_.end()) return out;

  // BFS over arena slots. Parents always have a lower slot than children.
  std::vector<bool> seen(nodes_.size(), false);
  std::deque<std::size_t> frontier(nodes_[it->second].parent_slots.begin(),
                                   nodes_[it->second].parent_slots.end());
  while (!frontier.empty()) {
    const std::size_t s = frontier.front();
    frontier.pop_front();
    if (seen[s]) continue;
    seen[s] = true;
    out.push_back(nodes_[s].node.id);
    for (const std::size_t p : nodes_[s].parent_slots) {
      if (!seen[p]) frontier.push_back(p);
    }
  }
  return out;
}

}  // namespace gk
