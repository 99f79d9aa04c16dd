// File: src/core/validate/causality_validator.cpp
#include "gk/core/validate/causality_validator.hpp"

#include <string>

namespace gk {

ValidationResult CausalityValidator::validate_event(const EventId& event_id,
                                                    const std::vector<EventId>& parent_ids,
                                                    TimestampNs timestamp,
                                                    std::uint64_t content_hash) const {
  const auto lk = ledger_.read_lock();
  return check_locked(event_id, parent_ids, timestamp, content_hash);
}

ValidationResult CausalityValidator::check_locked(const EventId& event_id,
                                                  const std::vector<EventId>& parent_ids,
                                                  TimestampNs timestamp,
                                                  std::uint64_t content_hash) const {
  ValidationResult r;

  std::vector<const EventNode*> parents;
  parents.reserve(parent_ids.size());
  for (const auto& pid : parent_ids) {
    const EventNode* p = ledger_.find_locked(pid);
    if (!p) {
      r.add(Violation::unknown_parent(event_id, pid));
      continue;
    }
    parents.push_back(p);
  }
  if (!r.passed()) return r;

  if (!parents.empty()) {
    TimestampNs latest = parents.front()->timestamp;
    for (const EventNode* p : parents) {
      if (p->timestamp > latest) latest = p->timestamp;
    }

    if (timestamp < latest) {
      return ValidationResult::fail(Violation::causal_order(
          event_id, "timestamp " + std::to_string(timestamp.ns) +
                        " precedes parent timestamp " + std::to_string(latest.ns)));
    }

    if (strict_ && timestamp == latest) {
      for (const EventNode* p : parents) {
        if (p->timestamp == timestamp && p->content_hash != content_hash) {
          return ValidationResult::fail(Violation::causal_order(
              event_id, "strict ordering: timestamp " + std::to_string(timestamp.ns) +
                            " ties parent '" + p->id + "' with different content"));
        }
      }
    }
  }

  if (ledger_.find_locked(event_id)) {
    return ValidationResult::fail(Violation::duplicate_event(event_id));
  }

  return r;
}

}  // namespace gk
