// File: src/core/validate/resource_validator.cpp
#include "gk/core/validate/resource_validator.hpp"

#include <algorithm>
#include <mutex>

namespace gk {

ValidationResult ResourceValidator::validate_allocation(const EntityId& entity, ResourceKind kind,
                                                        double amount) const {
  const ResourceLedger::Slot* slot = ledger_.slot(entity, kind);
  if (!slot) return check_locked(nullptr, kind, amount);

  const std::lock_guard<std::mutex> lk(slot->mu);
  return check_locked(slot, kind, amount);
}

ValidationResult ResourceValidator::check_locked(const ResourceLedger::Slot* slot, ResourceKind kind,
                                                 double amount) {
  if (amount == 0.0) return ValidationResult::pass();

  const double budget = slot ? slot->budget : 0.0;
  const double used = slot ? slot->used : 0.0;
  if (used + amount > budget + budget_slack(budget)) {
    const double available = std::max(0.0, budget - used);
    return ValidationResult::fail(Violation::insufficient_resource(kind, amount, available));
  }
  return ValidationResult::pass();
}

}  // namespace gk
