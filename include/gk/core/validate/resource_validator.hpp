// File: include/gk/core/validate/resource_validator.hpp
#pragma once

#include "gk/core/ledger/resource_ledger.hpp"
#include "gk/core/validation.hpp"

namespace gk {

// Budget check: current_usage + amount must not exceed the entity's budget for
// that kind. A zero amount always passes. Never mutates the ledger.
class ResourceValidator {
 public:
  explicit ResourceValidator(const ResourceLedger& ledger) : ledger_(ledger) {}

  // Locks the (entity, kind) slot for the duration of the check.
  ValidationResult validate_allocation(const EntityId& entity, ResourceKind kind,
                                       double amount) const;

  // Caller holds slot->mu. `slot` may be null (unknown entity, zero budget).
  static ValidationResult check_locked(const ResourceLedger::Slot* slot, ResourceKind kind,
                                       double amount);

 private:
  const ResourceLedger& ledger_;
};

}  // namespace gk
