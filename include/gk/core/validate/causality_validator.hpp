// File: include/gk/core/validate/causality_validator.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "gk/core/ledger/event_ledger.hpp"
#include "gk/core/operation.hpp"
#include "gk/core/validation.hpp"

namespace gk {

// Checks a proposed event against the event ledger:
//  - every parent resolves            (else kUnknownParent)
//  - timestamp >= max parent timestamp (else kCausalOrderViolation)
//  - the id is new                    (else kDuplicateEvent)
// Ties with the latest parent are allowed unless strict ordering is on, in
// which case every parent at that timestamp must carry the same content hash.
// Never mutates the ledger.
class CausalityValidator {
 public:
  CausalityValidator(const EventLedger& ledger, bool strict_ordering)
      : ledger_(ledger), strict_(strict_ordering) {}

  // Takes the ledger's read lock.
  ValidationResult validate_event(const EventId& event_id, const std::vector<EventId>& parent_ids,
                                  TimestampNs timestamp, std::uint64_t content_hash = 0) const;
  ValidationResult validate_event(const EventDescriptor& ev, std::uint64_t content_hash = 0) const {
    return validate_event(ev.id, ev.parents, ev.timestamp, content_hash);
  }

  // Caller holds a ledger lock (read or write).
  ValidationResult check_locked(const EventId& event_id, const std::vector<EventId>& parent_ids,
                                TimestampNs timestamp, std::uint64_t content_hash) const;

  [[nodiscard]] bool strict_ordering() const noexcept { return strict_; }

 private:
  const EventLedger& ledger_;
  bool strict_;
};

}  // namespace gk
