// File: include/gk/core/admission/admission_pipeline.hpp
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "gk/core/config.hpp"
#include "gk/core/ledger/capability_registry.hpp"
#include "gk/core/ledger/event_ledger.hpp"
#include "gk/core/ledger/resource_ledger.hpp"
#include "gk/core/operation.hpp"
#include "gk/core/status.hpp"
#include "gk/core/validate/causality_validator.hpp"
#include "gk/core/validate/resource_validator.hpp"
#include "gk/core/validate/schema_validator.hpp"
#include "gk/core/validate/security_validator.hpp"
#include "gk/core/validation.hpp"

namespace gk {

using AdmitResult = Result<AdmissionReceipt, ValidationFailure>;

struct AdmissionCounters {
  std::uint64_t admitted = 0;
  std::uint64_t rejected = 0;
  std::array<std::uint64_t, kViolationKindCount> violations{};
};

// All-or-nothing admission of one operation.
//
// Order: schema -> causality -> resource -> security. Each stage runs first
// against the current ledger state under short shared locks (fail fast, no
// exclusive locks for operations that are obviously bad). The commit then
// takes the locks the operation needs in a fixed order
//
//     event ledger (write) -> resource slot -> capability entry (shared)
//
// re-runs the three checks under those locks and only then mutates. A
// rejection at any point leaves every ledger untouched.
class AdmissionPipeline {
 public:
  AdmissionPipeline(const Config& cfg, EventLedger& events, ResourceLedger& resources,
                    CapabilityRegistry& capabilities);

  AdmitResult admit(const PhysicsOperation& op);

  // Inverse of a committed allocation. kUnknownAllocation if not live.
  Result<ResourceAllocation, ValidationFailure> release(const AllocationRef& ref);

  // Capability an operation must hold: the explicit one, else its kind's gate.
  [[nodiscard]] std::optional<CapabilityName> effective_capability(const PhysicsOperation& op) const;

  // Records a rejection that happened outside admit() (e.g. engine stopped).
  void count_rejection(const ValidationFailure& f);

  [[nodiscard]] AdmissionCounters counters() const;

  const SchemaValidator& schema() const noexcept { return schema_; }
  const CausalityValidator& causality() const noexcept { return causality_; }
  const ResourceValidator& resource() const noexcept { return resource_; }
  const SecurityValidator& security() const noexcept { return security_; }

 private:
  AdmitResult reject_(ValidationResult r);
  AdmitResult commit_(const PhysicsOperation& op, const std::optional<CapabilityName>& capability,
                      std::uint64_t content_hash);

  EventLedger& events_;
  ResourceLedger& resources_;
  CapabilityRegistry& capabilities_;

  SchemaValidator schema_;
  CausalityValidator causality_;
  ResourceValidator resource_;
  SecurityValidator security_;

  std::map<std::string, CapabilityName> gates_;

  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<std::uint64_t> admitted_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::array<std::atomic<std::uint64_t>, kViolationKindCount> violations_{};
};

}  // namespace gk
