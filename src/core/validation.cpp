// src/core/validation.cpp
#include "gk/core/validation.hpp"

#include <fmt/format.h>

namespace gk {

const char* violation_kind_name(ViolationKind kind) noexcept {
  switch (kind) {
    case ViolationKind::kSchemaInvalid: return "SchemaInvalid";
    case ViolationKind::kTimeLimitExceeded: return "TimeLimitExceeded";
    case ViolationKind::kUnknownParent: return "UnknownParent";
    case ViolationKind::kDuplicateEvent: return "DuplicateEvent";
    case ViolationKind::kCausalOrderViolation: return "CausalOrderViolation";
    case ViolationKind::kInsufficientResource: return "InsufficientResource";
    case ViolationKind::kUnknownAllocation: return "UnknownAllocation";
    case ViolationKind::kCapabilityDenied: return "CapabilityDenied";
    case ViolationKind::kEngineStopped: return "EngineStopped";
  }
  return "Unknown";
}

ViolationClass violation_class(ViolationKind kind) noexcept {
  switch (kind) {
    case ViolationKind::kSchemaInvalid:
    case ViolationKind::kTimeLimitExceeded:
      return ViolationClass::kSchema;
    case ViolationKind::kUnknownParent:
    case ViolationKind::kDuplicateEvent:
    case ViolationKind::kCausalOrderViolation:
      return ViolationClass::kCausality;
    case ViolationKind::kInsufficientResource:
    case ViolationKind::kUnknownAllocation:
      return ViolationClass::kResource;
    case ViolationKind::kCapabilityDenied:
      return ViolationClass::kSecurity;
    case ViolationKind::kEngineStopped:
      return ViolationClass::kLifecycle;
  }
  return ViolationClass::kLifecycle;
}

Violation Violation::schema_invalid(std::string subject, std::string reason) {
  Violation v;
  v.kind = ViolationKind::kSchemaInvalid;
  v.description = subject.empty() ? reason : subject + ": " + reason;
  v.subject = std::move(subject);
  return v;
}

Violation Violation::time_limit_exceeded(DurationNs requested, DurationNs max) {
  Violation v;
  v.kind = ViolationKind::kTimeLimitExceeded;
  v.subject = "time_limit";
  v.description = fmt::format("time limit {} ns exceeds maximum {} ns", requested, max);
  return v;
}

Violation Violation::unknown_parent(const EventId& event, const EventId& parent) {
  Violation v;
  v.kind = ViolationKind::kUnknownParent;
  v.subject = parent;
  v.description = fmt::format("event '{}' references unknown parent '{}'", event, parent);
  return v;
}

Violation Violation::duplicate_event(const EventId& event) {
  Violation v;
  v.kind = ViolationKind::kDuplicateEvent;
  v.subject = event;
  v.description = fmt::format("event '{}' already exists", event);
  return v;
}

Violation Violation::causal_order(const EventId& event, std::string reason) {
  Violation v;
  v.kind = ViolationKind::kCausalOrderViolation;
  v.subject = event;
  v.description = fmt::format("event '{}': {}", event, reason);
  return v;
}

Violation Violation::insufficient_resource(ResourceKind kind, double required, double available) {
  Violation v;
  v.kind = ViolationKind::kInsufficientResource;
  v.subject = resource_kind_name(kind);
  v.resource = kind;
  v.required = required;
  v.available = available;
  v.description = fmt::format("insufficient {}: required {:g}, available {:g}",
                              resource_kind_name(kind), required, available);
  return v;
}

Violation Violation::unknown_allocation(const AllocationRef& ref) {
  Violation v;
  v.kind = ViolationKind::kUnknownAllocation;
  v.subject = to_string(ref);
  v.description = "unknown allocation " + v.subject;
  return v;
}

Violation Violation::capability_denied(const EntityId& entity, const CapabilityName& capability) {
  Violation v;
  v.kind = ViolationKind::kCapabilityDenied;
  v.subject = capability;
  v.description = fmt::format("entity '{}' lacks capability '{}'", entity, capability);
  return v;
}

Violation Violation::engine_stopped() {
  Violation v;
  v.kind = ViolationKind::kEngineStopped;
  v.description = "engine is not accepting operations";
  return v;
}

std::string ValidationResult::summary() const {
  std::string out;
  for (const auto& v : violations_) {
    if (!out.empty()) out += "; ";
    out += violation_kind_name(v.kind);
    out += ": ";
    out += v.description;
  }
  return out;
}

}  // namespace gk
