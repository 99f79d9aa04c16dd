// include/gk/core/validation.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gk/core/types.hpp"

namespace gk {

enum class ViolationKind : int {
  // schema class
  kSchemaInvalid = 0,
  kTimeLimitExceeded,

  // causality class
  kUnknownParent,
  kDuplicateEvent,
  kCausalOrderViolation,

  // resource class
  kInsufficientResource,
  kUnknownAllocation,

  // security class
  kCapabilityDenied,

  // lifecycle
  kEngineStopped,
};

inline constexpr std::size_t kViolationKindCount = 9;

enum class ViolationClass {
  kSchema,
  kCausality,
  kResource,
  kSecurity,
  kLifecycle,
};

const char* violation_kind_name(ViolationKind kind) noexcept;
ViolationClass violation_class(ViolationKind kind) noexcept;

struct Violation {
  ViolationKind kind = ViolationKind::kSchemaInvalid;
  std::string description;

  // Field path, event id, capability name or allocation, depending on kind.
  std::string subject;

  // kInsufficientResource only.
  std::optional<ResourceKind> resource;
  double required = 0.0;
  double available = 0.0;

  static Violation schema_invalid(std::string subject, std::string reason);
  static Violation time_limit_exceeded(DurationNs requested, DurationNs max);
  static Violation unknown_parent(const EventId& event, const EventId& parent);
  static Violation duplicate_event(const EventId& event);
  static Violation causal_order(const EventId& event, std::string reason);
  static Violation insufficient_resource(ResourceKind kind, double required, double available);
  static Violation unknown_allocation(const AllocationRef& ref);
  static Violation capability_denied(const EntityId& entity, const CapabilityName& capability);
  static Violation engine_stopped();
};

// Pass, or fail with at least one violation.
class ValidationResult {
 public:
  ValidationResult() = default;

  static ValidationResult pass() { return ValidationResult(); }
  static ValidationResult fail(Violation v) {
    ValidationResult r;
    r.add(std::move(v));
    return r;
  }

  [[nodiscard]] bool passed() const noexcept { return violations_.empty(); }
  [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return violations_; }

  void add(Violation v) { violations_.push_back(std::move(v)); }
  void merge(const ValidationResult& other) {
    violations_.insert(violations_.end(), other.violations_.begin(), other.violations_.end());
  }

  // Violations joined with "; ".
  [[nodiscard]] std::string summary() const;

 private:
  std::vector<Violation> violations_;
};

// Returned by admit(): the first failing stage's violations.
class ValidationFailure {
 public:
  explicit ValidationFailure(ValidationResult result) : result_(std::move(result)) {}

  [[nodiscard]] const Violation& primary() const { return result_.violations().front(); }
  [[nodiscard]] ViolationKind kind() const { return primary().kind; }
  [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return result_.violations(); }
  [[nodiscard]] std::string message() const { return result_.summary(); }

 private:
  ValidationResult result_;
};

}  // namespace gk
