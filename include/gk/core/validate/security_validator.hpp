// File: include/gk/core/validate/security_validator.hpp
#pragma once

#include <optional>

#include "gk/core/ledger/capability_registry.hpp"
#include "gk/core/validation.hpp"

namespace gk {

// Capability gate. No required capability => pass. Pure read.
class SecurityValidator {
 public:
  explicit SecurityValidator(const CapabilityRegistry& registry) : registry_(registry) {}

  ValidationResult validate_capability(const EntityId& entity,
                                       const std::optional<CapabilityName>& required) const;

  // Against a view the caller already holds.
  static ValidationResult check_view(const CapabilityRegistry::View& view, const EntityId& entity,
                                     const std::optional<CapabilityName>& required);

 private:
  const CapabilityRegistry& registry_;
};

}  // namespace gk
