// File: src/core/validate/security_validator.cpp
#include "gk/core/validate/security_validator.hpp"

namespace gk {

ValidationResult SecurityValidator::validate_capability(
    const EntityId& entity, const std::optional<CapabilityName>& required) const {
  if (!required) return ValidationResult::pass();
  const auto view = registry_.view(entity);
  return check_view(view, entity, required);
}

ValidationResult SecurityValidator::check_view(const CapabilityRegistry::View& view,
                                               const EntityId& entity,
                                               const std::optional<CapabilityName>& required) {
  if (!required) return ValidationResult::pass();
  if (view.contains(*required)) return ValidationResult::pass();
  return ValidationResult::fail(Violation::capability_denied(entity, *required));
}

}  // namespace gk
