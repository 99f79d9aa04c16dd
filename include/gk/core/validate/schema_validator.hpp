// File: include/gk/core/validate/schema_validator.hpp
#pragma once

#include "gk/core/config.hpp"
#include "gk/core/operation.hpp"
#include "gk/core/validation.hpp"

namespace YAML {
class Node;
}

namespace gk {

// Structural checks. Pure: reads no shared state, mutates nothing.
// Every check reports kSchemaInvalid except an over-limit time budget, which
// reports kTimeLimitExceeded. All violations found are reported, not just the
// first.
class SchemaValidator {
 public:
  explicit SchemaValidator(LimitsConfig limits = {}) : limits_(limits) {}

  // Raw configuration document, before it is mapped onto Config.
  static ValidationResult validate_schema(const YAML::Node& doc);

  // A Config assembled in code (or already mapped from a document).
  static ValidationResult validate_schema(const Config& cfg);

  ValidationResult validate_operation_shape(const PhysicsOperation& op) const;

 private:
  LimitsConfig limits_;
};

}  // namespace gk
