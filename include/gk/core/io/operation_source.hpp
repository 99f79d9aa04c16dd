// File: include/gk/core/io/operation_source.hpp
#pragma once

#include <cstddef>
#include <string>

#include "gk/core/operation.hpp"
#include "gk/core/status.hpp"
#include "gk/core/types.hpp"

namespace gk {

// One step of a replayed session: an operation to admit or an administrative call.
struct ScriptStep {
  enum class Action {
    kAdmit,
    kGrant,
    kRevoke,
    kRelease,
    kTeardown,
    kStats,
  };

  Action action = Action::kAdmit;

  PhysicsOperation op;  // kAdmit

  EntityId entity;            // kGrant / kRevoke / kTeardown
  CapabilityName capability;  // kGrant / kRevoke

  // kAdmit: names the allocation the receipt carries (if any).
  // kRelease: the name of the allocation to release.
  std::string label;

  std::size_t index = 0;  // position in the source
};

const char* script_action_name(ScriptStep::Action action) noexcept;

class OperationSource {
 public:
  virtual ~OperationSource() = default;

  virtual Status open() = 0;

  // Returns:
  //  - the next step on success
  //  - out_of_range("eof") when no more steps
  //  - other error codes on failure
  virtual Result<ScriptStep> next() = 0;

  virtual void close() = 0;

  virtual std::string name() const = 0;
};

}  // namespace gk
