// File: src/core/io/operation_source.cpp
#include "gk/core/io/operation_source.hpp"

namespace gk {

const char* script_action_name(ScriptStep::Action action) noexcept {
  switch (action) {
    case ScriptStep::Action::kAdmit: return "admit";
    case ScriptStep::Action::kGrant: return "grant";
    case ScriptStep::Action::kRevoke: return "revoke";
    case ScriptStep::Action::kRelease: return "release";
    case ScriptStep::Action::kTeardown: return "teardown";
    case ScriptStep::Action::kStats: return "stats";
  }
  return "unknown";
}

}  // namespace gk
