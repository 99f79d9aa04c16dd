// File: include/gk/adapters/script/script_operation_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "gk/core/io/operation_source.hpp"

namespace gk {

struct ScriptSourceConfig {
  std::string path;    // YAML file with a top-level `steps:` sequence
  std::string inline_yaml;  // used instead of `path` when non-empty
};

// Replays a YAML operation script:
//
//   steps:
//     - admit:
//         entity: analyst
//         kind: code_review
//         event: {id: e1, parents: [], timestamp_ns: 100}
//         resource: {kind: memory, amount: 6}
//         capability: CodeAnalysis
//         time_limit_s: 10
//         payload: "review src/"
//         label: scratch
//     - release: scratch
//     - grant: {entity: analyst, capability: CodeAnalysis}
//     - revoke: {entity: analyst, capability: CodeAnalysis}
//     - teardown: analyst
//     - stats
//
// The whole file is parsed on open(); a malformed step fails open() with
// parse_error naming the step index.
class ScriptOperationSource final : public OperationSource {
 public:
  explicit ScriptOperationSource(ScriptSourceConfig cfg);

  Status open() override;
  Result<ScriptStep> next() override;
  void close() override;

  std::string name() const override { return "script"; }

  std::size_t size() const noexcept { return steps_.size(); }

 private:
  ScriptSourceConfig cfg_;
  bool opened_{false};

  std::vector<ScriptStep> steps_;
  std::size_t idx_{0};
};

}  // namespace gk
