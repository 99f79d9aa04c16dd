// File: include/gk/core/util/config_loader.hpp
#pragma once

#include <string>

#include "gk/core/config.hpp"
#include "gk/core/status.hpp"

namespace YAML {
class Node;
}

namespace gk {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// The merged document is schema-checked before anything is mapped; a rejected
// document yields Status::Code::kSchemaInvalid listing every violation.
Result<Config> load_config(const std::string& path);

// Same, for an in-memory document (no includes). Used by tests and tools.
Result<Config> load_config_from_string(const std::string& yaml);

}  // namespace gk
