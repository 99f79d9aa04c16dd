// File: include/gk/core/util/repro_hash.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "gk/core/config.hpp"

namespace gk {

// Hash the full runtime config (entities, budgets, grants, gates, limits).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

// Content digest of an operation, stored on the events it commits.
// Strict ordering compares these to decide whether a timestamp tie is benign.
std::uint64_t compute_content_hash(std::string_view entity, std::string_view kind,
                                   std::string_view payload);

std::string to_hex(std::uint64_t v);

}  // namespace gk
