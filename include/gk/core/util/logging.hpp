// File: include/gk/core/util/logging.hpp
#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "gk/core/config.hpp"

namespace gk {

// Process-wide diagnostic logger ("gatekeeper", stderr). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// Applies level and pattern. Unknown levels leave the current level in place.
void configure_logging(const LoggingConfig& cfg);

bool is_known_log_level(std::string_view level);

}  // namespace gk
