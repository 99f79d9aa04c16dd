// File: src/core/util/logging.cpp
#include "gk/core/util/logging.hpp"

#include <array>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gk {
namespace {

constexpr std::array<std::string_view, 6> kLevels = {"trace", "debug", "info", "warn", "error", "off"};

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto l = std::make_shared<spdlog::logger>("gatekeeper", std::move(sink));
    l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    l->set_level(spdlog::level::info);
    return l;
  }();
  return instance;
}

bool is_known_log_level(std::string_view level) {
  for (const auto l : kLevels) {
    if (l == level) return true;
  }
  return false;
}

void configure_logging(const LoggingConfig& cfg) {
  if (!is_known_log_level(cfg.level)) {
    logger()->warn("unknown log level '{}', keeping '{}'", cfg.level,
                   spdlog::level::to_string_view(logger()->level()));
    return;
  }
  logger()->set_level(spdlog::level::from_str(cfg.level));
}

}  // namespace gk
