// File: include/gk/core/util/clock.hpp
#pragma once

#include <chrono>
#include <cstdint>

#include "gk/core/types.hpp"

namespace gk {

inline TimestampNs wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

}  // namespace gk
