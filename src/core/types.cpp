// src/core/types.cpp
#include "gk/core/types.hpp"

namespace gk {

const char* resource_kind_name(ResourceKind kind) noexcept {
  switch (kind) {
    case ResourceKind::kMemory: return "memory";
    case ResourceKind::kCpu: return "cpu";
    case ResourceKind::kNetwork: return "network";
    case ResourceKind::kEnergy: return "energy";
  }
  return "unknown";
}

std::optional<ResourceKind> parse_resource_kind(std::string_view name) {
  for (const ResourceKind k : kAllResourceKinds) {
    if (name == resource_kind_name(k)) return k;
  }
  return std::nullopt;
}

std::string to_string(const AllocationRef& ref) {
  return ref.entity + "/" + resource_kind_name(ref.kind) + "#" + std::to_string(ref.id);
}

}  // namespace gk
