// File: src/core/util/repro_hash.cpp
#include "gk/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace gk {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_u8(std::uint8_t v)   { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) { add_u8(v ? 1u : 0u); }

  void add_string(std::string_view s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }
};

void add_entity(Fnv1a64& h, const EntityConfig& e) {
  h.add_string(e.id);
  h.add_u64(static_cast<std::uint64_t>(e.budgets.size()));
  for (const auto& [kind, amount] : e.budgets) {
    h.add_u8(static_cast<std::uint8_t>(kind));
    h.add_double(amount);
  }
  // Grant order in the document is not meaningful, but it is stable, so hash as given.
  h.add_u64(static_cast<std::uint64_t>(e.capabilities.size()));
  for (const auto& c : e.capabilities) h.add_string(c);
}

}  // namespace

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.engine_id);
  h.add_bool(cfg.strict_ordering);
  h.add_i64(cfg.limits.max_time_limit_ns);

  h.add_u64(static_cast<std::uint64_t>(cfg.entities.size()));
  for (const auto& e : cfg.entities) add_entity(h, e);

  h.add_u64(static_cast<std::uint64_t>(cfg.capability_gates.size()));
  for (const auto& [kind, cap] : cfg.capability_gates) {
    h.add_string(kind);
    h.add_string(cap);
  }

  // Output and logging do not change admission decisions; leave them out.
  return to_hex(h.h);
}

std::uint64_t compute_content_hash(std::string_view entity, std::string_view kind,
                                   std::string_view payload) {
  Fnv1a64 h;
  h.add_string(entity);
  h.add_string(kind);
  h.add_string(payload);
  return h.h;
}

}  // namespace gk
