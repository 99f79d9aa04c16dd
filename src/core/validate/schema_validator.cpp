// File: src/core/validate/schema_validator.cpp
#include "gk/core/validate/schema_validator.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "gk/core/util/logging.hpp"

namespace gk {
namespace {

const std::set<std::string> kTopLevelKeys = {
    "includes", "engine_id", "strict_ordering", "limits", "entities",
    "capability_gates", "output", "logging",
};

const std::set<std::string> kEntityKeys = {"id", "budgets", "capabilities"};

std::optional<double> as_number(const YAML::Node& n) {
  if (!n || !n.IsScalar()) return std::nullopt;
  try {
    return n.as<double>();
  } catch (const YAML::Exception&) {
    return std::nullopt;
  }
}

std::optional<std::string> as_text(const YAML::Node& n) {
  if (!n || !n.IsScalar()) return std::nullopt;
  return n.Scalar();
}

void check_quantity(double v, const std::string& path, ValidationResult& r) {
  if (!std::isfinite(v)) {
    r.add(Violation::schema_invalid(path, "must be finite"));
  } else if (v < 0.0) {
    r.add(Violation::schema_invalid(path, "must be >= 0"));
  }
}

void check_quantity_node(const YAML::Node& n, const std::string& path, ValidationResult& r) {
  const auto v = as_number(n);
  if (!v) {
    r.add(Violation::schema_invalid(path, "must be a number"));
    return;
  }
  check_quantity(*v, path, r);
}

void check_non_empty_text(const YAML::Node& n, const std::string& path, ValidationResult& r) {
  const auto s = as_text(n);
  if (!s) {
    r.add(Violation::schema_invalid(path, "must be a string"));
  } else if (s->empty()) {
    r.add(Violation::schema_invalid(path, "must not be empty"));
  }
}

void check_entity(const YAML::Node& e, const std::string& path,
                  std::unordered_set<std::string>& seen_ids, ValidationResult& r) {
  if (!e.IsMap()) {
    r.add(Violation::schema_invalid(path, "must be a map"));
    return;
  }

  for (const auto& kv : e) {
    const std::string key = kv.first.as<std::string>();
    if (kEntityKeys.count(key) == 0) {
      r.add(Violation::schema_invalid(path + "." + key, "unknown field"));
    }
  }

  if (!e["id"]) {
    r.add(Violation::schema_invalid(path + ".id", "required field missing"));
  } else {
    check_non_empty_text(e["id"], path + ".id", r);
    const auto id = as_text(e["id"]);
    if (id && !id->empty() && !seen_ids.insert(*id).second) {
      r.add(Violation::schema_invalid(path + ".id", "duplicate entity id '" + *id + "'"));
    }
  }

  const YAML::Node budgets = e["budgets"];
  if (!budgets) {
    r.add(Violation::schema_invalid(path + ".budgets", "required field missing"));
  } else if (!budgets.IsMap()) {
    r.add(Violation::schema_invalid(path + ".budgets", "must be a map of resource kind to amount"));
  } else {
    for (const auto& kv : budgets) {
      const std::string kind = kv.first.as<std::string>();
      const std::string kpath = path + ".budgets." + kind;
      if (!parse_resource_kind(kind)) {
        r.add(Violation::schema_invalid(kpath, "unknown resource kind (expected memory|cpu|network|energy)"));
        continue;
      }
      check_quantity_node(kv.second, kpath, r);
    }
  }

  const YAML::Node caps = e["capabilities"];
  if (caps) {
    if (!caps.IsSequence()) {
      r.add(Violation::schema_invalid(path + ".capabilities", "must be a sequence"));
    } else {
      for (std::size_t i = 0; i < caps.size(); ++i) {
        check_non_empty_text(caps[i], path + ".capabilities[" + std::to_string(i) + "]", r);
      }
    }
  }
}

}  // namespace

ValidationResult SchemaValidator::validate_schema(const YAML::Node& doc) {
  ValidationResult r;
  if (!doc || doc.IsNull()) {
    r.add(Violation::schema_invalid("", "configuration document is empty"));
    return r;
  }
  if (!doc.IsMap()) {
    r.add(Violation::schema_invalid("", "configuration document must be a map"));
    return r;
  }

  try {
    for (const auto& kv : doc) {
      const std::string key = kv.first.as<std::string>();
      if (kTopLevelKeys.count(key) == 0) {
        r.add(Violation::schema_invalid(key, "unknown field"));
      }
    }

    if (doc["engine_id"]) check_non_empty_text(doc["engine_id"], "engine_id", r);

    if (const YAML::Node so = doc["strict_ordering"]) {
      bool ignored = false;
      if (!so.IsScalar() || !YAML::convert<bool>::decode(so, ignored)) {
        r.add(Violation::schema_invalid("strict_ordering", "must be a boolean"));
      }
    }

    if (const YAML::Node lim = doc["limits"]) {
      if (!lim.IsMap()) {
        r.add(Violation::schema_invalid("limits", "must be a map"));
      } else if (lim["max_time_limit_s"]) {
        check_quantity_node(lim["max_time_limit_s"], "limits.max_time_limit_s", r);
        const auto v = as_number(lim["max_time_limit_s"]);
        if (v && std::isfinite(*v) && *v > kMaxDurationSeconds) {
          r.add(Violation::schema_invalid("limits.max_time_limit_s",
                                          fmt::format("must be <= {:.0f} seconds", kMaxDurationSeconds)));
        }
      }
    }

    const YAML::Node entities = doc["entities"];
    if (!entities) {
      r.add(Violation::schema_invalid("entities", "required field missing"));
    } else if (!entities.IsSequence()) {
      r.add(Violation::schema_invalid("entities", "must be a sequence"));
    } else {
      std::unordered_set<std::string> seen;
      for (std::size_t i = 0; i < entities.size(); ++i) {
        check_entity(entities[i], "entities[" + std::to_string(i) + "]", seen, r);
      }
    }

    if (const YAML::Node gates = doc["capability_gates"]) {
      if (!gates.IsMap()) {
        r.add(Violation::schema_invalid("capability_gates", "must be a map of operation kind to capability"));
      } else {
        for (const auto& kv : gates) {
          const std::string kind = kv.first.as<std::string>();
          if (kind.empty()) r.add(Violation::schema_invalid("capability_gates", "operation kind must not be empty"));
          check_non_empty_text(kv.second, "capability_gates." + kind, r);
        }
      }
    }

    if (const YAML::Node out = doc["output"]) {
      if (!out.IsMap()) {
        r.add(Violation::schema_invalid("output", "must be a map"));
      } else {
        if (out["out_dir"]) check_non_empty_text(out["out_dir"], "output.out_dir", r);
        if (out["keep_last_runs"]) {
          const auto v = as_number(out["keep_last_runs"]);
          if (!v || !std::isfinite(*v) || *v < 0.0 || std::floor(*v) != *v) {
            r.add(Violation::schema_invalid("output.keep_last_runs", "must be a non-negative integer"));
          }
        }
      }
    }

    if (const YAML::Node lg = doc["logging"]) {
      if (!lg.IsMap()) {
        r.add(Violation::schema_invalid("logging", "must be a map"));
      } else if (lg["level"]) {
        const auto lvl = as_text(lg["level"]);
        if (!lvl || !is_known_log_level(*lvl)) {
          r.add(Violation::schema_invalid("logging.level", "must be one of trace|debug|info|warn|error|off"));
        }
      }
    }
  } catch (const YAML::Exception& e) {
    r.add(Violation::schema_invalid("", std::string("malformed document: ") + e.what()));
  }

  return r;
}

ValidationResult SchemaValidator::validate_schema(const Config& cfg) {
  ValidationResult r;

  if (cfg.engine_id.empty()) r.add(Violation::schema_invalid("engine_id", "must not be empty"));
  if (cfg.limits.max_time_limit_ns < 0) {
    r.add(Violation::schema_invalid("limits.max_time_limit_s", "must be >= 0"));
  }

  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < cfg.entities.size(); ++i) {
    const EntityConfig& e = cfg.entities[i];
    const std::string path = "entities[" + std::to_string(i) + "]";
    if (e.id.empty()) {
      r.add(Violation::schema_invalid(path + ".id", "must not be empty"));
    } else if (!seen.insert(e.id).second) {
      r.add(Violation::schema_invalid(path + ".id", "duplicate entity id '" + e.id + "'"));
    }
    for (const auto& [kind, amount] : e.budgets) {
      if (!is_valid_resource_kind(kind)) {
        r.add(Violation::schema_invalid(path + ".budgets", "unknown resource kind"));
        continue;
      }
      check_quantity(amount, path + ".budgets." + resource_kind_name(kind), r);
    }
    for (std::size_t c = 0; c < e.capabilities.size(); ++c) {
      if (e.capabilities[c].empty()) {
        r.add(Violation::schema_invalid(path + ".capabilities[" + std::to_string(c) + "]",
                                        "must not be empty"));
      }
    }
  }

  for (const auto& [kind, cap] : cfg.capability_gates) {
    if (kind.empty()) r.add(Violation::schema_invalid("capability_gates", "operation kind must not be empty"));
    if (cap.empty()) r.add(Violation::schema_invalid("capability_gates." + kind, "must not be empty"));
  }

  if (cfg.output.out_dir.empty()) r.add(Violation::schema_invalid("output.out_dir", "must not be empty"));
  if (!is_known_log_level(cfg.logging.level)) {
    r.add(Violation::schema_invalid("logging.level", "must be one of trace|debug|info|warn|error|off"));
  }

  return r;
}

ValidationResult SchemaValidator::validate_operation_shape(const PhysicsOperation& op) const {
  ValidationResult r;

  if (op.entity.empty()) r.add(Violation::schema_invalid("entity", "required field missing"));

  if (op.event) {
    const EventDescriptor& ev = *op.event;
    if (ev.id.empty()) r.add(Violation::schema_invalid("event.id", "required field missing"));
    if (ev.timestamp.ns < 0) r.add(Violation::schema_invalid("event.timestamp", "must be >= 0"));

    std::unordered_set<EventId> parents;
    for (std::size_t i = 0; i < ev.parents.size(); ++i) {
      const EventId& p = ev.parents[i];
      const std::string path = "event.parents[" + std::to_string(i) + "]";
      if (p.empty()) {
        r.add(Violation::schema_invalid(path, "must not be empty"));
      } else if (!ev.id.empty() && p == ev.id) {
        r.add(Violation::schema_invalid(path, "event cannot be its own parent"));
      } else if (!parents.insert(p).second) {
        r.add(Violation::schema_invalid(path, "duplicate parent '" + p + "'"));
      }
    }
  }

  if (op.resource) {
    if (!is_valid_resource_kind(op.resource->kind)) {
      r.add(Violation::schema_invalid("resource.kind", "unknown resource kind"));
    }
    check_quantity(op.resource->amount, "resource.amount", r);
  }

  if (op.required_capability && op.required_capability->empty()) {
    r.add(Violation::schema_invalid("required_capability", "must not be empty when present"));
  }

  if (op.time_limit_ns) {
    if (*op.time_limit_ns < 0) {
      r.add(Violation::schema_invalid("time_limit", "must be >= 0"));
    } else if (*op.time_limit_ns > limits_.max_time_limit_ns) {
      r.add(Violation::time_limit_exceeded(*op.time_limit_ns, limits_.max_time_limit_ns));
    }
  }

  return r;
}

}  // namespace gk
