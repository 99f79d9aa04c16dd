// File: src/core/util/config_loader.cpp
#include "gk/core/util/config_loader.hpp"

#include <filesystem>
#include <set>

#include <yaml-cpp/yaml.h>

#include "gk/core/validate/schema_validator.hpp"

namespace gk {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& visiting) {
  std::error_code ec;
  const fs::path canon = fs::weakly_canonical(path, ec);
  const std::string key = ec ? path.string() : canon.string();
  if (!visiting.insert(key).second) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (is_map(root) && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::schema_invalid("includes: must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, visiting);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    root.remove("includes");
  }

  visiting.erase(key);

  // Finally override with this file's contents.
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

// Assumes the document already passed SchemaValidator::validate_schema.
static Config map_config(const YAML::Node& y) {
  Config cfg;  // defaults

  maybe_set(y, "engine_id", cfg.engine_id);
  maybe_set(y, "strict_ordering", cfg.strict_ordering);

  // --- limits
  if (is_map(y["limits"])) {
    const auto l = y["limits"];
    if (l["max_time_limit_s"]) cfg.limits.max_time_limit_ns = seconds_to_ns(l["max_time_limit_s"].as<double>());
  }

  // --- entities
  const YAML::Node ents = y["entities"];
  for (std::size_t i = 0; i < ents.size(); ++i) {
    const YAML::Node n = ents[i];
    EntityConfig e;
    e.id = n["id"].as<std::string>();
    for (auto kv : n["budgets"]) {
      // Kinds were checked by the schema pass.
      const auto kind = parse_resource_kind(kv.first.as<std::string>());
      if (kind) e.budgets[*kind] = kv.second.as<double>();
    }
    if (n["capabilities"]) {
      for (std::size_t c = 0; c < n["capabilities"].size(); ++c) {
        e.capabilities.push_back(n["capabilities"][c].as<std::string>());
      }
    }
    cfg.entities.push_back(std::move(e));
  }

  // --- capability gates
  if (is_map(y["capability_gates"])) {
    for (auto kv : y["capability_gates"]) {
      cfg.capability_gates[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "keep_last_runs", cfg.output.keep_last_runs);
  }

  // --- logging
  if (is_map(y["logging"])) {
    maybe_set(y["logging"], "level", cfg.logging.level);
  }

  return cfg;
}

static Result<Config> config_from_document(const YAML::Node& y) {
  const ValidationResult doc_r = SchemaValidator::validate_schema(y);
  if (!doc_r.passed()) return Result<Config>::err(Status::schema_invalid(doc_r.summary()));

  Config cfg;
  try {
    cfg = map_config(y);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::schema_invalid(std::string("SchemaInvalid: ") + e.what()));
  }

  // Final validation (fail early).
  const ValidationResult cfg_r = SchemaValidator::validate_schema(cfg);
  if (!cfg_r.passed()) return Result<Config>::err(Status::schema_invalid(cfg_r.summary()));

  return Result<Config>::ok(std::move(cfg));
}

Result<Config> load_config(const std::string& path_str) {
  std::set<std::string> visiting;
  auto yaml_r = load_with_includes(fs::path(path_str), visiting);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return config_from_document(yaml_r.value());
}

Result<Config> load_config_from_string(const std::string& yaml) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  return config_from_document(y);
}

}  // namespace gk
