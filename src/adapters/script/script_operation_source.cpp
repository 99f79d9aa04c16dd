// File: src/adapters/script/script_operation_source.cpp
#include "gk/adapters/script/script_operation_source.hpp"

#include <cmath>
#include <filesystem>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace gk {
namespace {

Status step_error(std::size_t idx, const std::string& msg) {
  return Status::parse_error("ScriptOperationSource: step " + std::to_string(idx) + ": " + msg);
}

Result<PhysicsOperation> parse_operation(const YAML::Node& n, std::size_t idx) {
  if (!n.IsMap()) return Result<PhysicsOperation>::err(step_error(idx, "admit must be a map"));

  PhysicsOperation op;
  if (n["entity"]) op.entity = n["entity"].as<std::string>();
  if (n["kind"]) op.kind = n["kind"].as<std::string>();
  if (n["payload"]) op.payload = n["payload"].as<std::string>();
  if (n["capability"]) op.required_capability = n["capability"].as<std::string>();
  if (n["time_limit_s"]) {
    const double secs = n["time_limit_s"].as<double>();
    if (!std::isfinite(secs) || std::fabs(secs) > kMaxDurationSeconds) {
      return Result<PhysicsOperation>::err(step_error(idx, "time_limit_s is not a representable duration"));
    }
    op.time_limit_ns = seconds_to_ns(secs);
  }

  if (const YAML::Node ev = n["event"]) {
    if (!ev.IsMap()) return Result<PhysicsOperation>::err(step_error(idx, "event must be a map"));
    EventDescriptor d;
    if (ev["id"]) d.id = ev["id"].as<std::string>();
    if (ev["timestamp_ns"]) d.timestamp = TimestampNs{ev["timestamp_ns"].as<std::int64_t>()};
    if (const YAML::Node ps = ev["parents"]) {
      if (!ps.IsSequence()) return Result<PhysicsOperation>::err(step_error(idx, "event.parents must be a sequence"));
      for (std::size_t i = 0; i < ps.size(); ++i) d.parents.push_back(ps[i].as<std::string>());
    }
    op.event = std::move(d);
  }

  if (const YAML::Node rs = n["resource"]) {
    if (!rs.IsMap() || !rs["kind"]) {
      return Result<PhysicsOperation>::err(step_error(idx, "resource must be a map with a kind"));
    }
    const std::string kind_name = rs["kind"].as<std::string>();
    const auto kind = parse_resource_kind(kind_name);
    if (!kind) return Result<PhysicsOperation>::err(step_error(idx, "unknown resource kind '" + kind_name + "'"));
    ResourceRequest req;
    req.kind = *kind;
    req.amount = rs["amount"] ? rs["amount"].as<double>() : 0.0;
    op.resource = req;
  }

  return Result<PhysicsOperation>::ok(std::move(op));
}

// `grant: {entity: a, capability: c}`
Status parse_entity_capability(const YAML::Node& n, std::size_t idx, ScriptStep& out) {
  if (!n.IsMap() || !n["entity"] || !n["capability"]) {
    return step_error(idx, std::string(script_action_name(out.action)) + " needs entity and capability");
  }
  out.entity = n["entity"].as<std::string>();
  out.capability = n["capability"].as<std::string>();
  return Status::ok_status();
}

Result<ScriptStep> parse_step(const YAML::Node& n, std::size_t idx) {
  ScriptStep step;
  step.index = idx;

  // Bare scalar steps: "stats".
  if (n.IsScalar()) {
    if (n.Scalar() == "stats") {
      step.action = ScriptStep::Action::kStats;
      return Result<ScriptStep>::ok(std::move(step));
    }
    return Result<ScriptStep>::err(step_error(idx, "unknown step '" + n.Scalar() + "'"));
  }

  if (!n.IsMap() || n.size() != 1) {
    return Result<ScriptStep>::err(step_error(idx, "step must be a single-key map"));
  }

  const auto it = n.begin();
  const std::string action = it->first.as<std::string>();
  const YAML::Node body = it->second;

  if (action == "admit") {
    step.action = ScriptStep::Action::kAdmit;
    auto op_r = parse_operation(body, idx);
    if (!op_r.ok()) return Result<ScriptStep>::err(op_r.status());
    step.op = op_r.take_value();
    if (body["label"]) step.label = body["label"].as<std::string>();
  } else if (action == "grant" || action == "revoke") {
    step.action = action == "grant" ? ScriptStep::Action::kGrant : ScriptStep::Action::kRevoke;
    const Status st = parse_entity_capability(body, idx, step);
    if (!st.ok()) return Result<ScriptStep>::err(st);
  } else if (action == "release") {
    step.action = ScriptStep::Action::kRelease;
    if (!body.IsScalar()) return Result<ScriptStep>::err(step_error(idx, "release takes an allocation label"));
    step.label = body.as<std::string>();
  } else if (action == "teardown") {
    step.action = ScriptStep::Action::kTeardown;
    if (!body.IsScalar()) return Result<ScriptStep>::err(step_error(idx, "teardown takes an entity id"));
    step.entity = body.as<std::string>();
  } else if (action == "stats") {
    step.action = ScriptStep::Action::kStats;
  } else {
    return Result<ScriptStep>::err(step_error(idx, "unknown action '" + action + "'"));
  }

  return Result<ScriptStep>::ok(std::move(step));
}

}  // namespace

ScriptOperationSource::ScriptOperationSource(ScriptSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status ScriptOperationSource::open() {
  close();

  YAML::Node doc;
  try {
    if (!cfg_.inline_yaml.empty()) {
      doc = YAML::Load(cfg_.inline_yaml);
    } else {
      if (cfg_.path.empty()) return Status::invalid_argument("ScriptOperationSource: path is empty");
      std::error_code ec;
      if (!std::filesystem::exists(cfg_.path, ec)) {
        return Status::not_found("ScriptOperationSource: script not found: " + cfg_.path);
      }
      doc = YAML::LoadFile(cfg_.path);
    }
  } catch (const YAML::Exception& e) {
    return Status::parse_error(std::string("ScriptOperationSource: YAML parse error: ") + e.what());
  }

  const YAML::Node steps = doc.IsMap() ? doc["steps"] : YAML::Node();
  if (!steps || !steps.IsSequence()) {
    return Status::parse_error("ScriptOperationSource: missing top-level 'steps' sequence");
  }

  std::vector<ScriptStep> parsed;
  parsed.reserve(steps.size());
  try {
    for (std::size_t i = 0; i < steps.size(); ++i) {
      auto step_r = parse_step(steps[i], i);
      if (!step_r.ok()) return step_r.status();
      parsed.push_back(step_r.take_value());
    }
  } catch (const YAML::Exception& e) {
    return Status::parse_error(std::string("ScriptOperationSource: bad value: ") + e.what());
  }

  steps_ = std::move(parsed);
  idx_ = 0;
  opened_ = true;
  return Status::ok_status();
}

Result<ScriptStep> ScriptOperationSource::next() {
  if (!opened_) {
    return Result<ScriptStep>::err(Status::invalid_argument("ScriptOperationSource::next: not opened"));
  }
  if (idx_ >= steps_.size()) {
    return Result<ScriptStep>::err(Status::out_of_range("eof"));
  }
  return Result<ScriptStep>::ok(steps_[idx_++]);
}

void ScriptOperationSource::close() {
  opened_ = false;
  steps_.clear();
  idx_ = 0;
}

}  // namespace gk
