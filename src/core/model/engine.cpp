// File: src/core/model/engine.cpp
#include "gk/core/model/engine.hpp"

#include <random>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "gk/core/util/clock.hpp"
#include "gk/core/util/logging.hpp"
#include "gk/core/util/repro_hash.hpp"
#include "gk/core/validate/schema_validator.hpp"

namespace gk {
namespace {

std::string format_amount(double v) { return fmt::format("{:g}", v); }

}  // namespace

Result<std::unique_ptr<Engine>> Engine::create(Config cfg, std::string config_path) {
  const ValidationResult r = SchemaValidator::validate_schema(cfg);
  if (!r.passed()) {
    logger()->error("configuration rejected: {}", r.summary());
    return Result<std::unique_ptr<Engine>>::err(Status::schema_invalid(r.summary()));
  }
  return Result<std::unique_ptr<Engine>>::ok(
      std::unique_ptr<Engine>(new Engine(std::move(cfg), std::move(config_path))));
}

Engine::Engine(Config cfg, std::string config_path)
    : cfg_(std::move(cfg)),
      config_path_(std::move(config_path)),
      instance_id_(make_instance_id()),
      config_hash_(compute_config_hash(cfg_)),
      resources_(cfg_.entities),
      capabilities_(cfg_.entities),
      pipeline_(cfg_, events_, resources_, capabilities_) {}

Engine::~Engine() { stop(); }

std::string Engine::make_instance_id() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd() ^
                      static_cast<std::uint64_t>(wall_now_epoch_ns().ns));
  return to_hex(gen()) + to_hex(gen());
}

TimestampNs Engine::since_start_ns() const {
  const auto now = std::chrono::steady_clock::now();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

Status Engine::start(EventSink* sink) {
  const std::unique_lock<std::shared_mutex> lk(lifecycle_mu_);
  if (running_) return Status::invalid_argument("engine already started");

  t0_steady_ = std::chrono::steady_clock::now();

  if (sink) {
    RunInfo run;
    run.engine_id = cfg_.engine_id;
    run.instance_id = instance_id_;
    run.config_path = config_path_;
    run.out_dir = cfg_.output.out_dir;
    run.config_hash = config_hash_;
    run.keep_last_runs = cfg_.output.keep_last_runs;

    // Contract: logical time starts at zero. Wall time is absolute epoch.
    run.start_time_ns = TimestampNs{0};
    run.wall_start_time_ns = wall_now_epoch_ns();

    const std::lock_guard<std::mutex> slk(sink_mu_);
    GK_RETURN_IF_ERROR(sink->open(run));
    sink_ = sink;
  }

  running_ = true;
  logger()->info("engine '{}' started: instance={} config_hash={} entities={} strict_ordering={}",
                 cfg_.engine_id, instance_id_, config_hash_, cfg_.entities.size(),
                 cfg_.strict_ordering);
  return Status::ok_status();
}

void Engine::stop() {
  const std::unique_lock<std::shared_mutex> lk(lifecycle_mu_);
  if (!running_) return;
  running_ = false;

  // Release every live allocation. Capabilities and events stay as they are.
  std::size_t released = 0;
  for (const auto& e : cfg_.entities) released += resources_.release_all(e.id).size();

  const EngineStatistics s = statistics();
  logger()->info("engine '{}' stopped: events={} admitted={} rejected={} released_on_stop={}",
                 cfg_.engine_id, s.event_count, s.admission.admitted, s.admission.rejected,
                 released);

  emit_statistics_(s);

  Event e;
  e.type = "run_stopped";
  e.message = "released " + std::to_string(released) + " allocations";
  emit_(std::move(e));

  const std::lock_guard<std::mutex> slk(sink_mu_);
  if (sink_) {
    const Status st = sink_->flush();
    if (!st.ok()) logger()->error("event sink flush failed: {}", st.message());
    sink_->close();
    sink_ = nullptr;
  }
}

bool Engine::running() const {
  const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
  return running_;
}

AdmitResult Engine::admit(const PhysicsOperation& op) {
  AdmitResult result = [&] {
    const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
    if (!running_) {
      ValidationFailure f(ValidationResult::fail(Violation::engine_stopped()));
      pipeline_.count_rejection(f);
      return AdmitResult::err(std::move(f));
    }
    return pipeline_.admit(op);
  }();

  Event e;
  e.entity = op.entity;
  if (result.ok()) {
    const AdmissionReceipt& rc = result.value();
    logger()->debug("admitted #{} entity={} kind={}", rc.sequence, op.entity, op.kind);
    e.type = "admitted";
    e.fields.emplace_back("sequence", std::to_string(rc.sequence));
    if (rc.event_id) e.fields.emplace_back("event_id", *rc.event_id);
    if (rc.allocation) e.fields.emplace_back("allocation", to_string(*rc.allocation));
    if (rc.capability) e.fields.emplace_back("capability", *rc.capability);
  } else {
    const ValidationFailure& f = result.error();
    logger()->warn("rejected operation from '{}': {}", op.entity, f.message());
    e.type = "rejected";
    e.subject = violation_kind_name(f.kind());
    e.message = f.message();
  }
  emit_(std::move(e));

  return result;
}

Status Engine::grant(const EntityId& entity, const CapabilityName& capability) {
  if (entity.empty() || capability.empty()) {
    return Status::invalid_argument("grant requires an entity and a capability");
  }
  bool changed = false;
  {
    const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
    if (!running_) return Status::invalid_argument("engine is not running");
    changed = capabilities_.grant(entity, capability);
  }
  logger()->info("grant {} -> '{}'{}", capability, entity, changed ? "" : " (already held)");
  if (changed) {
    Event e;
    e.type = "capability_granted";
    e.entity = entity;
    e.subject = capability;
    emit_(std::move(e));
  }
  return Status::ok_status();
}

Status Engine::revoke(const EntityId& entity, const CapabilityName& capability) {
  if (entity.empty() || capability.empty()) {
    return Status::invalid_argument("revoke requires an entity and a capability");
  }
  bool changed = false;
  {
    const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
    if (!running_) return Status::invalid_argument("engine is not running");
    changed = capabilities_.revoke(entity, capability);
  }
  logger()->info("revoke {} from '{}'{}", capability, entity, changed ? "" : " (not held)");
  if (changed) {
    Event e;
    e.type = "capability_revoked";
    e.entity = entity;
    e.subject = capability;
    emit_(std::move(e));
  }
  return Status::ok_status();
}

Result<ResourceAllocation, ValidationFailure> Engine::release(const AllocationRef& ref) {
  using R = Result<ResourceAllocation, ValidationFailure>;
  R result = [&] {
    const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
    if (!running_) return R::err(ValidationFailure(ValidationResult::fail(Violation::engine_stopped())));
    return pipeline_.release(ref);
  }();

  if (!result.ok()) {
    logger()->warn("release {} failed: {}", to_string(ref), result.error().message());
    return result;
  }

  logger()->info("released {} ({} {})", to_string(ref), format_amount(result->amount),
                 resource_kind_name(ref.kind));
  Event e;
  e.type = "released";
  e.entity = ref.entity;
  e.subject = to_string(ref);
  e.fields.emplace_back("amount", format_amount(result->amount));
  emit_(std::move(e));
  return result;
}

Result<std::size_t> Engine::teardown_entity(const EntityId& entity) {
  if (entity.empty()) return Result<std::size_t>::err(Status::invalid_argument("teardown requires an entity"));

  std::size_t released = 0;
  std::size_t revoked = 0;
  {
    const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
    if (!running_) return Result<std::size_t>::err(Status::invalid_argument("engine is not running"));
    released = resources_.release_all(entity).size();
    revoked = capabilities_.revoke_all(entity);
  }

  logger()->info("teardown '{}': released {} allocations, revoked {} capabilities", entity,
                 released, revoked);
  Event e;
  e.type = "entity_teardown";
  e.entity = entity;
  e.fields.emplace_back("released", std::to_string(released));
  e.fields.emplace_back("revoked", std::to_string(revoked));
  emit_(std::move(e));
  return Result<std::size_t>::ok(released);
}

EngineStatistics Engine::statistics() const {
  EngineStatistics s;
  s.event_count = events_.size();
  s.resource_usage = resources_.usage_snapshot();
  for (const auto& u : s.resource_usage) s.live_allocations += u.live_allocations;
  s.capability_grants = capabilities_.grant_count();
  s.admission = pipeline_.counters();
  return s;
}

EngineState Engine::engine_state() const {
  EngineState st;
  st.engine_id = cfg_.engine_id;
  st.instance_id = instance_id_;
  st.config_hash = config_hash_;
  {
    const std::shared_lock<std::shared_mutex> lk(lifecycle_mu_);
    st.running = running_;
    if (running_) {
      st.uptime = std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now() - t0_steady_);
    }
  }
  st.stats = statistics();
  return st;
}

void Engine::emit_(Event e) {
  const std::lock_guard<std::mutex> lk(sink_mu_);
  if (!sink_) return;
  e.t_ns = since_start_ns();
  e.t_wall_ns = wall_now_epoch_ns();
  const Status st = sink_->emit(e);
  if (!st.ok()) logger()->error("event sink emit failed: {}", st.message());
}

void Engine::emit_statistics_(const EngineStatistics& s) {
  Event e;
  e.type = "statistics";
  e.fields.emplace_back("events", std::to_string(s.event_count));
  e.fields.emplace_back("admitted", std::to_string(s.admission.admitted));
  e.fields.emplace_back("rejected", std::to_string(s.admission.rejected));
  e.fields.emplace_back("live_allocations", std::to_string(s.live_allocations));
  e.fields.emplace_back("capability_grants", std::to_string(s.capability_grants));
  for (std::size_t i = 0; i < kViolationKindCount; ++i) {
    if (s.admission.violations[i] == 0) continue;
    e.fields.emplace_back(violation_kind_name(static_cast<ViolationKind>(i)),
                          std::to_string(s.admission.violations[i]));
  }
  emit_(std::move(e));
}

}  // namespace gk
