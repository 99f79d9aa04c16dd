// File: src/core/admission/admission_pipeline.cpp
#include "gk/core/admission/admission_pipeline.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

#include "gk/core/util/clock.hpp"
#include "gk/core/util/repro_hash.hpp"

namespace gk {

AdmissionPipeline::AdmissionPipeline(const Config& cfg, EventLedger& events,
                                     ResourceLedger& resources, CapabilityRegistry& capabilities)
    : events_(events),
      resources_(resources),
      capabilities_(capabilities),
      schema_(cfg.limits),
      causality_(events, cfg.strict_ordering),
      resource_(resources),
      security_(capabilities),
      gates_(cfg.capability_gates) {}

std::optional<CapabilityName> AdmissionPipeline::effective_capability(const PhysicsOperation& op) const {
  if (op.required_capability) return op.required_capability;
  if (op.kind.empty()) return std::nullopt;
  const auto it = gates_.find(op.kind);
  if (it == gates_.end()) return std::nullopt;
  return it->second;
}

void AdmissionPipeline::count_rejection(const ValidationFailure& f) {
  rejected_.fetch_add(1, std::memory_order_relaxed);
  const auto idx = static_cast<std::size_t>(f.kind());
  if (idx < violations_.size()) violations_[idx].fetch_add(1, std::memory_order_relaxed);
}

AdmitResult AdmissionPipeline::reject_(ValidationResult r) {
  ValidationFailure f(std::move(r));
  count_rejection(f);
  return AdmitResult::err(std::move(f));
}

AdmitResult AdmissionPipeline::admit(const PhysicsOperation& op) {
  // 1. Shape. Pure, no locks.
  ValidationResult shape = schema_.validate_operation_shape(op);
  if (!shape.passed()) return reject_(std::move(shape));

  const std::optional<CapabilityName> capability = effective_capability(op);
  const std::uint64_t content = compute_content_hash(op.entity, op.kind, op.payload);

  // 2-4. Fail fast against the current snapshot of each ledger.
  if (op.event) {
    ValidationResult r = causality_.validate_event(*op.event, content);
    if (!r.passed()) return reject_(std::move(r));
  }
  if (op.resource) {
    ValidationResult r = resource_.validate_allocation(op.entity, op.resource->kind, op.resource->amount);
    if (!r.passed()) return reject_(std::move(r));
  }
  if (capability) {
    ValidationResult r = security_.validate_capability(op.entity, capability);
    if (!r.passed()) return reject_(std::move(r));
  }

  // 5. Commit (or 6. reject) under locks.
  return commit_(op, capability, content);
}

AdmitResult AdmissionPipeline::commit_(const PhysicsOperation& op,
                                       const std::optional<CapabilityName>& capability,
                                       std::uint64_t content_hash) {
  // Fixed acquisition order: event ledger -> resource slot -> capability entry.
  EventLedger::WriteLock event_lock;
  if (op.event) event_lock = events_.write_lock();

  ResourceLedger::Slot* slot = nullptr;
  std::unique_lock<std::mutex> slot_lock;
  const bool allocates = op.resource && op.resource->amount > 0.0;
  if (allocates) {
    slot = resources_.slot(op.entity, op.resource->kind);
    if (slot) slot_lock = std::unique_lock<std::mutex>(slot->mu);
  }

  CapabilityRegistry::View view;
  if (capability) view = capabilities_.view(op.entity);

  // Re-check: another operation may have committed since the fast pass.
  if (op.event) {
    ValidationResult r = causality_.check_locked(op.event->id, op.event->parents,
                                                 op.event->timestamp, content_hash);
    if (!r.passed()) return reject_(std::move(r));
  }
  if (allocates) {
    ValidationResult r = ResourceValidator::check_locked(slot, op.resource->kind, op.resource->amount);
    if (!r.passed()) return reject_(std::move(r));
  }
  if (capability) {
    ValidationResult r = SecurityValidator::check_view(view, op.entity, capability);
    if (!r.passed()) return reject_(std::move(r));
  }

  // Every check passed with every lock held; mutations below cannot fail.
  AdmissionReceipt receipt;
  receipt.sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);
  receipt.entity = op.entity;
  receipt.capability = capability;
  receipt.time_limit_ns = op.time_limit_ns;
  receipt.admitted_at = wall_now_epoch_ns();
  receipt.payload = op.payload;

  if (op.event) {
    EventNode node;
    node.id = op.event->id;
    node.timestamp = op.event->timestamp;
    node.parents = op.event->parents;
    node.content_hash = content_hash;
    events_.insert_locked(std::move(node));
    receipt.event_id = op.event->id;
  }

  if (allocates) {
    // check_locked() refuses a positive amount without a slot.
    const ResourceAllocation a = resources_.commit_locked(*slot, op.entity, op.resource->kind,
                                                          op.resource->amount, receipt.admitted_at);
    receipt.allocation = a.ref;
  }

  admitted_.fetch_add(1, std::memory_order_relaxed);
  return AdmitResult::ok(std::move(receipt));
}

Result<ResourceAllocation, ValidationFailure> AdmissionPipeline::release(const AllocationRef& ref) {
  auto released = resources_.release(ref);
  if (!released) {
    ValidationFailure f(ValidationResult::fail(Violation::unknown_allocation(ref)));
    const auto idx = static_cast<std::size_t>(f.kind());
    violations_[idx].fetch_add(1, std::memory_order_relaxed);
    return Result<ResourceAllocation, ValidationFailure>::err(std::move(f));
  }
  return Result<ResourceAllocation, ValidationFailure>::ok(std::move(*released));
}

AdmissionCounters AdmissionPipeline::counters() const {
  AdmissionCounters c;
  c.admitted = admitted_.load(std::memory_order_relaxed);
  c.rejected = rejected_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < violations_.size(); ++i) {
    c.violations[i] = violations_[i].load(std::memory_order_relaxed);
  }
  return c;
}

}  // namespace gk
