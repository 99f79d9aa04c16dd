// File: tests/admission_pipeline_test.cpp
#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "gk/core/admission/admission_pipeline.hpp"
#include "test_support.hpp"

namespace gk {
namespace {

using fixtures::capability_op;
using fixtures::event_op;
using fixtures::resource_op;

class AdmissionPipelineTest : public ::testing::Test {
 protected:
  explicit AdmissionPipelineTest(Config cfg = fixtures::default_config())
      : cfg_(std::move(cfg)),
        resources_(cfg_.entities),
        capabilities_(cfg_.entities),
        pipeline_(cfg_, events_, resources_, capabilities_) {}

  ViolationKind rejected_kind(const PhysicsOperation& op) {
    const AdmitResult r = pipeline_.admit(op);
    EXPECT_FALSE(r.ok());
    return r.ok() ? ViolationKind::kEngineStopped : r.error().kind();
  }

  Config cfg_;
  EventLedger events_;
  ResourceLedger resources_;
  CapabilityRegistry capabilities_;
  AdmissionPipeline pipeline_;
};

TEST_F(AdmissionPipelineTest, RootEventThenChild) {
  const AdmitResult a = pipeline_.admit(event_op("analyst", "e1", {}, 100));
  ASSERT_TRUE(a.ok()) << a.error().message();
  EXPECT_EQ(a->event_id, std::optional<EventId>("e1"));

  const AdmitResult b = pipeline_.admit(event_op("analyst", "e2", {"e1"}, 150));
  ASSERT_TRUE(b.ok()) << b.error().message();
  EXPECT_GT(b->sequence, a->sequence);
  EXPECT_EQ(events_.size(), 2u);
}

TEST_F(AdmissionPipelineTest, OutOfOrderEventIsRejected) {
  ASSERT_TRUE(pipeline_.admit(event_op("analyst", "e1", {}, 100)).ok());
  EXPECT_EQ(rejected_kind(event_op("analyst", "e3", {"e1"}, 50)), ViolationKind::kCausalOrderViolation);
  EXPECT_FALSE(events_.contains("e3"));
}

TEST_F(AdmissionPipelineTest, SecondAllocationOverBudget) {
  const AdmitResult first = pipeline_.admit(resource_op("analyst", ResourceKind::kMemory, 6.0));
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(first->allocation.has_value());

  const AdmitResult second = pipeline_.admit(resource_op("analyst", ResourceKind::kMemory, 6.0));
  ASSERT_FALSE(second.ok());
  const Violation& v = second.error().primary();
  EXPECT_EQ(v.kind, ViolationKind::kInsufficientResource);
  EXPECT_DOUBLE_EQ(v.required, 6.0);
  EXPECT_DOUBLE_EQ(v.available, 4.0);
  EXPECT_DOUBLE_EQ(resources_.usage("analyst", ResourceKind::kMemory), 6.0);
}

TEST_F(AdmissionPipelineTest, MissingCapabilityIsDenied) {
  EXPECT_EQ(rejected_kind(capability_op("guest", "CodeAnalysis")), ViolationKind::kCapabilityDenied);
  EXPECT_TRUE(pipeline_.admit(capability_op("analyst", "CodeAnalysis")).ok());
}

TEST_F(AdmissionPipelineTest, DuplicateEventIsRejected) {
  ASSERT_TRUE(pipeline_.admit(event_op("analyst", "e1", {}, 100)).ok());
  EXPECT_EQ(rejected_kind(event_op("analyst", "e1", {}, 200)), ViolationKind::kDuplicateEvent);
  EXPECT_EQ(events_.find("e1")->timestamp, TimestampNs{100});
}

TEST_F(AdmissionPipelineTest, ResourceFailureLeavesEventUncommitted) {
  PhysicsOperation op = event_op("guest", "e1", {}, 0);
  op.resource = ResourceRequest{ResourceKind::kMemory, 5.0};
  EXPECT_EQ(rejected_kind(op), ViolationKind::kInsufficientResource);
  EXPECT_FALSE(events_.contains("e1"));
  EXPECT_EQ(resources_.live_count(), 0u);
}

TEST_F(AdmissionPipelineTest, SecurityFailureLeavesEventAndResourceUncommitted) {
  PhysicsOperation op = event_op("guest", "e1", {}, 0);
  op.resource = ResourceRequest{ResourceKind::kMemory, 1.0};
  op.required_capability = "CodeAnalysis";
  EXPECT_EQ(rejected_kind(op), ViolationKind::kCapabilityDenied);
  EXPECT_FALSE(events_.contains("e1"));
  EXPECT_DOUBLE_EQ(resources_.usage("guest", ResourceKind::kMemory), 0.0);
}

TEST_F(AdmissionPipelineTest, SchemaFailureStopsBeforeOtherStages) {
  PhysicsOperation op = event_op("analyst", "e1", {"missing"}, 0);
  op.resource = ResourceRequest{ResourceKind::kMemory, -3.0};
  EXPECT_EQ(rejected_kind(op), ViolationKind::kSchemaInvalid);
}

TEST_F(AdmissionPipelineTest, CausalityIsCheckedBeforeResources) {
  PhysicsOperation op = event_op("guest", "e2", {"missing"}, 0);
  op.resource = ResourceRequest{ResourceKind::kMemory, 50.0};
  EXPECT_EQ(rejected_kind(op), ViolationKind::kUnknownParent);
}

TEST_F(AdmissionPipelineTest, EmptyOperationIsAdmitted) {
  PhysicsOperation op;
  op.entity = "guest";
  op.payload = "noop";
  const AdmitResult r = pipeline_.admit(op);
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(r->event_id.has_value());
  EXPECT_FALSE(r->allocation.has_value());
  EXPECT_FALSE(r->capability.has_value());
  EXPECT_EQ(r->payload, "noop");
}

TEST_F(AdmissionPipelineTest, ZeroAmountCommitsNoAllocation) {
  const AdmitResult r = pipeline_.admit(resource_op("stranger", ResourceKind::kCpu, 0.0));
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(r->allocation.has_value());
  EXPECT_EQ(resources_.live_count(), 0u);
}

TEST_F(AdmissionPipelineTest, KindGateRequiresCapability) {
  PhysicsOperation op;
  op.entity = "guest";
  op.kind = "code_review";
  EXPECT_EQ(pipeline_.effective_capability(op), std::optional<CapabilityName>("CodeAnalysis"));
  EXPECT_EQ(rejected_kind(op), ViolationKind::kCapabilityDenied);

  op.entity = "analyst";
  const AdmitResult r = pipeline_.admit(op);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->capability, std::optional<CapabilityName>("CodeAnalysis"));

  op.kind = "ungated";
  EXPECT_FALSE(pipeline_.effective_capability(op).has_value());
}

TEST_F(AdmissionPipelineTest, ExplicitCapabilityOverridesGate) {
  PhysicsOperation op = capability_op("guest", "Browse");
  op.kind = "code_review";
  EXPECT_EQ(pipeline_.effective_capability(op), std::optional<CapabilityName>("Browse"));
  capabilities_.grant("guest", "Browse");
  EXPECT_TRUE(pipeline_.admit(op).ok());
}

TEST_F(AdmissionPipelineTest, TimeLimitIsBounded) {
  PhysicsOperation op;
  op.entity = "analyst";
  op.time_limit_ns = seconds_to_ns(30.0);
  const AdmitResult ok = pipeline_.admit(op);
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(ok->time_limit_ns, std::optional<DurationNs>(seconds_to_ns(30.0)));

  op.time_limit_ns = seconds_to_ns(301.0);
  EXPECT_EQ(rejected_kind(op), ViolationKind::kTimeLimitExceeded);
}

TEST_F(AdmissionPipelineTest, ReleaseReturnsHeadroom) {
  const AdmitResult r = pipeline_.admit(resource_op("analyst", ResourceKind::kMemory, 10.0));
  ASSERT_TRUE(r.ok());
  const AllocationRef ref = *r->allocation;

  EXPECT_FALSE(pipeline_.admit(resource_op("analyst", ResourceKind::kMemory, 1.0)).ok());

  const auto released = pipeline_.release(ref);
  ASSERT_TRUE(released.ok());
  EXPECT_DOUBLE_EQ(released->amount, 10.0);
  EXPECT_TRUE(pipeline_.admit(resource_op("analyst", ResourceKind::kMemory, 1.0)).ok());

  const auto again = pipeline_.release(ref);
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error().kind(), ViolationKind::kUnknownAllocation);
}

TEST_F(AdmissionPipelineTest, CountersTrackOutcomes) {
  ASSERT_TRUE(pipeline_.admit(event_op("analyst", "e1", {}, 10)).ok());
  rejected_kind(event_op("analyst", "e1", {}, 10));
  rejected_kind(capability_op("guest", "CodeAnalysis"));
  rejected_kind(capability_op("guest", "CodeAnalysis"));

  const AdmissionCounters c = pipeline_.counters();
  EXPECT_EQ(c.admitted, 1u);
  EXPECT_EQ(c.rejected, 3u);
  EXPECT_EQ(c.violations[static_cast<std::size_t>(ViolationKind::kDuplicateEvent)], 1u);
  EXPECT_EQ(c.violations[static_cast<std::size_t>(ViolationKind::kCapabilityDenied)], 2u);
}

class StrictAdmissionPipelineTest : public AdmissionPipelineTest {
 protected:
  static Config strict_config() {
    Config cfg = fixtures::default_config();
    cfg.strict_ordering = true;
    return cfg;
  }
  StrictAdmissionPipelineTest() : AdmissionPipelineTest(strict_config()) {}
};

TEST_F(StrictAdmissionPipelineTest, TieWithDifferentContentIsRejected) {
  PhysicsOperation parent = event_op("analyst", "e1", {}, 100);
  parent.payload = "alpha";
  ASSERT_TRUE(pipeline_.admit(parent).ok());

  PhysicsOperation same = event_op("analyst", "e2", {"e1"}, 100);
  same.payload = "alpha";
  EXPECT_TRUE(pipeline_.admit(same).ok());

  PhysicsOperation different = event_op("analyst", "e3", {"e1"}, 100);
  different.payload = "beta";
  EXPECT_EQ(rejected_kind(different), ViolationKind::kCausalOrderViolation);

  different.event->timestamp = TimestampNs{101};
  EXPECT_TRUE(pipeline_.admit(different).ok());
}

class FractionalBudgetPipelineTest : public AdmissionPipelineTest {
 protected:
  static Config fractional_config() {
    Config cfg = fixtures::default_config();
    cfg.entities.push_back(fixtures::entity("e", {{ResourceKind::kMemory, 0.3}}));
    return cfg;
  }
  FractionalBudgetPipelineTest() : AdmissionPipelineTest(fractional_config()) {}
};

TEST_F(FractionalBudgetPipelineTest, ThreeTenthsFitInBudgetOfPointThree) {
  for (int i = 0; i < 3; ++i) {
    const AdmitResult r = pipeline_.admit(resource_op("e", ResourceKind::kMemory, 0.1));
    ASSERT_TRUE(r.ok()) << "allocation " << i << ": " << r.error().message();
  }
  EXPECT_EQ(rejected_kind(resource_op("e", ResourceKind::kMemory, 0.1)),
            ViolationKind::kInsufficientResource);
  EXPECT_EQ(resources_.live_count(), 3u);
}

}  // namespace
}  // namespace gk
