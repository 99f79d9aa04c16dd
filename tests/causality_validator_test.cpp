// File: tests/causality_validator_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "gk/core/ledger/event_ledger.hpp"
#include "gk/core/validate/causality_validator.hpp"

namespace gk {
namespace {

void insert(EventLedger& ledger, const EventId& id, std::vector<EventId> parents, std::int64_t ts,
            std::uint64_t content = 0) {
  EventNode n;
  n.id = id;
  n.parents = std::move(parents);
  n.timestamp = TimestampNs{ts};
  n.content_hash = content;
  const auto lk = ledger.write_lock();
  ledger.insert_locked(std::move(n));
}

TEST(EventLedgerTest, InsertAssignsArenaOrder) {
  EventLedger ledger;
  insert(ledger, "a", {}, 1);
  insert(ledger, "b", {"a"}, 2);
  EXPECT_EQ(ledger.size(), 2u);
  EXPECT_TRUE(ledger.contains("a"));
  EXPECT_FALSE(ledger.contains("z"));

  const auto b = ledger.find("b");
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->seq, 1u);
  EXPECT_EQ(b->parents, std::vector<EventId>{"a"});
}

TEST(EventLedgerTest, AncestorsAreTransitive) {
  EventLedger ledger;
  insert(ledger, "root", {}, 0);
  insert(ledger, "l", {"root"}, 1);
  insert(ledger, "r", {"root"}, 1);
  insert(ledger, "join", {"l", "r"}, 2);

  std::vector<EventId> anc = ledger.ancestors("join");
  ASSERT_EQ(anc.size(), 3u);
  EXPECT_EQ(anc.back(), "root");  // nearest first
  std::sort(anc.begin(), anc.end());
  EXPECT_EQ(anc, (std::vector<EventId>{"l", "r", "root"}));

  EXPECT_TRUE(ledger.ancestors("root").empty());
  EXPECT_TRUE(ledger.ancestors("missing").empty());
}

TEST(CausalityValidatorTest, RootEventPasses) {
  EventLedger ledger;
  const CausalityValidator v(ledger, false);
  EXPECT_TRUE(v.validate_event("e1", {}, TimestampNs{100}).passed());
}

TEST(CausalityValidatorTest, ChildAfterParentPasses) {
  EventLedger ledger;
  insert(ledger, "e1", {}, 100);
  const CausalityValidator v(ledger, false);
  EXPECT_TRUE(v.validate_event("e2", {"e1"}, TimestampNs{150}).passed());
}

TEST(CausalityValidatorTest, TimestampBeforeParentIsRejected) {
  EventLedger ledger;
  insert(ledger, "e1", {}, 100);
  const CausalityValidator v(ledger, false);

  const ValidationResult r = v.validate_event("e3", {"e1"}, TimestampNs{50});
  ASSERT_FALSE(r.passed());
  EXPECT_EQ(r.violations().front().kind, ViolationKind::kCausalOrderViolation);
  EXPECT_EQ(ledger.size(), 1u);
}

TEST(CausalityValidatorTest, UsesLatestParentTimestamp) {
  EventLedger ledger;
  insert(ledger, "a", {}, 10);
  insert(ledger, "b", {}, 90);
  const CausalityValidator v(ledger, false);

  EXPECT_FALSE(v.validate_event("c", {"a", "b"}, TimestampNs{50}).passed());
  EXPECT_TRUE(v.validate_event("c", {"a", "b"}, TimestampNs{90}).passed());
}

TEST(CausalityValidatorTest, ReportsEveryUnknownParent) {
  EventLedger ledger;
  insert(ledger, "known", {}, 0);
  const CausalityValidator v(ledger, false);

  const ValidationResult r = v.validate_event("e", {"x", "known", "y"}, TimestampNs{5});
  ASSERT_EQ(r.violations().size(), 2u);
  EXPECT_EQ(r.violations()[0].kind, ViolationKind::kUnknownParent);
  EXPECT_EQ(r.violations()[0].subject, "x");
  EXPECT_EQ(r.violations()[1].subject, "y");
}

TEST(CausalityValidatorTest, DuplicateIdIsRejected) {
  EventLedger ledger;
  insert(ledger, "e1", {}, 100);
  const CausalityValidator v(ledger, false);

  const ValidationResult r = v.validate_event("e1", {}, TimestampNs{200});
  ASSERT_FALSE(r.passed());
  EXPECT_EQ(r.violations().front().kind, ViolationKind::kDuplicateEvent);
}

TEST(CausalityValidatorTest, TiesAllowedWhenNotStrict) {
  EventLedger ledger;
  insert(ledger, "e1", {}, 100, 1);
  const CausalityValidator v(ledger, false);
  EXPECT_TRUE(v.validate_event("e2", {"e1"}, TimestampNs{100}, 2).passed());
}

TEST(CausalityValidatorTest, StrictTieNeedsMatchingContent) {
  EventLedger ledger;
  insert(ledger, "e1", {}, 100, 0xabc);
  const CausalityValidator v(ledger, true);

  EXPECT_TRUE(v.validate_event("e2", {"e1"}, TimestampNs{100}, 0xabc).passed());
  EXPECT_TRUE(v.validate_event("e2", {"e1"}, TimestampNs{101}, 0xdef).passed());

  const ValidationResult r = v.validate_event("e2", {"e1"}, TimestampNs{100}, 0xdef);
  ASSERT_FALSE(r.passed());
  EXPECT_EQ(r.violations().front().kind, ViolationKind::kCausalOrderViolation);
}

TEST(CausalityValidatorTest, NeverMutatesLedger) {
  EventLedger ledger;
  const CausalityValidator v(ledger, false);
  EXPECT_TRUE(v.validate_event("e1", {}, TimestampNs{1}).passed());
  EXPECT_TRUE(v.validate_event("e1", {}, TimestampNs{1}).passed());
  EXPECT_EQ(ledger.size(), 0u);
}

}  // namespace
}  // namespace gk
