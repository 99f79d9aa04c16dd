// File: tests/config_loader_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "gk/core/util/config_loader.hpp"
#include "gk/core/util/repro_hash.hpp"
#include "test_support.hpp"

namespace gk {
namespace {

using fixtures::TempDir;

constexpr const char* kFullConfig = R"(
engine_id: lab
strict_ordering: true
limits:
  max_time_limit_s: 60
entities:
  - id: analyst
    budgets: {memory: 1024, cpu: 4}
    capabilities: [CodeAnalysis]
  - id: guest
    budgets: {energy: 0.5}
capability_gates:
  code_review: CodeAnalysis
output:
  out_dir: runs
  keep_last_runs: 3
logging:
  level: debug
)";

TEST(ConfigLoaderTest, MapsEveryField) {
  const auto r = load_config_from_string(kFullConfig);
  ASSERT_TRUE(r.ok()) << r.status().message();
  const Config& cfg = r.value();

  EXPECT_EQ(cfg.engine_id, "lab");
  EXPECT_TRUE(cfg.strict_ordering);
  EXPECT_EQ(cfg.limits.max_time_limit_ns, seconds_to_ns(60.0));
  ASSERT_EQ(cfg.entities.size(), 2u);
  EXPECT_EQ(cfg.entities[0].id, "analyst");
  EXPECT_DOUBLE_EQ(cfg.entities[0].budgets.at(ResourceKind::kMemory), 1024.0);
  EXPECT_DOUBLE_EQ(cfg.entities[0].budgets.at(ResourceKind::kCpu), 4.0);
  EXPECT_EQ(cfg.entities[0].capabilities, std::vector<CapabilityName>{"CodeAnalysis"});
  EXPECT_DOUBLE_EQ(cfg.entities[1].budgets.at(ResourceKind::kEnergy), 0.5);
  EXPECT_EQ(cfg.capability_gates.at("code_review"), "CodeAnalysis");
  EXPECT_EQ(cfg.output.out_dir, "runs");
  EXPECT_EQ(cfg.output.keep_last_runs, 3u);
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(ConfigLoaderTest, DefaultsApply) {
  const auto r = load_config_from_string("entities: []\n");
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->engine_id, "engine");
  EXPECT_FALSE(r->strict_ordering);
  EXPECT_EQ(r->limits.max_time_limit_ns, seconds_to_ns(300.0));
  EXPECT_EQ(r->output.keep_last_runs, 50u);
}

TEST(ConfigLoaderTest, MissingBudgetsIsSchemaInvalid) {
  const auto r = load_config_from_string("entities:\n  - id: analyst\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kSchemaInvalid);
  EXPECT_NE(r.status().message().find("entities[0].budgets"), std::string::npos);
}

TEST(ConfigLoaderTest, NanBudgetIsSchemaInvalid) {
  const auto r = load_config_from_string("entities:\n  - id: a\n    budgets: {cpu: .nan}\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kSchemaInvalid);
}

TEST(ConfigLoaderTest, HugeTimeLimitIsSchemaInvalid) {
  const auto r = load_config_from_string("entities: []\nlimits: {max_time_limit_s: 1e12}\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kSchemaInvalid);
  EXPECT_NE(r.status().message().find("limits.max_time_limit_s"), std::string::npos);
  EXPECT_EQ(r.status().message().find("must be >= 0"), std::string::npos);
}

TEST(ConfigLoaderTest, MalformedYamlIsParseError) {
  const auto r = load_config_from_string("entities: [\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
}

TEST(ConfigLoaderTest, MissingFileIsNotFound) {
  const TempDir dir;
  const auto r = load_config((dir.path() / "absent.yaml").string());
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kNotFound);
}

TEST(ConfigLoaderTest, IncludesAreLayered) {
  const TempDir dir;
  dir.write("base.yaml", R"(
engine_id: base
limits: {max_time_limit_s: 10}
entities:
  - id: base-entity
    budgets: {cpu: 1}
output: {out_dir: base-out, keep_last_runs: 7}
)");
  const std::string main_path = dir.write("main.yaml", R"(
includes: [base.yaml]
engine_id: main
entities:
  - id: main-entity
    budgets: {memory: 2}
output: {out_dir: main-out}
)");

  const auto r = load_config(main_path);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->engine_id, "main");
  EXPECT_EQ(r->limits.max_time_limit_ns, seconds_to_ns(10.0));
  // Sequences are replaced, maps are merged.
  ASSERT_EQ(r->entities.size(), 1u);
  EXPECT_EQ(r->entities[0].id, "main-entity");
  EXPECT_EQ(r->output.out_dir, "main-out");
  EXPECT_EQ(r->output.keep_last_runs, 7u);
}

TEST(ConfigLoaderTest, IncludeCycleIsRejected) {
  const TempDir dir;
  dir.write("a.yaml", "includes: [b.yaml]\nentities: []\n");
  dir.write("b.yaml", "includes: [a.yaml]\n");
  const auto r = load_config((dir.path() / "a.yaml").string());
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST(ConfigLoaderTest, ConfigHashTracksContent) {
  const auto a = load_config_from_string(kFullConfig);
  const auto b = load_config_from_string(kFullConfig);
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  EXPECT_EQ(compute_config_hash(*a), compute_config_hash(*b));

  Config changed = *a;
  changed.entities[1].budgets[ResourceKind::kEnergy] = 0.75;
  EXPECT_NE(compute_config_hash(*a), compute_config_hash(changed));
}

}  // namespace
}  // namespace gk
