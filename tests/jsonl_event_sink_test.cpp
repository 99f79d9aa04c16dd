// File: tests/jsonl_event_sink_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "gk/core/events/jsonl_event_sink.hpp"
#include "test_support.hpp"

namespace gk {
namespace {

using fixtures::read_lines;
using fixtures::TempDir;

RunInfo make_run(const TempDir& dir, std::int64_t wall, std::size_t keep = 50) {
  RunInfo run;
  run.engine_id = "lab";
  run.instance_id = "abc123";
  run.config_path = "configs/lab.yaml";
  run.out_dir = (dir.path() / "out").string();
  run.config_hash = "00ff";
  run.keep_last_runs = keep;
  run.wall_start_time_ns = TimestampNs{wall};
  return run;
}

std::size_t count_run_files(const std::filesystem::path& dir) {
  std::size_t n = 0;
  for (const auto& it : std::filesystem::directory_iterator(dir)) {
    const std::string name = it.path().filename().string();
    if (name != "events_latest.jsonl" && name.rfind("events_", 0) == 0) ++n;
  }
  return n;
}

TEST(JsonlEventSinkTest, EscapesControlCharacters) {
  EXPECT_EQ(JsonlEventSink::json_escape("plain"), "plain");
  EXPECT_EQ(JsonlEventSink::json_escape("a\"b\\c"), "a\\\"b\\\\c");
  EXPECT_EQ(JsonlEventSink::json_escape("line\nnext\ttab"), "line\\nnext\\ttab");
  EXPECT_EQ(JsonlEventSink::json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonlEventSinkTest, WritesHeaderAndEventsToBothFiles) {
  const TempDir dir;
  JsonlEventSink sink;
  ASSERT_TRUE(sink.open(make_run(dir, 1000)).ok());

  Event e;
  e.type = "rejected";
  e.t_ns = TimestampNs{5};
  e.entity = "guest";
  e.subject = "CapabilityDenied";
  e.message = "entity 'guest' lacks capability \"X\"";
  e.fields.emplace_back("sequence", "7");
  ASSERT_TRUE(sink.emit(e).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(lines[0].find("\"engine_id\":\"lab\""), std::string::npos);
  EXPECT_NE(lines[0].find("\"instance_id\":\"abc123\""), std::string::npos);
  EXPECT_NE(lines[0].find("\"config_hash\":\"00ff\""), std::string::npos);

  EXPECT_NE(lines[1].find("\"type\":\"rejected\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"entity\":\"guest\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"sequence\":\"7\""), std::string::npos);
  EXPECT_NE(lines[1].find("lacks capability \\\"X\\\""), std::string::npos);

  EXPECT_EQ(read_lines(sink.latest_path()), lines);
  EXPECT_EQ(std::filesystem::path(sink.path()).filename().string(), "events_1000.jsonl");
}

TEST(JsonlEventSinkTest, EmitBeforeOpenFails) {
  JsonlEventSink sink;
  Event e;
  e.type = "admitted";
  EXPECT_EQ(sink.emit(e).code(), Status::Code::kInvalidArgument);
}

TEST(JsonlEventSinkTest, PrunesOldRuns) {
  const TempDir dir;
  for (std::int64_t wall = 1; wall <= 5; ++wall) {
    JsonlEventSink sink;
    ASSERT_TRUE(sink.open(make_run(dir, wall, 3)).ok());
    sink.close();
  }

  const auto out = dir.path() / "out";
  EXPECT_EQ(count_run_files(out), 3u);
  EXPECT_TRUE(std::filesystem::exists(out / "events_5.jsonl"));
  EXPECT_TRUE(std::filesystem::exists(out / "events_3.jsonl"));
  EXPECT_FALSE(std::filesystem::exists(out / "events_2.jsonl"));
  EXPECT_TRUE(std::filesystem::exists(out / "events_latest.jsonl"));
}

}  // namespace
}  // namespace gk
