// File: src/apps/gk_node/main.cpp
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "gk/adapters/script/script_operation_source.hpp"
#include "gk/core/events/jsonl_event_sink.hpp"
#include "gk/core/io/operation_source.hpp"
#include "gk/core/model/engine.hpp"
#include "gk/core/util/config_loader.hpp"
#include "gk/core/util/logging.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string script_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--script" && i + 1 < argc) {
      a.script_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "gk_node\n"
            << "  --config <path>\n"
            << "  [--script <path>]   replay an operation script\n";
}

void print_statistics(const gk::EngineStatistics& s) {
  std::cout << "events=" << s.event_count << " admitted=" << s.admission.admitted
            << " rejected=" << s.admission.rejected << " live_allocations=" << s.live_allocations
            << " capability_grants=" << s.capability_grants << "\n";
  for (const auto& u : s.resource_usage) {
    if (u.budget == 0.0 && u.used == 0.0) continue;
    std::cout << "  " << u.entity << " " << gk::resource_kind_name(u.kind) << ": " << u.used
              << " / " << u.budget << " (" << u.live_allocations << " live)\n";
  }
  for (std::size_t i = 0; i < gk::kViolationKindCount; ++i) {
    if (s.admission.violations[i] == 0) continue;
    std::cout << "  " << gk::violation_kind_name(static_cast<gk::ViolationKind>(i)) << ": "
              << s.admission.violations[i] << "\n";
  }
}

// Runs one step; returns false only for failures that should stop the replay.
bool run_step(gk::Engine& engine, const gk::ScriptStep& step,
              std::map<std::string, gk::AllocationRef>& labels) {
  std::cout << "[" << step.index << "] " << gk::script_action_name(step.action) << ": ";

  switch (step.action) {
    case gk::ScriptStep::Action::kAdmit: {
      auto r = engine.admit(step.op);
      if (r.ok()) {
        const gk::AdmissionReceipt& rc = r.value();
        std::cout << "admitted #" << rc.sequence;
        if (rc.event_id) std::cout << " event=" << *rc.event_id;
        if (rc.allocation) {
          std::cout << " allocation=" << gk::to_string(*rc.allocation);
          if (!step.label.empty()) labels[step.label] = *rc.allocation;
        }
        std::cout << "\n";
      } else {
        std::cout << "rejected " << r.error().message() << "\n";
      }
      return true;
    }
    case gk::ScriptStep::Action::kGrant:
    case gk::ScriptStep::Action::kRevoke: {
      const gk::Status st = step.action == gk::ScriptStep::Action::kGrant
                                ? engine.grant(step.entity, step.capability)
                                : engine.revoke(step.entity, step.capability);
      std::cout << (st.ok() ? "ok" : st.message()) << "\n";
      return true;
    }
    case gk::ScriptStep::Action::kRelease: {
      const auto it = labels.find(step.label);
      if (it == labels.end()) {
        std::cout << "unknown label '" << step.label << "'\n";
        return true;
      }
      auto r = engine.release(it->second);
      std::cout << (r.ok() ? "released " + gk::to_string(it->second) : r.error().message()) << "\n";
      if (r.ok()) labels.erase(it);
      return true;
    }
    case gk::ScriptStep::Action::kTeardown: {
      auto r = engine.teardown_entity(step.entity);
      if (r.ok()) {
        std::cout << "released " << r.value() << " allocations\n";
      } else {
        std::cout << r.status().message() << "\n";
      }
      return true;
    }
    case gk::ScriptStep::Action::kStats:
      std::cout << "\n";
      print_statistics(engine.statistics());
      return true;
  }
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = gk::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << gk::status_code_name(cfg_r.status().code()) << ": " << cfg_r.status().message() << "\n";
    return 1;
  }
  gk::Config cfg = cfg_r.take_value();
  gk::configure_logging(cfg.logging);

  auto engine_r = gk::Engine::create(std::move(cfg), args.config_path);
  if (!engine_r.ok()) {
    std::cerr << engine_r.status().message() << "\n";
    return 1;
  }
  std::unique_ptr<gk::Engine> engine = engine_r.take_value();

  gk::JsonlEventSink sink;
  const gk::Status st_start = engine->start(&sink);
  if (!st_start.ok()) {
    std::cerr << st_start.message() << "\n";
    return 2;
  }

  // Ensure we always stop/flush cleanly.
  struct Guard {
    gk::Engine& e;
    ~Guard() { e.stop(); }
  } guard{*engine};

  std::cout << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  std::cout << "Engine: " << engine->config().engine_id << "  instance=" << engine->instance_id()
            << "  config_hash=" << engine->config_hash() << "\n\n";

  bool had_error = false;
  if (!args.script_path.empty()) {
    gk::ScriptOperationSource source(gk::ScriptSourceConfig{args.script_path, {}});
    const gk::Status st_open = source.open();
    if (!st_open.ok()) {
      std::cerr << st_open.message() << "\n";
      return 2;
    }

    std::map<std::string, gk::AllocationRef> labels;
    while (true) {
      auto step_r = source.next();
      if (!step_r.ok()) {
        if (step_r.status().code() != gk::Status::Code::kOutOfRange) {
          std::cerr << step_r.status().message() << "\n";
          had_error = true;
        }
        break;
      }
      if (!run_step(*engine, step_r.value(), labels)) {
        had_error = true;
        break;
      }
    }
    source.close();
  }

  std::cout << "\nFinal statistics:\n";
  print_statistics(engine->statistics());

  if (had_error) return 2;
  std::cout << "OK\n";
  return 0;
}
