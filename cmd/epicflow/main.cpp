#include <chrono>
#include <csignal>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "internal/branch/branch_snapshot.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using epicflow::observability::IntField;
using epicflow::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void Shutdown(epicflow::factory::Application* app) {
  if (app && app->pool) app->pool->Stop();
  epicflow::observability::ShutdownLogging();
  epicflow::observability::ShutdownMetrics();
  epicflow::observability::ShutdownTracing();
}

// Records one thinking step per sub-task.
epicflow::core::AssignmentResult DemoWork(const epicflow::model::SubIssueAssignment& assignment, std::stop_token token) {
  using epicflow::core::AssignmentResult;

  if (token.stop_requested()) {
    return AssignmentResult::Err(epicflow::util::ErrorCode::kCancelled, "stopped");
  }

  auto produced = assignment;
  auto branch   = assignment.branch ? *assignment.branch : epicflow::branch::ExecutionBranch::New(assignment.branch_name);
  produced.branch = branch.WithReasoningStep({epicflow::branch::ReasoningKind::kThinking, "Working on " + assignment.title},
                                             "Complete " + assignment.description);
  return AssignmentResult::Ok(std::move(produced));
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[1]) != "--config") {
    std::cerr << "Usage: epicflow --config <config.yaml> <epic-id> <sub-task-id>..." << std::endl;
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              epic_id     = argv[3];
  const std::vector<std::string> sub_task_ids(argv + 4, argv + argc);

  epicflow::factory::Application app;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = epicflow::config::ConfigLoader::LoadFromYaml(config_path);

    epicflow::observability::InitializeTracing(config);
    epicflow::observability::InitializeMetrics(config);
    epicflow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    app = epicflow::factory::Build(config);

    // Signal handlers only flip a flag; the watcher turns it into a stop request.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::stop_source stop;
    std::jthread     watcher([&stop](std::stop_token self) {
      while (!self.stop_requested()) {
        if (!g_running) {
          stop.request_stop();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });

    // ------------------------------------------------------------
    // Run the epic
    // ------------------------------------------------------------
    auto epic = app.coordinator->RegisterEpic(epic_id, "Epic " + epic_id, "Submitted from the command line", sub_task_ids);
    if (!epic) {
      EPICFLOW_LOG_ERROR("Epic registration failed", {StringField("epic_id", epic_id), StringField("code", epicflow::util::ToString(epic.code())),
                                                      StringField("error", epic.error().message)});
      Shutdown(&app);
      return 1;
    }

    auto results = app.coordinator->ExecuteManyConcurrently(epic_id, sub_task_ids, DemoWork, stop.get_token());
    watcher.request_stop();

    for (std::size_t i = 0; i < results.size(); ++i) {
      if (!results[i]) {
        std::cout << sub_task_ids[i] << ": " << epicflow::util::ToString(results[i].code()) << " (" << results[i].error().message << ")\n";
      }
    }

    if (auto progress = app.coordinator->GetProgress(epic_id); progress) {
      const auto& p = progress.value();
      EPICFLOW_LOG_INFO("Epic finished", {StringField("epic_id", epic_id), IntField("completed", static_cast<std::int64_t>(p.completed)),
                                          IntField("failed", static_cast<std::int64_t>(p.failed)),
                                          IntField("total", static_cast<std::int64_t>(p.total))});
    }

    for (const auto& assignment : app.coordinator->GetAssignments(epic_id)) {
      if (!assignment.branch) continue;
      auto json = epicflow::branch::BranchSnapshot::ToJson(epicflow::branch::BranchSnapshot::Capture(*assignment.branch));
      if (!json) {
        EPICFLOW_LOG_WARN("Snapshot encoding failed", {StringField("branch", assignment.branch_name), StringField("error", json.error().message)});
        continue;
      }
      std::cout << json.value() << std::endl;
    }

    Shutdown(&app);
  } catch (const std::exception& e) {
    EPICFLOW_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown(&app);
    return 2;
  }

  return 0;
}
