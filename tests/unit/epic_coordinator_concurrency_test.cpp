#include "internal/core/epic_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using epicflow::agent::AgentRegistry;
using epicflow::branch::ReasoningKind;
using epicflow::core::AssignmentResult;
using epicflow::core::EpicCoordinator;
using epicflow::core::EpicCoordinatorConfig;
using epicflow::exec::WorkerPool;
using epicflow::exec::WorkQueue;
using epicflow::model::SubIssueAssignment;
using epicflow::model::SubTaskStatus;
using epicflow::permission::PermissionGuard;
using epicflow::util::ErrorCode;

struct Harness {
  std::shared_ptr<WorkerPool>      pool;
  std::shared_ptr<EpicCoordinator> coordinator;

  Harness(std::size_t max_concurrent, std::size_t threads) {
    pool = std::make_shared<WorkerPool>(std::make_shared<WorkQueue>(), threads);
    pool->Start();

    EpicCoordinatorConfig config;
    config.max_concurrent_sub_tasks = max_concurrent;
    coordinator = std::make_shared<EpicCoordinator>(config, std::make_shared<AgentRegistry>(), std::make_shared<PermissionGuard>(), pool);
  }

  ~Harness() {
    pool->Stop();
  }
};

std::vector<std::string> Ids(std::size_t count) {
  std::vector<std::string> ids;
  for (std::size_t i = 1; i <= count; ++i) ids.push_back(std::to_string(i));
  return ids;
}

struct Gauge {
  std::atomic<int> current{0};
  std::atomic<int> highest{0};

  void Enter() {
    const int now  = ++current;
    int       seen = highest.load();
    while (now > seen && !highest.compare_exchange_weak(seen, now)) {
    }
  }

  void Leave() {
    --current;
  }
};

void TestConcurrencyNeverExceedsLimit() {
  Harness harness(2, 8);
  const auto ids = Ids(8);
  assert(harness.coordinator->RegisterEpic("E1", "Bounded", "", ids));

  Gauge gauge;
  auto  results = harness.coordinator->ExecuteManyConcurrently("E1", ids, [&](const SubIssueAssignment& assignment, std::stop_token) {
    gauge.Enter();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gauge.Leave();

    auto produced   = assignment;
    produced.branch = assignment.branch->WithReasoningStep({ReasoningKind::kDraft, "done"}, "go");
    return AssignmentResult::Ok(std::move(produced));
  });

  assert(results.size() == ids.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    assert(results[i]);
    assert(results[i].value().sub_task_id == ids[i]);
    assert(results[i].value().status == SubTaskStatus::kCompleted);
  }
  assert(gauge.highest.load() <= 2);
  assert(gauge.highest.load() >= 1);
  assert(harness.coordinator->admission().PeakInFlight() <= 2);
  assert(harness.coordinator->admission().InFlight() == 0);
  assert(harness.coordinator->GetProgress("E1").value().completed == ids.size());
}

void TestPartialFailureIsIsolated() {
  Harness harness(3, 4);
  const auto ids = Ids(5);
  assert(harness.coordinator->RegisterEpic("E1", "Partial", "", ids));

  auto results = harness.coordinator->ExecuteManyConcurrently("E1", ids, [](const SubIssueAssignment& assignment, std::stop_token) {
    if (assignment.sub_task_id == "3") {
      return AssignmentResult::Err(ErrorCode::kInvalidArgument, "sub-task 3 exploded");
    }
    return AssignmentResult::Ok(assignment);
  });

  assert(results.size() == 5);
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (ids[i] == "3") {
      assert(results[i].code() == ErrorCode::kWorkFunctionFailure);
    } else {
      assert(results[i]);
    }
  }

  auto progress = harness.coordinator->GetProgress("E1").value();
  assert(progress.completed == 4);
  assert(progress.failed == 1);

  auto failed = harness.coordinator->GetAssignment("E1", "3").value();
  assert(failed.status == SubTaskStatus::kFailed);
  assert(failed.error_message == std::string("sub-task 3 exploded"));
}

void TestCancellationSkipsUnstartedWork() {
  Harness harness(1, 4);
  const auto ids = Ids(6);
  assert(harness.coordinator->RegisterEpic("E1", "Cancelled", "", ids));

  std::stop_source stop;
  std::atomic<int> started{0};

  auto results = harness.coordinator->ExecuteManyConcurrently(
      "E1", ids,
      [&](const SubIssueAssignment& assignment, std::stop_token) {
        started++;
        stop.request_stop();
        return AssignmentResult::Ok(assignment);
      },
      stop.get_token());

  assert(started.load() == 1);
  assert(results.size() == ids.size());
  for (const auto& result : results) {
    assert(result.code() == ErrorCode::kCancelled);
  }
  for (const auto& assignment : harness.coordinator->GetAssignments("E1")) {
    assert(assignment.status == SubTaskStatus::kFailed);
    assert(assignment.error_message == std::string("cancelled"));
  }
}

void TestCooperativeCancellationObservesToken() {
  Harness harness(2, 2);
  const auto ids = Ids(2);
  assert(harness.coordinator->RegisterEpic("E1", "Cooperative", "", ids));

  std::stop_source stop;
  std::atomic<int> waiting{0};
  std::thread      canceller([&] {
    while (waiting.load() < 2) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    stop.request_stop();
  });

  auto results = harness.coordinator->ExecuteManyConcurrently(
      "E1", ids,
      [&](const SubIssueAssignment& assignment, std::stop_token token) {
        waiting++;
        while (!token.stop_requested()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return AssignmentResult::Err(ErrorCode::kCancelled, "stopped " + assignment.sub_task_id);
      },
      stop.get_token());
  canceller.join();

  for (const auto& result : results) {
    assert(result.code() == ErrorCode::kCancelled);
  }
  assert(harness.coordinator->GetProgress("E1").value().failed == 2);
}

void TestBatchesShareTheLimit() {
  Harness harness(2, 8);
  const auto ids = Ids(4);
  assert(harness.coordinator->RegisterEpic("E1", "Left", "", ids));
  assert(harness.coordinator->RegisterEpic("E2", "Right", "", ids));

  Gauge gauge;
  auto  work = [&](const SubIssueAssignment& assignment, std::stop_token) {
    gauge.Enter();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    gauge.Leave();
    return AssignmentResult::Ok(assignment);
  };

  std::vector<AssignmentResult> left;
  std::thread                   other([&] { left = harness.coordinator->ExecuteManyConcurrently("E1", ids, work); });
  auto                          right = harness.coordinator->ExecuteManyConcurrently("E2", ids, work);
  other.join();

  assert(gauge.highest.load() <= 2);
  for (const auto& result : left) assert(result);
  for (const auto& result : right) assert(result);
}

void TestRunsInlineWithoutPool() {
  EpicCoordinatorConfig config;
  config.max_concurrent_sub_tasks = 2;
  EpicCoordinator coordinator(config, std::make_shared<AgentRegistry>(), std::make_shared<PermissionGuard>(), nullptr);

  const auto ids = Ids(3);
  assert(coordinator.RegisterEpic("E1", "Inline", "", ids));

  const auto caller  = std::this_thread::get_id();
  bool       inline_ = true;
  auto       results = coordinator.ExecuteManyConcurrently("E1", ids, [&](const SubIssueAssignment& assignment, std::stop_token) {
    inline_ = inline_ && std::this_thread::get_id() == caller;
    return AssignmentResult::Ok(assignment);
  });

  assert(inline_);
  for (const auto& result : results) assert(result);
}

void TestNonStandardThrowDoesNotStallBatch() {
  Harness harness(2, 2);
  const auto ids = Ids(3);
  assert(harness.coordinator->RegisterEpic("E1", "Throws", "", ids));

  auto results = harness.coordinator->ExecuteManyConcurrently("E1", ids, [](const SubIssueAssignment& assignment, std::stop_token) {
    if (assignment.sub_task_id == "2") throw 42;
    return AssignmentResult::Ok(assignment);
  });

  assert(results.size() == 3);
  assert(results[0]);
  assert(results[1].code() == ErrorCode::kWorkFunctionFailure);
  assert(results[2]);
  assert(harness.coordinator->GetAssignment("E1", "2").value().status == SubTaskStatus::kFailed);
}

void TestRunsInlineWithUnstartedPool() {
  auto pool = std::make_shared<WorkerPool>(std::make_shared<WorkQueue>(), 2);

  EpicCoordinatorConfig config;
  config.max_concurrent_sub_tasks = 2;
  EpicCoordinator coordinator(config, std::make_shared<AgentRegistry>(), std::make_shared<PermissionGuard>(), pool);
  assert(coordinator.RegisterEpic("E1", "Unstarted", "", {"A", "B"}));

  const auto caller  = std::this_thread::get_id();
  bool       inline_ = true;
  auto       results = coordinator.ExecuteManyConcurrently("E1", {"A", "B"}, [&](const SubIssueAssignment& assignment, std::stop_token) {
    inline_ = inline_ && std::this_thread::get_id() == caller;
    return AssignmentResult::Ok(assignment);
  });

  assert(inline_);
  assert(results.size() == 2);
  for (const auto& result : results) assert(result);
  assert(coordinator.GetProgress("E1").value().completed == 2);
}

void TestUnknownIdsReportedPerEntry() {
  Harness harness(2, 2);
  assert(harness.coordinator->RegisterEpic("E1", "Mixed", "", {"a", "b"}));

  auto results = harness.coordinator->ExecuteManyConcurrently(
      "E1", {"a", "ghost", "b"}, [](const SubIssueAssignment& assignment, std::stop_token) { return AssignmentResult::Ok(assignment); });

  assert(results.size() == 3);
  assert(results[0]);
  assert(results[1].code() == ErrorCode::kUnknownAssignment);
  assert(results[2]);
}

} // namespace

int main() {
  TestConcurrencyNeverExceedsLimit();
  TestPartialFailureIsIsolated();
  TestCancellationSkipsUnstartedWork();
  TestCooperativeCancellationObservesToken();
  TestBatchesShareTheLimit();
  TestRunsInlineWithoutPool();
  TestNonStandardThrowDoesNotStallBatch();
  TestRunsInlineWithUnstartedPool();
  TestUnknownIdsReportedPerEntry();

  std::cout << "epicflow_unit_epic_coordinator_concurrency: pass\n";
  return 0;
}
