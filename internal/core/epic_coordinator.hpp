#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/agent/agent_registry.hpp"
#include "internal/branch/execution_branch.hpp"
#include "internal/exec/admission_gate.hpp"
#include "internal/exec/worker_pool.hpp"
#include "internal/model/epic.hpp"
#include "internal/model/sub_issue_assignment.hpp"
#include "internal/permission/permission_guard.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace epicflow::core {

struct EpicCoordinatorConfig {
  std::string branch_prefix     = "epic";
  std::string agent_pool_prefix = "agent";

  bool auto_create_branches = true;
  bool auto_assign_agents   = true;

  std::size_t max_concurrent_sub_tasks = 4;

  // Level and scope given to agents the coordinator creates itself.
  permission::PermissionLevel default_permission_level = permission::PermissionLevel::kSandboxed;
  std::string                 data_source_root         = ".";
};

struct EpicProgress {
  std::size_t total          = 0;
  std::size_t pending        = 0;
  std::size_t branch_created = 0;
  std::size_t in_progress    = 0;
  std::size_t completed      = 0;
  std::size_t failed         = 0;

  double CompletionRatio() const {
    return total == 0 ? 0.0 : static_cast<double>(completed) / static_cast<double>(total);
  }
};

using AssignmentResult = util::Result<model::SubIssueAssignment>;

// Caller business logic. Receives the assignment as it stood when the
// sub-task entered InProgress and should honour the stop token.
using WorkFunction = std::function<AssignmentResult(const model::SubIssueAssignment&, std::stop_token)>;

struct SubTaskWork {
  // Declared up front; all must pass before the sub-task starts.
  std::vector<permission::Operation> operations;

  // Action names classified by the guard, checked against the agent's scope.
  std::vector<std::string> actions;

  WorkFunction fn;
};

std::string BranchName(const EpicCoordinatorConfig& config, const std::string& epic_id, const std::string& sub_task_id);
std::string AgentName(const EpicCoordinatorConfig& config, const std::string& epic_id, const std::string& sub_task_id);

/*
  Orchestration entry point.

  Owns the epic table and the assignment table. Assignments are keyed by
  (epic, sub-task) and each key has its own slot lock, so unrelated
  sub-tasks never contend. Slot locks cover status transitions only; a
  work function always runs unlocked.

  Concurrent ExecuteSubTask calls for the same key are the caller's to
  serialize; the second one is rejected once the first is InProgress.
*/
class EpicCoordinator {
 public:
  EpicCoordinator(EpicCoordinatorConfig config, std::shared_ptr<agent::AgentRegistry> registry,
                  std::shared_ptr<const permission::PermissionGuard> guard, std::shared_ptr<exec::WorkerPool> pool,
                  std::weak_ptr<branch::RetrievalStore> store = {}, util::NowFn now = util::Now);

  util::Result<model::Epic> RegisterEpic(const std::string& epic_id, const std::string& title, const std::string& description,
                                         const std::vector<std::string>& sub_task_ids);

  util::Result<model::Epic> GetEpic(const std::string& epic_id) const;

  AssignmentResult AssignSubTask(const std::string& epic_id, const std::string& sub_task_id,
                                 const std::optional<std::string>& preferred_agent_id = std::nullopt);

  // Registration order; empty for an unknown epic.
  std::vector<model::SubIssueAssignment> GetAssignments(const std::string& epic_id) const;

  AssignmentResult GetAssignment(const std::string& epic_id, const std::string& sub_task_id) const;

  util::Result<EpicProgress> GetProgress(const std::string& epic_id) const;

  AssignmentResult UpdateStatus(const std::string& epic_id, const std::string& sub_task_id, model::SubTaskStatus status,
                                const std::optional<std::string>& error_message = std::nullopt);

  AssignmentResult ExecuteSubTask(const std::string& epic_id, const std::string& sub_task_id, const SubTaskWork& work,
                                  std::stop_token token = {});

  AssignmentResult ExecuteSubTask(const std::string& epic_id, const std::string& sub_task_id, WorkFunction fn, std::stop_token token = {});

  // One result per id, in input order. Failures never abort siblings.
  std::vector<AssignmentResult> ExecuteManyConcurrently(const std::string& epic_id, const std::vector<std::string>& sub_task_ids,
                                                        const SubTaskWork& work, std::stop_token token = {});

  std::vector<AssignmentResult> ExecuteManyConcurrently(const std::string& epic_id, const std::vector<std::string>& sub_task_ids,
                                                        WorkFunction fn, std::stop_token token = {});

  const EpicCoordinatorConfig& config() const {
    return config_;
  }

  const exec::AdmissionGate& admission() const {
    return gate_;
  }

 private:
  struct Slot {
    std::mutex                mutex;
    model::SubIssueAssignment assignment;
  };

  static std::string Key(const std::string& epic_id, const std::string& sub_task_id);

  std::shared_ptr<Slot> FindSlot(const std::string& epic_id, const std::string& sub_task_id) const;

  std::optional<model::Epic> FindEpic(const std::string& epic_id) const;

  model::SubIssueAssignment MakeAssignment(const model::Epic& epic, const std::string& sub_task_id,
                                           const std::optional<std::string>& preferred_agent_id);

  branch::ExecutionBranch MakeBranch(const std::string& branch_name) const;

  // Caller holds slot.mutex.
  void FailLocked(Slot& slot, const std::string& message);
  void CompleteLocked(Slot& slot, model::SubIssueAssignment produced);

  AssignmentResult CancelBeforeStart(const std::string& epic_id, const std::string& sub_task_id);

  AssignmentResult RunAdmitted(const std::string& epic_id, const std::string& sub_task_id, const SubTaskWork& work, std::stop_token token);

  util::Status CheckPermissions(const model::Agent& agent, const SubTaskWork& work) const;

  const EpicCoordinatorConfig                        config_;
  std::shared_ptr<agent::AgentRegistry>              registry_;
  std::shared_ptr<const permission::PermissionGuard> guard_;
  std::shared_ptr<exec::WorkerPool>                  pool_;
  std::weak_ptr<branch::RetrievalStore>              store_;
  util::NowFn                                        now_;

  exec::AdmissionGate       gate_;
  std::atomic<std::int64_t> executing_{0};

  mutable std::shared_mutex                    epics_mutex_;
  std::unordered_map<std::string, model::Epic> epics_;

  mutable std::shared_mutex                              assignments_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> assignments_;
};

} // namespace epicflow::core
