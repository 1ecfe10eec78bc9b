#include "epic_coordinator.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <unordered_set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace epicflow::core {

using epicflow::observability::IntField;
using epicflow::observability::StringField;
using model::SubIssueAssignment;
using model::SubTaskStatus;

namespace {

constexpr const char* kCancelledMessage = "cancelled";

bool IsBlank(const std::string& value) {
  return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::string BranchName(const EpicCoordinatorConfig& config, const std::string& epic_id, const std::string& sub_task_id) {
  return config.branch_prefix + "-" + epic_id + "/sub-task-" + sub_task_id;
}

std::string AgentName(const EpicCoordinatorConfig& config, const std::string& epic_id, const std::string& sub_task_id) {
  return config.agent_pool_prefix + "-" + epic_id + "-" + sub_task_id;
}

EpicCoordinator::EpicCoordinator(EpicCoordinatorConfig config, std::shared_ptr<agent::AgentRegistry> registry,
                                 std::shared_ptr<const permission::PermissionGuard> guard, std::shared_ptr<exec::WorkerPool> pool,
                                 std::weak_ptr<branch::RetrievalStore> store, util::NowFn now)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      guard_(std::move(guard)),
      pool_(std::move(pool)),
      store_(std::move(store)),
      now_(now ? std::move(now) : util::NowFn(util::Now)),
      gate_(config_.max_concurrent_sub_tasks) {
}

std::string EpicCoordinator::Key(const std::string& epic_id, const std::string& sub_task_id) {
  std::string key;
  key.reserve(epic_id.size() + sub_task_id.size() + 1);
  key.append(epic_id).push_back('\x1f');
  key.append(sub_task_id);
  return key;
}

std::shared_ptr<EpicCoordinator::Slot> EpicCoordinator::FindSlot(const std::string& epic_id, const std::string& sub_task_id) const {
  std::shared_lock lock(assignments_mutex_);
  auto             it = assignments_.find(Key(epic_id, sub_task_id));
  return it == assignments_.end() ? nullptr : it->second;
}

std::optional<model::Epic> EpicCoordinator::FindEpic(const std::string& epic_id) const {
  std::shared_lock lock(epics_mutex_);
  auto             it = epics_.find(epic_id);
  if (it == epics_.end()) return std::nullopt;
  return it->second;
}

branch::ExecutionBranch EpicCoordinator::MakeBranch(const std::string& branch_name) const {
  return branch::ExecutionBranch::New(branch_name, branch::DataSource{config_.data_source_root}, store_);
}

// ------------------------------------------------------------
// Epics
// ------------------------------------------------------------

util::Result<model::Epic> EpicCoordinator::RegisterEpic(const std::string& epic_id, const std::string& title, const std::string& description,
                                                        const std::vector<std::string>& sub_task_ids) {
  if (IsBlank(epic_id)) {
    return util::Result<model::Epic>::Err(util::ErrorCode::kInvalidArgument, "epic id must not be blank");
  }
  if (IsBlank(title)) {
    return util::Result<model::Epic>::Err(util::ErrorCode::kInvalidArgument, "epic '" + epic_id + "' title must not be blank");
  }
  if (sub_task_ids.empty()) {
    return util::Result<model::Epic>::Err(util::ErrorCode::kEmptySubTaskList, "epic '" + epic_id + "' has no sub-tasks");
  }

  std::unordered_set<std::string> seen;
  for (const auto& id : sub_task_ids) {
    if (IsBlank(id)) {
      return util::Result<model::Epic>::Err(util::ErrorCode::kInvalidArgument, "epic '" + epic_id + "' has a blank sub-task id");
    }
    if (!seen.insert(id).second) {
      return util::Result<model::Epic>::Err(util::ErrorCode::kInvalidArgument, "epic '" + epic_id + "' lists sub-task '" + id + "' twice");
    }
  }

  model::Epic epic;
  epic.epic_id      = epic_id;
  epic.title        = title;
  epic.description  = description;
  epic.sub_task_ids = sub_task_ids;
  epic.created_at   = now_();

  {
    std::unique_lock lock(epics_mutex_);
    if (!epics_.try_emplace(epic_id, epic).second) {
      return util::Result<model::Epic>::Err(util::ErrorCode::kDuplicateEpic, "epic '" + epic_id + "' already registered");
    }
  }

  EPICFLOW_LOG_INFO("Epic registered", {StringField("epic_id", epic_id), IntField("sub_tasks", static_cast<std::int64_t>(sub_task_ids.size()))});

  if (config_.auto_assign_agents) {
    for (const auto& sub_task_id : sub_task_ids) {
      auto assigned = AssignSubTask(epic_id, sub_task_id);
      if (!assigned) {
        // Fresh keys are never InProgress.
        return util::Result<model::Epic>::Err(assigned.error());
      }
    }
  }

  return util::Result<model::Epic>::Ok(std::move(epic));
}

util::Result<model::Epic> EpicCoordinator::GetEpic(const std::string& epic_id) const {
  auto epic = FindEpic(epic_id);
  if (!epic) {
    return util::Result<model::Epic>::Err(util::ErrorCode::kUnknownEpic, "epic '" + epic_id + "' is not registered");
  }
  return util::Result<model::Epic>::Ok(std::move(*epic));
}

// ------------------------------------------------------------
// Assignment
// ------------------------------------------------------------

SubIssueAssignment EpicCoordinator::MakeAssignment(const model::Epic& epic, const std::string& sub_task_id,
                                                   const std::optional<std::string>& preferred_agent_id) {
  const auto agent_id = preferred_agent_id && !IsBlank(*preferred_agent_id) ? *preferred_agent_id : AgentName(config_, epic.epic_id, sub_task_id);

  auto agent = registry_->GetOrCreate(agent_id, {"epic-" + epic.epic_id, "sub-task-" + sub_task_id}, config_.default_permission_level,
                                      config_.data_source_root);

  SubIssueAssignment assignment;
  assignment.epic_id           = epic.epic_id;
  assignment.sub_task_id       = sub_task_id;
  assignment.title             = "Sub-task " + sub_task_id;
  assignment.description       = "Work item for epic " + epic.epic_id;
  assignment.assigned_agent_id = agent.id;
  assignment.branch_name       = BranchName(config_, epic.epic_id, sub_task_id);
  assignment.created_at        = now_();

  if (config_.auto_create_branches) {
    assignment.branch = MakeBranch(assignment.branch_name);
    assignment.status = SubTaskStatus::kBranchCreated;
  } else {
    assignment.status = SubTaskStatus::kPending;
  }
  return assignment;
}

AssignmentResult EpicCoordinator::AssignSubTask(const std::string& epic_id, const std::string& sub_task_id,
                                                const std::optional<std::string>& preferred_agent_id) {
  auto epic = FindEpic(epic_id);
  if (!epic) {
    return AssignmentResult::Err(util::ErrorCode::kUnknownEpic, "epic '" + epic_id + "' is not registered");
  }

  bool listed = false;
  for (const auto& id : epic->sub_task_ids) {
    if (id == sub_task_id) {
      listed = true;
      break;
    }
  }
  if (!listed) {
    return AssignmentResult::Err(util::ErrorCode::kUnknownSubTask, "sub-task '" + sub_task_id + "' is not part of epic '" + epic_id + "'");
  }

  auto assignment = MakeAssignment(*epic, sub_task_id, preferred_agent_id);

  std::unique_lock table_lock(assignments_mutex_);
  auto&            slot = assignments_[Key(epic_id, sub_task_id)];
  if (!slot) {
    slot             = std::make_shared<Slot>();
    slot->assignment = assignment;
  } else {
    std::lock_guard slot_lock(slot->mutex);
    if (slot->assignment.status == SubTaskStatus::kInProgress) {
      return AssignmentResult::Err(util::ErrorCode::kInvalidStatusTransition,
                                   "sub-task '" + sub_task_id + "' of epic '" + epic_id + "' is in progress and cannot be reassigned");
    }
    slot->assignment = assignment;
  }
  table_lock.unlock();

  EPICFLOW_LOG_INFO("Sub-task assigned", {StringField("epic_id", epic_id), StringField("sub_task_id", sub_task_id),
                                          StringField("agent_id", assignment.assigned_agent_id), StringField("branch", assignment.branch_name),
                                          StringField("status", model::ToString(assignment.status))});
  return AssignmentResult::Ok(std::move(assignment));
}

std::vector<SubIssueAssignment> EpicCoordinator::GetAssignments(const std::string& epic_id) const {
  std::vector<SubIssueAssignment> out;

  auto epic = FindEpic(epic_id);
  if (!epic) return out;

  out.reserve(epic->sub_task_ids.size());
  for (const auto& sub_task_id : epic->sub_task_ids) {
    auto slot = FindSlot(epic_id, sub_task_id);
    if (!slot) continue;
    std::lock_guard lock(slot->mutex);
    out.push_back(slot->assignment);
  }
  return out;
}

AssignmentResult EpicCoordinator::GetAssignment(const std::string& epic_id, const std::string& sub_task_id) const {
  auto slot = FindSlot(epic_id, sub_task_id);
  if (!slot) {
    return AssignmentResult::Err(util::ErrorCode::kUnknownAssignment, "no assignment for sub-task '" + sub_task_id + "' of epic '" + epic_id + "'");
  }
  std::lock_guard lock(slot->mutex);
  return AssignmentResult::Ok(slot->assignment);
}

util::Result<EpicProgress> EpicCoordinator::GetProgress(const std::string& epic_id) const {
  auto epic = FindEpic(epic_id);
  if (!epic) {
    return util::Result<EpicProgress>::Err(util::ErrorCode::kUnknownEpic, "epic '" + epic_id + "' is not registered");
  }

  EpicProgress progress;
  progress.total = epic->sub_task_ids.size();
  for (const auto& assignment : GetAssignments(epic_id)) {
    switch (assignment.status) {
      case SubTaskStatus::kPending:
        progress.pending++;
        break;
      case SubTaskStatus::kBranchCreated:
        progress.branch_created++;
        break;
      case SubTaskStatus::kInProgress:
        progress.in_progress++;
        break;
      case SubTaskStatus::kCompleted:
        progress.completed++;
        break;
      case SubTaskStatus::kFailed:
        progress.failed++;
        break;
    }
  }
  // Unassigned sub-tasks count as pending.
  progress.pending += progress.total - (progress.pending + progress.branch_created + progress.in_progress + progress.completed + progress.failed);
  return util::Result<EpicProgress>::Ok(progress);
}

// ------------------------------------------------------------
// Status transitions
// ------------------------------------------------------------

void EpicCoordinator::FailLocked(Slot& slot, const std::string& message) {
  auto next          = slot.assignment;
  next.status        = SubTaskStatus::kFailed;
  next.error_message = message.empty() ? std::string("failed") : message;
  next.completed_at.reset();
  slot.assignment = std::move(next);

  observability::Metrics::Instance().RecordSubTaskOutcome(model::ToString(SubTaskStatus::kFailed));
  EPICFLOW_LOG_WARN("Sub-task failed", {StringField("epic_id", slot.assignment.epic_id), StringField("sub_task_id", slot.assignment.sub_task_id),
                                        StringField("error", *slot.assignment.error_message)});
}

void EpicCoordinator::CompleteLocked(Slot& slot, SubIssueAssignment produced) {
  const auto& current = slot.assignment;

  // Identity stays with the coordinator; content comes from the work function.
  produced.epic_id           = current.epic_id;
  produced.sub_task_id       = current.sub_task_id;
  produced.assigned_agent_id = current.assigned_agent_id;
  produced.branch_name       = current.branch_name;
  produced.created_at        = current.created_at;
  if (!produced.branch) {
    produced.branch = current.branch;
  }
  produced.status       = SubTaskStatus::kCompleted;
  produced.completed_at = now_();
  produced.error_message.reset();
  slot.assignment = std::move(produced);

  observability::Metrics::Instance().RecordSubTaskOutcome(model::ToString(SubTaskStatus::kCompleted));
  EPICFLOW_LOG_INFO("Sub-task completed",
                    {StringField("epic_id", slot.assignment.epic_id), StringField("sub_task_id", slot.assignment.sub_task_id),
                     IntField("branch_events", static_cast<std::int64_t>(slot.assignment.branch ? slot.assignment.branch->Size() : 0))});
}

AssignmentResult EpicCoordinator::UpdateStatus(const std::string& epic_id, const std::string& sub_task_id, SubTaskStatus status,
                                               const std::optional<std::string>& error_message) {
  auto slot = FindSlot(epic_id, sub_task_id);
  if (!slot) {
    return AssignmentResult::Err(util::ErrorCode::kUnknownAssignment, "no assignment for sub-task '" + sub_task_id + "' of epic '" + epic_id + "'");
  }

  std::lock_guard lock(slot->mutex);
  const auto      from = slot->assignment.status;

  if (!model::CanTransition(from, status)) {
    EPICFLOW_LOG_WARN("Status transition rejected", {StringField("epic_id", epic_id), StringField("sub_task_id", sub_task_id),
                                                     StringField("from", model::ToString(from)), StringField("to", model::ToString(status))});
    return AssignmentResult::Err(util::ErrorCode::kInvalidStatusTransition,
                                 "cannot move sub-task '" + sub_task_id + "' from " + std::string(model::ToString(from)) + " to " +
                                     std::string(model::ToString(status)));
  }

  if (status == SubTaskStatus::kFailed && (!error_message || error_message->empty())) {
    return AssignmentResult::Err(util::ErrorCode::kInvalidStatusTransition, "failing sub-task '" + sub_task_id + "' requires an error message");
  }

  switch (status) {
    case SubTaskStatus::kFailed:
      FailLocked(*slot, *error_message);
      break;
    case SubTaskStatus::kCompleted:
      CompleteLocked(*slot, slot->assignment);
      break;
    case SubTaskStatus::kBranchCreated: {
      auto next = slot->assignment;
      if (!next.branch) next.branch = MakeBranch(next.branch_name);
      next.status      = status;
      slot->assignment = std::move(next);
      break;
    }
    default: {
      auto next        = slot->assignment;
      next.status      = status;
      slot->assignment = std::move(next);
      break;
    }
  }

  return AssignmentResult::Ok(slot->assignment);
}

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

util::Status EpicCoordinator::CheckPermissions(const model::Agent& agent, const SubTaskWork& work) const {
  if (auto status = permission::PermissionGuard::CheckAll(agent.permission_level, work.operations, agent.scope); !status) {
    return status;
  }

  for (const auto& action : work.actions) {
    const auto                  kind = guard_ ? guard_->Classify(action) : permission::OperationKind::kUnrestricted;
    const permission::Operation operation{action, kind, agent.scope};
    if (auto status = permission::PermissionGuard::Check(agent.permission_level, operation, agent.scope); !status) {
      return status;
    }
  }
  return util::Status::Ok();
}

AssignmentResult EpicCoordinator::ExecuteSubTask(const std::string& epic_id, const std::string& sub_task_id, WorkFunction fn,
                                                 std::stop_token token) {
  SubTaskWork work;
  work.fn = std::move(fn);
  return ExecuteSubTask(epic_id, sub_task_id, work, std::move(token));
}

AssignmentResult EpicCoordinator::ExecuteSubTask(const std::string& epic_id, const std::string& sub_task_id, const SubTaskWork& work,
                                                 std::stop_token token) {
  if (!work.fn) {
    return AssignmentResult::Err(util::ErrorCode::kInvalidArgument, "work function must be set");
  }

  auto slot = FindSlot(epic_id, sub_task_id);
  if (!slot) {
    return AssignmentResult::Err(util::ErrorCode::kUnknownAssignment, "no assignment for sub-task '" + sub_task_id + "' of epic '" + epic_id + "'");
  }

  // Every line logged on this thread until return names the sub-task.
  observability::ScopedLogContext                log_context({StringField("epic_id", epic_id), StringField("sub_task_id", sub_task_id)});
  std::optional<observability::ScopedLogContext> agent_context;

  observability::SpanScope span("epicflow.execute_sub_task");
  span.SetAttribute("epic_id", epic_id);
  span.SetAttribute("sub_task_id", sub_task_id);

  SubIssueAssignment started;
  {
    std::lock_guard lock(slot->mutex);
    const auto      from = slot->assignment.status;

    if (!model::CanTransition(from, SubTaskStatus::kInProgress)) {
      span.RecordException("invalid status transition");
      return AssignmentResult::Err(util::ErrorCode::kInvalidStatusTransition,
                                   "sub-task '" + sub_task_id + "' cannot start from " + std::string(model::ToString(from)));
    }

    if (token.stop_requested()) {
      FailLocked(*slot, kCancelledMessage);
      span.RecordException(kCancelledMessage);
      return AssignmentResult::Err(util::ErrorCode::kCancelled, "sub-task '" + sub_task_id + "' cancelled before start");
    }

    const auto& agent_id = slot->assignment.assigned_agent_id;
    span.SetAttribute("agent_id", agent_id);
    agent_context.emplace({StringField("agent_id", agent_id)});

    auto agent = registry_->Get(agent_id);
    if (!agent) {
      FailLocked(*slot, agent.error().message);
      span.RecordException(agent.error().message);
      return AssignmentResult::Err(agent.error());
    }

    if (auto allowed = CheckPermissions(agent.value(), work); !allowed) {
      FailLocked(*slot, allowed.message);
      span.RecordException(allowed.message);
      return AssignmentResult::Err(allowed.code, allowed.message);
    }

    auto next        = slot->assignment;
    next.status      = SubTaskStatus::kInProgress;
    slot->assignment = next;
    started          = std::move(next);
  }

  if (auto beat = registry_->Heartbeat(started.assigned_agent_id); !beat) {
    EPICFLOW_LOG_WARN("Heartbeat on start failed", {StringField("agent_id", started.assigned_agent_id), StringField("error", beat.message)});
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.SetInFlightSubTasks(executing_.fetch_add(1) + 1);
  const auto begin = std::chrono::steady_clock::now();

  std::optional<AssignmentResult> produced;
  try {
    produced = work.fn(started, token);
  } catch (const std::exception& e) {
    produced = AssignmentResult::Err(util::ErrorCode::kWorkFunctionFailure, e.what());
  } catch (...) {
    produced = AssignmentResult::Err(util::ErrorCode::kWorkFunctionFailure, "unknown exception from work function");
  }

  metrics.ObserveSubTaskDurationMs(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - begin).count());
  metrics.SetInFlightSubTasks(executing_.fetch_sub(1) - 1);

  std::lock_guard lock(slot->mutex);
  if (slot->assignment.status != SubTaskStatus::kInProgress) {
    // Moved by UpdateStatus while the work ran; keep that decision.
    return AssignmentResult::Err(util::ErrorCode::kInvalidStatusTransition,
                                 "sub-task '" + sub_task_id + "' left in_progress during execution (now " +
                                     std::string(model::ToString(slot->assignment.status)) + ")");
  }

  if (token.stop_requested() || produced->code() == util::ErrorCode::kCancelled) {
    FailLocked(*slot, kCancelledMessage);
    span.RecordException(kCancelledMessage);
    return AssignmentResult::Err(util::ErrorCode::kCancelled, "sub-task '" + sub_task_id + "' cancelled");
  }

  if (!*produced) {
    const auto& error   = produced->error();
    const auto  message = error.message.empty() ? std::string(util::ToString(error.code)) : error.message;
    FailLocked(*slot, message);
    span.RecordException(message);
    return AssignmentResult::Err(util::ErrorCode::kWorkFunctionFailure, message);
  }

  CompleteLocked(*slot, std::move(*produced).value());
  return AssignmentResult::Ok(slot->assignment);
}

AssignmentResult EpicCoordinator::CancelBeforeStart(const std::string& epic_id, const std::string& sub_task_id) {
  auto slot = FindSlot(epic_id, sub_task_id);
  if (!slot) {
    return AssignmentResult::Err(util::ErrorCode::kUnknownAssignment, "no assignment for sub-task '" + sub_task_id + "' of epic '" + epic_id + "'");
  }

  std::lock_guard lock(slot->mutex);
  if (model::CanTransition(slot->assignment.status, SubTaskStatus::kFailed)) {
    FailLocked(*slot, kCancelledMessage);
  }
  return AssignmentResult::Err(util::ErrorCode::kCancelled, "sub-task '" + sub_task_id + "' skipped after cancellation");
}

AssignmentResult EpicCoordinator::RunAdmitted(const std::string& epic_id, const std::string& sub_task_id, const SubTaskWork& work,
                                              std::stop_token token) {
  if (!gate_.Acquire(token)) {
    return CancelBeforeStart(epic_id, sub_task_id);
  }
  exec::AdmissionSlot admitted(gate_);
  return ExecuteSubTask(epic_id, sub_task_id, work, token);
}

std::vector<AssignmentResult> EpicCoordinator::ExecuteManyConcurrently(const std::string& epic_id, const std::vector<std::string>& sub_task_ids,
                                                                       WorkFunction fn, std::stop_token token) {
  SubTaskWork work;
  work.fn = std::move(fn);
  return ExecuteManyConcurrently(epic_id, sub_task_ids, work, std::move(token));
}

std::vector<AssignmentResult> EpicCoordinator::ExecuteManyConcurrently(const std::string& epic_id, const std::vector<std::string>& sub_task_ids,
                                                                       const SubTaskWork& work, std::stop_token token) {
  std::vector<std::optional<AssignmentResult>> slots(sub_task_ids.size());
  std::mutex                                   done_mutex;
  std::condition_variable                      done_cv;
  std::size_t                                  remaining = sub_task_ids.size();

  auto run_one = [&](std::size_t index) {
    std::optional<AssignmentResult> result;
    try {
      result = RunAdmitted(epic_id, sub_task_ids[index], work, token);
    } catch (const std::exception& e) {
      result = AssignmentResult::Err(util::ErrorCode::kWorkFunctionFailure, e.what());
    } catch (...) {
      result = AssignmentResult::Err(util::ErrorCode::kWorkFunctionFailure, "unknown exception while running sub-task");
    }

    {
      std::lock_guard lock(done_mutex);
      slots[index] = std::move(result);
      --remaining;
      // Notify under the lock; the waiter owns done_cv.
      done_cv.notify_one();
    }
  };

  for (std::size_t i = 0; i < sub_task_ids.size(); ++i) {
    // An absent, unstarted or stopped pool degrades to the caller's thread.
    if (!pool_ || !pool_->Submit([&run_one, i] { run_one(i); })) {
      run_one(i);
    }
  }

  {
    std::unique_lock lock(done_mutex);
    done_cv.wait(lock, [&] { return remaining == 0; });
  }

  std::vector<AssignmentResult> results;
  results.reserve(slots.size());
  std::size_t failures = 0;
  for (auto& slot : slots) {
    if (!*slot) failures++;
    results.push_back(std::move(*slot));
  }

  EPICFLOW_LOG_INFO("Batch finished", {StringField("epic_id", epic_id), IntField("sub_tasks", static_cast<std::int64_t>(results.size())),
                                       IntField("failures", static_cast<std::int64_t>(failures)),
                                       IntField("peak_in_flight", static_cast<std::int64_t>(gate_.PeakInFlight()))});
  return results;
}

} // namespace epicflow::core
