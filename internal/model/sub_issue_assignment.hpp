#pragma once

#include <optional>
#include <string>

#include "internal/branch/execution_branch.hpp"
#include "internal/model/sub_task_status.hpp"
#include "internal/util/time.hpp"

namespace epicflow::model {

/*
  One sub-task bound to an agent and a branch.

  Values are replaced wholesale in the coordinator's table, never edited
  in place. Invariants on every stored value:
    status == kFailed    => error_message is set
    status == kCompleted => completed_at is set
*/
struct SubIssueAssignment {
  std::string epic_id;
  std::string sub_task_id;
  std::string title;
  std::string description;

  std::string assigned_agent_id;

  // Name is fixed at assignment; the branch itself is absent until created.
  std::string                            branch_name;
  std::optional<branch::ExecutionBranch> branch;

  SubTaskStatus status = SubTaskStatus::kPending;

  util::TimePoint                created_at;
  std::optional<util::TimePoint> completed_at;
  std::optional<std::string>     error_message;
};

} // namespace epicflow::model
