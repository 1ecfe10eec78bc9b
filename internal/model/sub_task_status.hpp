#pragma once

#include <cstdint>
#include <string_view>

namespace epicflow::model {

enum class SubTaskStatus : std::uint8_t {
  kPending       = 0,
  kBranchCreated = 1,
  kInProgress    = 2,
  kCompleted     = 3,
  kFailed        = 4,
};

constexpr bool IsTerminal(SubTaskStatus status) {
  return status == SubTaskStatus::kCompleted || status == SubTaskStatus::kFailed;
}

/*
  Single authority on the lifecycle:

    Pending -> BranchCreated -> InProgress -> {Completed | Failed}

  Pending may skip straight to InProgress when branches are not
  auto-created, and any non-terminal state may fail (permission denial,
  cancellation before start). Nothing leaves a terminal state and
  self-transitions are rejected.
*/
constexpr bool CanTransition(SubTaskStatus from, SubTaskStatus to) {
  if (IsTerminal(from) || from == to) {
    return false;
  }
  if (to == SubTaskStatus::kFailed) {
    return true;
  }

  switch (from) {
    case SubTaskStatus::kPending:
      return to == SubTaskStatus::kBranchCreated || to == SubTaskStatus::kInProgress;
    case SubTaskStatus::kBranchCreated:
      return to == SubTaskStatus::kInProgress;
    case SubTaskStatus::kInProgress:
      return to == SubTaskStatus::kCompleted;
    default:
      return false;
  }
}

constexpr std::string_view ToString(SubTaskStatus status) {
  switch (status) {
    case SubTaskStatus::kPending:
      return "pending";
    case SubTaskStatus::kBranchCreated:
      return "branch_created";
    case SubTaskStatus::kInProgress:
      return "in_progress";
    case SubTaskStatus::kCompleted:
      return "completed";
    case SubTaskStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace epicflow::model
