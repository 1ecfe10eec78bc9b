#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "epicflow/v1/branch.pb.h"
#include "internal/branch/execution_branch.hpp"
#include "internal/util/result.hpp"

namespace epicflow::branch {

/*
  Branch <-> epicflow.v1.BranchSnapshot.

  Event ids and timestamps survive a Capture/Restore cycle unchanged.
  The retrieval store is not captured; Restore attaches whatever store
  the caller passes.
*/
class BranchSnapshot {
 public:
  static epicflow::v1::BranchSnapshot Capture(const ExecutionBranch& branch);

  static util::Result<ExecutionBranch> Restore(const epicflow::v1::BranchSnapshot& snapshot, std::weak_ptr<RetrievalStore> store = {});

  static util::Result<std::string> ToJson(const epicflow::v1::BranchSnapshot& snapshot);

  static util::Result<epicflow::v1::BranchSnapshot> FromJson(std::string_view json);
};

} // namespace epicflow::branch
