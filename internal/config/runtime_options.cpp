#include "runtime_options.hpp"

#include <chrono>
#include <string>

namespace epicflow::config {

namespace pb = epicflow::runtime::config;

namespace {

permission::PermissionLevel ToLevel(pb::PermissionLevel level) {
  switch (level) {
    case pb::PERMISSION_LEVEL_ISOLATED:
      return permission::PermissionLevel::kIsolated;
    case pb::PERMISSION_LEVEL_TRUSTED:
      return permission::PermissionLevel::kTrusted;
    case pb::PERMISSION_LEVEL_SANDBOXED:
    default:
      return permission::PermissionLevel::kSandboxed;
  }
}

bool IsBlank(const std::string& value) {
  return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

core::EpicCoordinatorConfig ToCoordinatorConfig(const pb::RuntimeConfig& config) {
  const auto&                 in = config.coordinator();
  core::EpicCoordinatorConfig out;

  if (!in.branch_prefix().empty()) out.branch_prefix = in.branch_prefix();
  if (!in.agent_pool_prefix().empty()) out.agent_pool_prefix = in.agent_pool_prefix();
  if (in.has_auto_create_branches()) out.auto_create_branches = in.auto_create_branches();
  if (in.has_auto_assign_agents()) out.auto_assign_agents = in.auto_assign_agents();
  if (in.max_concurrent_sub_tasks() > 0) out.max_concurrent_sub_tasks = in.max_concurrent_sub_tasks();
  if (in.default_permission_level() != pb::PERMISSION_LEVEL_UNSPECIFIED) out.default_permission_level = ToLevel(in.default_permission_level());
  if (!in.data_source_root().empty()) out.data_source_root = in.data_source_root();

  return out;
}

agent::AgentRegistryConfig ToRegistryConfig(const pb::RuntimeConfig& config) {
  const auto&                in = config.agents();
  agent::AgentRegistryConfig out;

  if (in.has_liveness_timeout()) {
    const auto timeout = std::chrono::seconds(in.liveness_timeout().seconds()) + std::chrono::nanoseconds(in.liveness_timeout().nanos());
    if (timeout > std::chrono::nanoseconds::zero()) {
      out.liveness_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    }
  }
  out.max_agents = in.max_agents();

  return out;
}

std::size_t WorkerThreads(const pb::RuntimeConfig& config) {
  if (config.workers().threads() > 0) {
    return config.workers().threads();
  }
  return ToCoordinatorConfig(config).max_concurrent_sub_tasks;
}

util::Status Validate(const pb::RuntimeConfig& config) {
  const auto& coordinator = config.coordinator();

  // Unset prefixes take defaults; whitespace-only ones are rejected.
  if (!coordinator.branch_prefix().empty() && IsBlank(coordinator.branch_prefix())) {
    return util::Status::Err(util::ErrorCode::kInvalidArgument, "coordinator.branch_prefix must not be blank");
  }
  if (!coordinator.agent_pool_prefix().empty() && IsBlank(coordinator.agent_pool_prefix())) {
    return util::Status::Err(util::ErrorCode::kInvalidArgument, "coordinator.agent_pool_prefix must not be blank");
  }

  if (config.agents().has_liveness_timeout() && config.agents().liveness_timeout().seconds() < 0) {
    return util::Status::Err(util::ErrorCode::kInvalidArgument, "agents.liveness_timeout must not be negative");
  }

  return util::Status::Ok();
}

} // namespace epicflow::config
