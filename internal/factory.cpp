#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"
#include "internal/exec/work_queue.hpp"
#include "internal/observability/logging.hpp"

namespace epicflow::factory {

using epicflow::observability::BoolField;
using epicflow::observability::IntField;
using epicflow::observability::StringField;

Application Build(const epicflow::runtime::config::RuntimeConfig& config) {
  if (auto status = config::Validate(config); !status) {
    throw std::runtime_error("Invalid configuration: " + status.message);
  }

  const auto coordinator_config = config::ToCoordinatorConfig(config);
  const auto registry_config    = config::ToRegistryConfig(config);

  Application app;
  app.registry = std::make_shared<agent::AgentRegistry>(registry_config);
  app.guard    = std::make_shared<permission::PermissionGuard>();
  app.pool     = std::make_shared<exec::WorkerPool>(std::make_shared<exec::WorkQueue>(), config::WorkerThreads(config));
  app.pool->Start();

  app.coordinator = std::make_shared<core::EpicCoordinator>(coordinator_config, app.registry, app.guard, app.pool);

  EPICFLOW_LOG_INFO("Coordinator built", {StringField("branch_prefix", coordinator_config.branch_prefix),
                                          StringField("agent_pool_prefix", coordinator_config.agent_pool_prefix),
                                          BoolField("auto_create_branches", coordinator_config.auto_create_branches),
                                          BoolField("auto_assign_agents", coordinator_config.auto_assign_agents),
                                          IntField("max_concurrent_sub_tasks", static_cast<std::int64_t>(coordinator_config.max_concurrent_sub_tasks)),
                                          StringField("default_level", permission::ToString(coordinator_config.default_permission_level))});
  return app;
}

} // namespace epicflow::factory
