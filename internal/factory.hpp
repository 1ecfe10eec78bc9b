#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/agent/agent_registry.hpp"
#include "internal/core/epic_coordinator.hpp"
#include "internal/exec/worker_pool.hpp"
#include "internal/permission/permission_guard.hpp"

namespace epicflow::factory {

/*
  Application

  Every long-lived object of the process. Built once at start-up and
  passed around explicitly; nothing here is a global.
*/
struct Application {
  std::shared_ptr<agent::AgentRegistry>       registry;
  std::shared_ptr<permission::PermissionGuard> guard;
  std::shared_ptr<exec::WorkerPool>           pool;
  std::shared_ptr<core::EpicCoordinator>      coordinator;
};

/*
  Composition root. Validates the config, wires the components and
  starts the worker pool. Throws std::runtime_error on invalid config.
*/
Application Build(const epicflow::runtime::config::RuntimeConfig& config);

} // namespace epicflow::factory
