#pragma once

#include <cstddef>

#include "config/config.pb.h"
#include "internal/agent/agent_registry.hpp"
#include "internal/core/epic_coordinator.hpp"
#include "internal/util/result.hpp"

namespace epicflow::config {

/*
  Translation from the wire config to the plain structs components take.
  Unset or zero fields resolve to the component defaults.
*/

core::EpicCoordinatorConfig ToCoordinatorConfig(const epicflow::runtime::config::RuntimeConfig& config);

agent::AgentRegistryConfig ToRegistryConfig(const epicflow::runtime::config::RuntimeConfig& config);

// 0 threads means one per admission slot.
std::size_t WorkerThreads(const epicflow::runtime::config::RuntimeConfig& config);

util::Status Validate(const epicflow::runtime::config::RuntimeConfig& config);

} // namespace epicflow::config
