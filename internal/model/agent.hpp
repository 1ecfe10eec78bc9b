#pragma once

#include <set>
#include <string>

#include "internal/permission/permission_guard.hpp"
#include "internal/util/time.hpp"

namespace epicflow::model {

/*
  Point-in-time view of a registered agent.

  last_heartbeat is the only field that moves after registration; the
  registry owns the live value and hands out copies.
*/
struct Agent {
  std::string           id;
  std::set<std::string> capabilities;

  permission::PermissionLevel permission_level = permission::PermissionLevel::kIsolated;

  // Root a sandboxed agent's scoped operations must stay under.
  std::string scope;

  util::TimePoint last_heartbeat;
  util::TimePoint registered_at;
};

} // namespace epicflow::model
