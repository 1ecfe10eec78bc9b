#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/agent.hpp"
#include "internal/permission/permission_guard.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace epicflow::agent {

struct AgentRegistryConfig {
  std::chrono::milliseconds liveness_timeout{std::chrono::minutes(5)};

  // 0 = unbounded. Only explicit Register is capped.
  std::size_t max_agents = 0;
};

/*
  Concurrent agent table with heartbeat liveness.

  The table lock is only taken exclusively to add or remove agents.
  Heartbeats run under the shared lock and store into a per-agent atomic,
  so independent agents never block each other.
*/
class AgentRegistry {
 public:
  explicit AgentRegistry(AgentRegistryConfig config = {}, util::NowFn now = util::Now);

  util::Result<model::Agent> Register(const std::string& agent_id, std::set<std::string> capabilities, permission::PermissionLevel level,
                                      std::string scope = {});

  util::Status Heartbeat(const std::string& agent_id);

  // Idempotent; returns the existing agent untouched when already present.
  model::Agent GetOrCreate(const std::string& agent_id, std::set<std::string> default_capabilities, permission::PermissionLevel default_level,
                           std::string default_scope = {});

  bool IsHealthy(const std::string& agent_id, std::chrono::milliseconds liveness_timeout) const;
  bool IsHealthy(const std::string& agent_id) const;

  util::Result<model::Agent> Get(const std::string& agent_id) const;

  util::Status Unregister(const std::string& agent_id);

  std::vector<model::Agent> ListAgents() const;

  // Reports only; callers decide what to do with stale agents.
  std::vector<std::string> StaleAgents(std::chrono::milliseconds liveness_timeout) const;

  std::size_t Size() const;

  const AgentRegistryConfig& config() const {
    return config_;
  }

 private:
  struct Entry {
    model::Agent                  agent;
    std::atomic<util::Clock::rep> last_heartbeat{0};
  };

  static util::Clock::rep Ticks(util::TimePoint tp);
  static model::Agent     Snapshot(const Entry& entry);

  std::shared_ptr<Entry> MakeEntry(const std::string& agent_id, std::set<std::string> capabilities, permission::PermissionLevel level,
                                   std::string scope) const;

  bool IsFresh(const Entry& entry, util::TimePoint now, std::chrono::milliseconds liveness_timeout) const;

  AgentRegistryConfig config_;
  util::NowFn         now_;

  mutable std::shared_mutex                               mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> agents_;
};

} // namespace epicflow::agent
