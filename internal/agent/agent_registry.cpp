#include "agent_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace epicflow::agent {

using epicflow::observability::IntField;
using epicflow::observability::StringField;

AgentRegistry::AgentRegistry(AgentRegistryConfig config, util::NowFn now) : config_(config), now_(std::move(now)) {
  if (!now_) {
    now_ = util::Now;
  }
}

util::Clock::rep AgentRegistry::Ticks(util::TimePoint tp) {
  return tp.time_since_epoch().count();
}

model::Agent AgentRegistry::Snapshot(const Entry& entry) {
  model::Agent agent   = entry.agent;
  agent.last_heartbeat = util::TimePoint(util::Clock::duration(entry.last_heartbeat.load(std::memory_order_acquire)));
  return agent;
}

std::shared_ptr<AgentRegistry::Entry> AgentRegistry::MakeEntry(const std::string& agent_id, std::set<std::string> capabilities,
                                                               permission::PermissionLevel level, std::string scope) const {
  const auto now = now_();

  auto entry                    = std::make_shared<Entry>();
  entry->agent.id               = agent_id;
  entry->agent.capabilities     = std::move(capabilities);
  entry->agent.permission_level = level;
  entry->agent.scope            = std::move(scope);
  entry->agent.registered_at    = now;
  entry->agent.last_heartbeat   = now;
  entry->last_heartbeat.store(Ticks(now), std::memory_order_release);
  return entry;
}

bool AgentRegistry::IsFresh(const Entry& entry, util::TimePoint now, std::chrono::milliseconds liveness_timeout) const {
  const auto last = util::TimePoint(util::Clock::duration(entry.last_heartbeat.load(std::memory_order_acquire)));
  return now - last <= liveness_timeout;
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

util::Result<model::Agent> AgentRegistry::Register(const std::string& agent_id, std::set<std::string> capabilities,
                                                   permission::PermissionLevel level, std::string scope) {
  if (agent_id.empty()) {
    return util::Result<model::Agent>::Err(util::ErrorCode::kInvalidArgument, "agent id must not be empty");
  }

  auto entry = MakeEntry(agent_id, std::move(capabilities), level, std::move(scope));

  std::unique_lock lock(mutex_);
  if (agents_.contains(agent_id)) {
    return util::Result<model::Agent>::Err(util::ErrorCode::kDuplicateAgent, "agent '" + agent_id + "' already registered");
  }

  if (config_.max_agents > 0 && agents_.size() >= config_.max_agents) {
    lock.unlock();
    EPICFLOW_LOG_WARN("Agent registration rejected at capacity",
                      {StringField("agent_id", agent_id), IntField("max_agents", static_cast<std::int64_t>(config_.max_agents))});
    return util::Result<model::Agent>::Err(util::ErrorCode::kResourceExhausted,
                                           "maximum number of agents (" + std::to_string(config_.max_agents) + ") reached");
  }

  agents_.emplace(agent_id, entry);
  lock.unlock();

  EPICFLOW_LOG_INFO("Agent registered", {StringField("agent_id", agent_id), StringField("level", permission::ToString(level))});
  return util::Result<model::Agent>::Ok(Snapshot(*entry));
}

model::Agent AgentRegistry::GetOrCreate(const std::string& agent_id, std::set<std::string> default_capabilities,
                                        permission::PermissionLevel default_level, std::string default_scope) {
  {
    std::shared_lock lock(mutex_);
    if (auto it = agents_.find(agent_id); it != agents_.end()) {
      return Snapshot(*it->second);
    }
  }

  auto entry = MakeEntry(agent_id, std::move(default_capabilities), default_level, std::move(default_scope));

  std::unique_lock lock(mutex_);
  auto [it, inserted] = agents_.try_emplace(agent_id, entry);
  auto snapshot       = Snapshot(*it->second);
  lock.unlock();

  if (inserted) {
    EPICFLOW_LOG_INFO("Agent created", {StringField("agent_id", agent_id), StringField("level", permission::ToString(default_level))});
  }
  return snapshot;
}

// ------------------------------------------------------------
// Liveness
// ------------------------------------------------------------

util::Status AgentRegistry::Heartbeat(const std::string& agent_id) {
  const auto now = now_();

  std::shared_lock lock(mutex_);
  auto             it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return util::Status::Err(util::ErrorCode::kUnknownAgent, "agent '" + agent_id + "' is not registered");
  }

  it->second->last_heartbeat.store(Ticks(now), std::memory_order_release);
  return util::Status::Ok();
}

bool AgentRegistry::IsHealthy(const std::string& agent_id, std::chrono::milliseconds liveness_timeout) const {
  const auto now = now_();

  std::shared_lock lock(mutex_);
  auto             it = agents_.find(agent_id);
  if (it == agents_.end()) return false;
  return IsFresh(*it->second, now, liveness_timeout);
}

bool AgentRegistry::IsHealthy(const std::string& agent_id) const {
  return IsHealthy(agent_id, config_.liveness_timeout);
}

std::vector<std::string> AgentRegistry::StaleAgents(std::chrono::milliseconds liveness_timeout) const {
  const auto now = now_();

  std::vector<std::string> stale;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : agents_) {
      if (!IsFresh(*entry, now, liveness_timeout)) stale.push_back(id);
    }
  }
  std::sort(stale.begin(), stale.end());
  return stale;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

util::Result<model::Agent> AgentRegistry::Get(const std::string& agent_id) const {
  std::shared_lock lock(mutex_);
  auto             it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return util::Result<model::Agent>::Err(util::ErrorCode::kUnknownAgent, "agent '" + agent_id + "' is not registered");
  }
  return util::Result<model::Agent>::Ok(Snapshot(*it->second));
}

util::Status AgentRegistry::Unregister(const std::string& agent_id) {
  std::unique_lock lock(mutex_);
  if (agents_.erase(agent_id) == 0) {
    return util::Status::Err(util::ErrorCode::kUnknownAgent, "agent '" + agent_id + "' is not registered");
  }
  return util::Status::Ok();
}

std::vector<model::Agent> AgentRegistry::ListAgents() const {
  std::vector<model::Agent> agents;
  {
    std::shared_lock lock(mutex_);
    agents.reserve(agents_.size());
    for (const auto& [_, entry] : agents_) {
      agents.push_back(Snapshot(*entry));
    }
  }
  std::sort(agents.begin(), agents.end(), [](const model::Agent& a, const model::Agent& b) { return a.id < b.id; });
  return agents;
}

std::size_t AgentRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return agents_.size();
}

} // namespace epicflow::agent
