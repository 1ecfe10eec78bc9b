#include "internal/agent/agent_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using epicflow::agent::AgentRegistry;
using epicflow::agent::AgentRegistryConfig;
using epicflow::permission::PermissionLevel;
using epicflow::util::ErrorCode;
using epicflow::util::TimePoint;

/*
  Manually advanced clock shared with the registry under test.
*/
struct FakeClock {
  std::shared_ptr<std::atomic<std::int64_t>> millis = std::make_shared<std::atomic<std::int64_t>>(1'700'000'000'000);

  TimePoint operator()() const {
    return TimePoint(std::chrono::milliseconds(millis->load()));
  }

  void Advance(std::chrono::milliseconds by) const {
    millis->fetch_add(by.count());
  }
};

void TestRegisterAndDuplicate() {
  AgentRegistry registry;

  auto first = registry.Register("a1", {"review"}, PermissionLevel::kSandboxed, "/work");
  assert(first);
  assert(first.value().id == "a1");
  assert(first.value().capabilities.count("review") == 1);
  assert(first.value().permission_level == PermissionLevel::kSandboxed);
  assert(first.value().scope == "/work");
  assert(first.value().registered_at == first.value().last_heartbeat);

  auto second = registry.Register("a1", {}, PermissionLevel::kTrusted);
  assert(!second);
  assert(second.code() == ErrorCode::kDuplicateAgent);

  // The first entry is untouched.
  assert(registry.Get("a1").value().permission_level == PermissionLevel::kSandboxed);
  assert(registry.Size() == 1);
}

void TestRegisterRejectsEmptyId() {
  AgentRegistry registry;
  assert(registry.Register("", {}, PermissionLevel::kIsolated).code() == ErrorCode::kInvalidArgument);
}

void TestHeartbeatUnknownAgent() {
  AgentRegistry registry;

  auto status = registry.Heartbeat("unknown-agent");
  assert(!status);
  assert(status.code == ErrorCode::kUnknownAgent);
  assert(registry.Get("unknown-agent").code() == ErrorCode::kUnknownAgent);
}

void TestHealthFollowsHeartbeats() {
  FakeClock     clock;
  AgentRegistry registry(AgentRegistryConfig{}, clock);

  assert(registry.Register("a1", {}, PermissionLevel::kIsolated));
  assert(registry.IsHealthy("a1", std::chrono::seconds(5)));

  // Exactly at the timeout is still healthy.
  clock.Advance(std::chrono::seconds(5));
  assert(registry.IsHealthy("a1", std::chrono::seconds(5)));

  clock.Advance(std::chrono::milliseconds(1));
  assert(!registry.IsHealthy("a1", std::chrono::seconds(5)));

  assert(registry.Heartbeat("a1"));
  assert(registry.IsHealthy("a1", std::chrono::seconds(5)));
  assert(registry.Get("a1").value().last_heartbeat == clock());

  assert(!registry.IsHealthy("missing", std::chrono::seconds(5)));
}

void TestConfiguredLivenessTimeout() {
  FakeClock           clock;
  AgentRegistryConfig config;
  config.liveness_timeout = std::chrono::seconds(30);
  AgentRegistry registry(config, clock);

  assert(registry.Register("a1", {}, PermissionLevel::kIsolated));
  clock.Advance(std::chrono::seconds(29));
  assert(registry.IsHealthy("a1"));
  clock.Advance(std::chrono::seconds(2));
  assert(!registry.IsHealthy("a1"));
}

void TestStaleAgentsReportsWithoutRemoving() {
  FakeClock     clock;
  AgentRegistry registry(AgentRegistryConfig{}, clock);

  assert(registry.Register("b", {}, PermissionLevel::kIsolated));
  assert(registry.Register("a", {}, PermissionLevel::kIsolated));
  clock.Advance(std::chrono::seconds(10));
  assert(registry.Register("c", {}, PermissionLevel::kIsolated));

  auto stale = registry.StaleAgents(std::chrono::seconds(5));
  assert((stale == std::vector<std::string>{"a", "b"}));
  assert(registry.Size() == 3);
}

void TestGetOrCreateIsIdempotent() {
  AgentRegistry registry;

  auto created = registry.GetOrCreate("agent-E1-A", {"epic-E1"}, PermissionLevel::kSandboxed, "/repo");
  assert(created.id == "agent-E1-A");
  assert(created.scope == "/repo");

  auto again = registry.GetOrCreate("agent-E1-A", {"other"}, PermissionLevel::kTrusted);
  assert(again.permission_level == PermissionLevel::kSandboxed);
  assert(again.capabilities.count("epic-E1") == 1);
  assert(again.capabilities.count("other") == 0);
  assert(registry.Size() == 1);
}

void TestCapacityLimitsExplicitRegistrationOnly() {
  AgentRegistryConfig config;
  config.max_agents = 2;
  AgentRegistry registry(config);

  assert(registry.Register("a1", {}, PermissionLevel::kIsolated));
  assert(registry.Register("a2", {}, PermissionLevel::kIsolated));
  assert(registry.Register("a3", {}, PermissionLevel::kIsolated).code() == ErrorCode::kResourceExhausted);

  // GetOrCreate never fails.
  auto agent = registry.GetOrCreate("a3", {}, PermissionLevel::kIsolated);
  assert(agent.id == "a3");
  assert(registry.Size() == 3);
}

void TestUnregisterAndList() {
  AgentRegistry registry;
  assert(registry.Register("z", {}, PermissionLevel::kIsolated));
  assert(registry.Register("m", {}, PermissionLevel::kIsolated));

  auto agents = registry.ListAgents();
  assert(agents.size() == 2);
  assert(agents[0].id == "m");
  assert(agents[1].id == "z");

  assert(registry.Unregister("m"));
  assert(registry.Unregister("m").code == ErrorCode::kUnknownAgent);
  assert(registry.Size() == 1);
}

void TestConcurrentRegisterAndHeartbeat() {
  AgentRegistry            registry;
  constexpr int            kThreads   = 8;
  constexpr int            kPerThread = 200;
  std::atomic<int>         duplicates{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const auto own = "agent-" + std::to_string(t) + "-" + std::to_string(i);
        assert(registry.Register(own, {}, PermissionLevel::kSandboxed));
        assert(registry.Heartbeat(own));

        // Every thread races on the same shared id.
        if (!registry.Register("shared", {}, PermissionLevel::kSandboxed)) duplicates++;
        assert(registry.Heartbeat("shared"));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(registry.Size() == kThreads * kPerThread + 1);
  assert(duplicates.load() == kThreads * kPerThread - 1);
}

} // namespace

int main() {
  TestRegisterAndDuplicate();
  TestRegisterRejectsEmptyId();
  TestHeartbeatUnknownAgent();
  TestHealthFollowsHeartbeats();
  TestConfiguredLivenessTimeout();
  TestStaleAgentsReportsWithoutRemoving();
  TestGetOrCreateIsIdempotent();
  TestCapacityLimitsExplicitRegistrationOnly();
  TestUnregisterAndList();
  TestConcurrentRegisterAndHeartbeat();

  std::cout << "epicflow_unit_agent_registry: pass\n";
  return 0;
}
