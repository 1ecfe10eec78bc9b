#include "internal/permission/permission_guard.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using epicflow::permission::IsWithinScope;
using epicflow::permission::Operation;
using epicflow::permission::OperationKind;
using epicflow::permission::PermissionGuard;
using epicflow::permission::PermissionLevel;
using epicflow::util::ErrorCode;

void TestTierMatrix() {
  assert(PermissionGuard::IsAllowed(PermissionLevel::kIsolated, OperationKind::kReadOnly));
  assert(!PermissionGuard::IsAllowed(PermissionLevel::kIsolated, OperationKind::kScoped));
  assert(!PermissionGuard::IsAllowed(PermissionLevel::kIsolated, OperationKind::kUnrestricted));

  assert(PermissionGuard::IsAllowed(PermissionLevel::kSandboxed, OperationKind::kReadOnly));
  assert(PermissionGuard::IsAllowed(PermissionLevel::kSandboxed, OperationKind::kScoped));
  assert(!PermissionGuard::IsAllowed(PermissionLevel::kSandboxed, OperationKind::kUnrestricted));

  assert(PermissionGuard::IsAllowed(PermissionLevel::kTrusted, OperationKind::kReadOnly));
  assert(PermissionGuard::IsAllowed(PermissionLevel::kTrusted, OperationKind::kScoped));
  assert(PermissionGuard::IsAllowed(PermissionLevel::kTrusted, OperationKind::kUnrestricted));
}

void TestScopeContainment() {
  assert(IsWithinScope("/work/repo", "/work/repo"));
  assert(IsWithinScope("/work/repo/src/a.cpp", "/work/repo"));
  assert(IsWithinScope("/work/repo/src", "/work/repo/"));
  assert(!IsWithinScope("/work/repository", "/work/repo"));
  assert(!IsWithinScope("/work/repo/../etc/passwd", "/work/repo"));
  assert(!IsWithinScope("/etc", "/work/repo"));
  assert(!IsWithinScope("", "/work/repo"));
  assert(!IsWithinScope("/work/repo", ""));
}

void TestCheckEnforcesScopeForSandboxed() {
  const Operation inside{"write_file", OperationKind::kScoped, "/work/repo/out.txt"};
  const Operation outside{"write_file", OperationKind::kScoped, "/tmp/out.txt"};

  assert(PermissionGuard::Check(PermissionLevel::kSandboxed, inside, "/work/repo"));
  auto denied = PermissionGuard::Check(PermissionLevel::kSandboxed, outside, "/work/repo");
  assert(!denied);
  assert(denied.code == ErrorCode::kPermissionDenied);

  // Trusted agents are not confined.
  assert(PermissionGuard::Check(PermissionLevel::kTrusted, outside, "/work/repo"));
}

void TestCheckAllStopsAtFirstDenial() {
  const std::vector<Operation> ops = {
      {"read_file", OperationKind::kReadOnly, ""},
      {"run_shell", OperationKind::kUnrestricted, ""},
  };

  auto status = PermissionGuard::CheckAll(PermissionLevel::kSandboxed, ops, "/work");
  assert(!status);
  assert(status.code == ErrorCode::kPermissionDenied);
  assert(status.message.find("run_shell") != std::string::npos);

  assert(PermissionGuard::CheckAll(PermissionLevel::kTrusted, ops, "/work"));
  assert(PermissionGuard::CheckAll(PermissionLevel::kIsolated, {}, ""));
}

void TestClassifyHints() {
  PermissionGuard guard;

  assert(guard.Classify("read_file") == OperationKind::kReadOnly);
  assert(guard.Classify("SearchIndex") == OperationKind::kReadOnly);
  assert(guard.Classify("write_report") == OperationKind::kScoped);
  assert(guard.Classify("delete_branch") == OperationKind::kUnrestricted);

  // The most privileged hint wins.
  assert(guard.Classify("read_then_delete") == OperationKind::kUnrestricted);

  // Unknown actions take the default kind.
  assert(guard.Classify("frobnicate") == OperationKind::kUnrestricted);
  PermissionGuard lenient(OperationKind::kReadOnly);
  assert(lenient.Classify("frobnicate") == OperationKind::kReadOnly);
}

void TestRegisteredActionsOverrideHints() {
  PermissionGuard guard;
  guard.RegisterAction("Exec_Tests", OperationKind::kScoped);

  assert(guard.Classify("exec_tests") == OperationKind::kScoped);
  assert(guard.Classify("exec_other") == OperationKind::kUnrestricted);
}

void TestConcurrentRegisterAndClassify() {
  PermissionGuard          guard;
  std::vector<std::thread> threads;

  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&guard, t] {
      for (int i = 0; i < 500; ++i) {
        guard.RegisterAction("tool_" + std::to_string(t) + "_" + std::to_string(i), OperationKind::kReadOnly);
        (void)guard.Classify("tool_0_0");
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(guard.Classify("tool_3_499") == OperationKind::kReadOnly);
}

} // namespace

int main() {
  TestTierMatrix();
  TestScopeContainment();
  TestCheckEnforcesScopeForSandboxed();
  TestCheckAllStopsAtFirstDenial();
  TestClassifyHints();
  TestRegisteredActionsOverrideHints();
  TestConcurrentRegisterAndClassify();

  std::cout << "epicflow_unit_permission_guard: pass\n";
  return 0;
}
