#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/util/result.hpp"

namespace epicflow::permission {

/*
  Coarse sandboxing tiers, ordered by privilege.
*/
enum class PermissionLevel : std::uint8_t {
  kIsolated  = 0,
  kSandboxed = 1,
  kTrusted   = 2,
};

/*
  What an operation touches:
    kReadOnly      side-effect-free inspection
    kScoped        side effects confined to the agent's declared scope
    kUnrestricted  anything else (network, deletion, process control)
*/
enum class OperationKind : std::uint8_t {
  kReadOnly     = 0,
  kScoped       = 1,
  kUnrestricted = 2,
};

struct Operation {
  std::string   name;
  OperationKind kind = OperationKind::kReadOnly;

  // Path or resource id; only consulted for kScoped operations.
  std::string resource;
};

std::string_view ToString(PermissionLevel level);
std::string_view ToString(OperationKind kind);

class PermissionGuard {
 public:
  explicit PermissionGuard(OperationKind default_kind = OperationKind::kUnrestricted);

  // Pure tier check, no scope awareness.
  static bool IsAllowed(PermissionLevel level, OperationKind kind);

  // Tier check plus scope containment for kScoped operations.
  static util::Status Check(PermissionLevel level, const Operation& operation, std::string_view scope);

  static util::Status CheckAll(PermissionLevel level, const std::vector<Operation>& operations, std::string_view scope);

  OperationKind Classify(std::string_view action) const;

  void RegisterAction(std::string name, OperationKind kind);

 private:
  OperationKind default_kind_;

  mutable std::shared_mutex                      mutex_;
  std::unordered_map<std::string, OperationKind> registered_;
};

// True when resource names a location at or below scope.
bool IsWithinScope(std::string_view resource, std::string_view scope);

} // namespace epicflow::permission
