#include "permission_guard.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

namespace epicflow::permission {

namespace {

constexpr std::array<std::string_view, 5> kReadOnlyHints     = {"read", "get", "list", "search", "inspect"};
constexpr std::array<std::string_view, 4> kScopedHints       = {"write", "update", "create", "save"};
constexpr std::array<std::string_view, 7> kUnrestrictedHints = {"delete", "drop", "remove", "system", "admin", "exec", "shell"};

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <size_t N>
bool ContainsAny(const std::string& haystack, const std::array<std::string_view, N>& needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) { return haystack.find(n) != std::string::npos; });
}

bool HasParentSegment(std::string_view path) {
  size_t start = 0;
  while (start <= path.size()) {
    const auto end     = path.find('/', start);
    const auto segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (segment == "..") return true;
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
  return false;
}

std::string_view TrimTrailingSlashes(std::string_view path) {
  while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
  return path;
}

} // namespace

std::string_view ToString(PermissionLevel level) {
  switch (level) {
    case PermissionLevel::kIsolated:
      return "isolated";
    case PermissionLevel::kSandboxed:
      return "sandboxed";
    case PermissionLevel::kTrusted:
      return "trusted";
  }
  return "unknown";
}

std::string_view ToString(OperationKind kind) {
  switch (kind) {
    case OperationKind::kReadOnly:
      return "read_only";
    case OperationKind::kScoped:
      return "scoped";
    case OperationKind::kUnrestricted:
      return "unrestricted";
  }
  return "unknown";
}

bool IsWithinScope(std::string_view resource, std::string_view scope) {
  if (resource.empty() || scope.empty()) return false;
  if (HasParentSegment(resource)) return false;

  scope    = TrimTrailingSlashes(scope);
  resource = TrimTrailingSlashes(resource);

  if (scope == "/") return resource.front() == '/';
  if (resource == scope) return true;
  return resource.size() > scope.size() && resource.substr(0, scope.size()) == scope && resource[scope.size()] == '/';
}

PermissionGuard::PermissionGuard(OperationKind default_kind) : default_kind_(default_kind) {
}

bool PermissionGuard::IsAllowed(PermissionLevel level, OperationKind kind) {
  switch (level) {
    case PermissionLevel::kTrusted:
      return true;
    case PermissionLevel::kSandboxed:
      return kind == OperationKind::kReadOnly || kind == OperationKind::kScoped;
    case PermissionLevel::kIsolated:
      return kind == OperationKind::kReadOnly;
  }
  return false;
}

util::Status PermissionGuard::Check(PermissionLevel level, const Operation& operation, std::string_view scope) {
  if (!IsAllowed(level, operation.kind)) {
    return util::Status::Err(util::ErrorCode::kPermissionDenied, "operation '" + operation.name + "' (" + std::string(ToString(operation.kind)) +
                                                                     ") not permitted at level " + std::string(ToString(level)));
  }

  // Trusted agents are not confined; sandboxed ones must stay inside their scope.
  if (operation.kind == OperationKind::kScoped && level == PermissionLevel::kSandboxed && !IsWithinScope(operation.resource, scope)) {
    return util::Status::Err(util::ErrorCode::kPermissionDenied,
                             "operation '" + operation.name + "' resource '" + operation.resource + "' escapes scope '" + std::string(scope) + "'");
  }

  return util::Status::Ok();
}

util::Status PermissionGuard::CheckAll(PermissionLevel level, const std::vector<Operation>& operations, std::string_view scope) {
  for (const auto& operation : operations) {
    if (auto status = Check(level, operation, scope); !status) {
      return status;
    }
  }
  return util::Status::Ok();
}

OperationKind PermissionGuard::Classify(std::string_view action) const {
  if (action.empty()) return default_kind_;

  const auto lowered = Lower(action);
  {
    std::shared_lock lock(mutex_);
    if (auto it = registered_.find(lowered); it != registered_.end()) {
      return it->second;
    }
  }

  // Most privileged hint wins so "read_and_delete" is not waved through.
  if (ContainsAny(lowered, kUnrestrictedHints)) return OperationKind::kUnrestricted;
  if (ContainsAny(lowered, kScopedHints)) return OperationKind::kScoped;
  if (ContainsAny(lowered, kReadOnlyHints)) return OperationKind::kReadOnly;

  return default_kind_;
}

void PermissionGuard::RegisterAction(std::string name, OperationKind kind) {
  auto             key = Lower(name);
  std::unique_lock lock(mutex_);
  registered_[std::move(key)] = kind;
}

} // namespace epicflow::permission
