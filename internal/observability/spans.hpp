#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace epicflow::runtime::config {
class RuntimeConfig;
}

namespace epicflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"epicflow"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const epicflow::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const epicflow::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide sub-task instruments. Outcome labels are terminal status
  names ("completed", "failed").
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordSubTaskOutcome(std::string_view status);
  void ObserveSubTaskDurationMs(double duration_ms);
  void SetInFlightSubTasks(std::int64_t in_flight);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const epicflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const epicflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordSubTaskOutcome(std::string_view) {
}

inline void Metrics::ObserveSubTaskDurationMs(double) {
}

inline void Metrics::SetInFlightSubTasks(std::int64_t) {
}
#endif

} // namespace epicflow::observability
