#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace epicflow::runtime::config {
class RuntimeConfig;
}

namespace epicflow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Effective logger settings. Environment variables win over the
  logging section of the config:

    EPICFLOW_LOG_LEVEL                  level name understood by spdlog
    EPICFLOW_LOG_PATTERN                spdlog pattern
    EPICFLOW_LOG_INCLUDE_TRACE_CONTEXT  "1" or "true"
*/
struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  bool                      include_trace_context = false;
};

LogSettings ResolveLogSettings(const epicflow::runtime::config::RuntimeConfig& config);

void InitializeLogging(const epicflow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  ScopedLogContext

  Fields appended to every line logged from this thread while the scope
  is open. The coordinator opens one per executing sub-task, so lines
  from the registry, the guard and the work function carry the epic,
  sub-task and agent without passing them down. Scopes nest; a field
  given at the call site wins over a context field with the same key.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t restore_to_;
};

// Context fields of the calling thread, outermost first.
std::vector<LogField> CurrentLogContext();

// "message key=value ..." as written to the sink. Values with spaces,
// quotes or '=' are quoted.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace epicflow::observability

#define EPICFLOW_LOG_DEBUG(message, ...) ::epicflow::observability::LogDebug((message), ##__VA_ARGS__)
#define EPICFLOW_LOG_INFO(message, ...) ::epicflow::observability::LogInfo((message), ##__VA_ARGS__)
#define EPICFLOW_LOG_WARN(message, ...) ::epicflow::observability::LogWarn((message), ##__VA_ARGS__)
#define EPICFLOW_LOG_ERROR(message, ...) ::epicflow::observability::LogError((message), ##__VA_ARGS__)
