#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#endif

namespace epicflow::observability {
namespace {

constexpr const char* kLoggerName     = "epicflow";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [tid %t] %v";

thread_local std::vector<LogField> t_context;

std::atomic<bool> g_include_trace_context{false};

std::string FirstSet(const char* env_name, const std::string& configured, std::string fallback) {
  if (const char* value = std::getenv(env_name); value && *value) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off; silence only on request.
  if (level == spdlog::level::off && name != "off") return spdlog::level::info;
  return level;
}

bool NeedsQuotes(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line.push_back(' ');
  line.append(key);
  line.push_back('=');
  if (!NeedsQuotes(value)) {
    line.append(value);
    return;
  }
  line.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    line.push_back(c);
  }
  line.push_back('"');
}

bool HasKey(std::initializer_list<LogField> fields, const std::string& key) {
  for (const auto& field : fields) {
    if (field.key == key) return true;
  }
  return false;
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  AppendField(line, "trace_id", std::string_view(trace_id, sizeof(trace_id)));
  AppendField(line, "span_id", std::string_view(span_id, sizeof(span_id)));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

// ------------------------------------------------------------
// Setup
// ------------------------------------------------------------

LogSettings ResolveLogSettings(const epicflow::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  settings.level   = ParseLevel(FirstSet("EPICFLOW_LOG_LEVEL", logging.level(), "info"));
  settings.pattern = FirstSet("EPICFLOW_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  const char* include_trace       = std::getenv("EPICFLOW_LOG_INCLUDE_TRACE_CONTEXT");
  settings.include_trace_context = include_trace ? (std::string_view(include_trace) == "1" || std::string_view(include_trace) == "true")
                                                 : logging.include_trace_context();
  return settings;
}

void InitializeLogging(const epicflow::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveLogSettings(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context.store(settings.include_trace_context);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

// ------------------------------------------------------------
// Context
// ------------------------------------------------------------

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : restore_to_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(restore_to_);
}

std::vector<LogField> CurrentLogContext() {
  return t_context;
}

// ------------------------------------------------------------
// Emit
// ------------------------------------------------------------

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }

  // A nested scope shadows an outer field with the same key.
  for (std::size_t i = 0; i < t_context.size(); ++i) {
    const auto& field = t_context[i];
    if (HasKey(fields, field.key)) continue;

    bool shadowed = false;
    for (std::size_t j = i + 1; j < t_context.size() && !shadowed; ++j) {
      shadowed = t_context[j].key == field.key;
    }
    if (!shadowed) AppendField(line, field.key, field.value);
  }

  if (g_include_trace_context.load()) {
    AppendTraceContext(line);
  }
  return line;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;
  logger->log(level, "{}", FormatLogLine(message, fields));
}

} // namespace epicflow::observability
