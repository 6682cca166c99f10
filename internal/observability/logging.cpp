#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_id.h>
#include <opentelemetry/trace/trace_id.h>
#endif

namespace flowcheck::observability {
namespace {

constexpr char kLoggerName[]     = "flowcheck";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// FLOWCHECK_LOG_LEVEL, FLOWCHECK_LOG_PATTERN and
// FLOWCHECK_LOG_INCLUDE_TRACE_CONTEXT win over the logging section.
struct LogSettings {
  std::string level{"info"};
  std::string pattern{kDefaultPattern};
  bool        trace_context{false};
};

std::string EnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

LogSettings Resolve(const flowcheck::config::LoggingConfig& logging) {
  LogSettings settings;
  settings.level   = EnvOr("FLOWCHECK_LOG_LEVEL", logging.level(), settings.level);
  settings.pattern = EnvOr("FLOWCHECK_LOG_PATTERN", logging.pattern(), settings.pattern);

  const auto trace = EnvOr("FLOWCHECK_LOG_INCLUDE_TRACE_CONTEXT", "", logging.include_trace_context() ? "true" : "false");
  settings.trace_context = trace == "1" || trace == "true";
  return settings;
}

std::atomic<bool> g_trace_context{false};

void AppendTraceContext(std::string& line) {
#ifdef ENABLE_OTEL
  if (!g_trace_context.load(std::memory_order_relaxed)) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  line.append(" trace_id=").append(trace_id, sizeof(trace_id));
  line.append(" span_id=").append(span_id, sizeof(span_id));
#else
  (void)line;
#endif
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const flowcheck::config::FlowConfig& config) {
  const auto settings = Resolve(config.logging());

  // stdout carries the report text and --json output
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_trace_context.store(settings.trace_context, std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line.append(1, ' ').append(field.key).append(1, '=').append(field.value);
  }
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace flowcheck::observability
