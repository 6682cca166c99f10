#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace flowcheck::config {
class FlowConfig;
}

namespace flowcheck::observability {

// Returns false when the corresponding signal stays disabled. Calling again
// replaces the previous provider.
bool InitializeTracing(const flowcheck::config::FlowConfig& config);
bool InitializeMetrics(const flowcheck::config::FlowConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Flow metrics:
    flowcheck.node.count{status}
    flowcheck.check.duration_ms{check}
    flowcheck.flow.count{overall_status}
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordNodeStatus(std::string_view status);
  void ObserveCheckDurationMs(std::string_view check, double duration_ms);
  void RecordFlow(std::string_view overall_status);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const flowcheck::config::FlowConfig&) {
  return false;
}

inline bool InitializeMetrics(const flowcheck::config::FlowConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordNodeStatus(std::string_view) {
}

inline void Metrics::ObserveCheckDurationMs(std::string_view, double) {
}

inline void Metrics::RecordFlow(std::string_view) {
}
#endif

} // namespace flowcheck::observability
