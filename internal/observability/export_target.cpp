#include "internal/observability/export_target.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace flowcheck::observability {
namespace {

const char* SignalEnv(Signal signal) {
  return signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

std::string CollectorDefault(OtlpTransport transport, Signal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

ExportTarget ResolveExportTarget(const flowcheck::config::ObservabilityConfig& config, Signal signal) {
  ExportTarget target;
  if (config.transport() == flowcheck::config::OTLP_TRANSPORT_HTTP) {
    target.transport = OtlpTransport::kHttpProtobuf;
  }

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = EnvOrNull(SignalEnv(signal))) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = CollectorDefault(target.transport, signal);
  }

  target.tls = target.transport == OtlpTransport::kGrpc && target.endpoint.rfind("https://", 0) == 0;
  if (config.metrics_interval_ms() > 0) {
    target.interval = std::chrono::milliseconds(config.metrics_interval_ms());
  }
  return target;
}

} // namespace flowcheck::observability
