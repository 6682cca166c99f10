#pragma once

#include <chrono>
#include <string>

namespace flowcheck::config {
class ObservabilityConfig;
}

namespace flowcheck::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class Signal {
  kTraces,
  kMetrics,
};

/*
  Where one OTLP signal is shipped. The endpoint comes from the config,
  then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the local collector default for the
  transport. gRPC uses TLS only for an https:// endpoint.
*/
struct ExportTarget {
  OtlpTransport             transport{OtlpTransport::kGrpc};
  std::string               endpoint;
  bool                      tls{false};
  std::chrono::milliseconds interval{1000};
};

ExportTarget ResolveExportTarget(const flowcheck::config::ObservabilityConfig& config, Signal signal);

} // namespace flowcheck::observability
