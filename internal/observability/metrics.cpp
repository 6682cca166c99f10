#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/export_target.hpp"
#include "internal/observability/logging.hpp"

namespace flowcheck::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ExportTarget& target) {
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = target.tls;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> node_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      check_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> flow_count;
};

bool InitializeMetrics(const flowcheck::config::FlowConfig& config) {
  ShutdownMetrics();
  if (!config.observability().metrics_enabled()) {
    return false;
  }

  const auto target = ResolveExportTarget(config.observability(), Signal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = target.interval;
  // the exporter must finish within one interval
  reader_options.export_timeout_millis = target.interval / 2;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(target), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", "flowcheck"}, {"service.version", "0.1.0"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  FLOWCHECK_LOG_DEBUG("metrics enabled", {StringField("endpoint", target.endpoint), IntField("interval_ms", target.interval.count())});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("flowcheck", "0.1.0");

  impl_->node_count        = impl_->meter->CreateUInt64Counter("flowcheck.node.count", "Flow nodes by final status", "1");
  impl_->check_duration_ms = impl_->meter->CreateDoubleHistogram("flowcheck.check.duration_ms", "Check execution time", "ms");
  impl_->flow_count        = impl_->meter->CreateUInt64Counter("flowcheck.flow.count", "Completed flows by overall status", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordNodeStatus(std::string_view status) {
  if (!impl_ || !impl_->node_count) {
    return;
  }
  const std::string                          label(status);
  const std::initializer_list<AttributePair> attributes = {{"status", label}};
  AddWithAttributes(impl_->node_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveCheckDurationMs(std::string_view check, double duration_ms) {
  if (!impl_ || !impl_->check_duration_ms) {
    return;
  }
  const std::string                          label(check);
  const std::initializer_list<AttributePair> attributes = {{"check", label}};
  RecordWithAttributes(impl_->check_duration_ms, duration_ms, attributes);
}

void Metrics::RecordFlow(std::string_view overall_status) {
  if (!impl_ || !impl_->flow_count) {
    return;
  }
  const std::string                          label(overall_status);
  const std::initializer_list<AttributePair> attributes = {{"overall_status", label}};
  AddWithAttributes(impl_->flow_count, static_cast<std::uint64_t>(1), attributes);
}

} // namespace flowcheck::observability

#endif
