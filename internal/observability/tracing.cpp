#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/export_target.hpp"
#include "internal/observability/logging.hpp"

namespace flowcheck::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace nostd     = opentelemetry::nostd;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr char kInstrumentation[] = "flowcheck";
constexpr char kVersion[]         = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider> g_provider;
nostd::shared_ptr<trace_api::Tracer>      g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ExportTarget& target) {
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = target.tls;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const flowcheck::config::FlowConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto target = ResolveExportTarget(config.observability(), Signal::kTraces);

  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", kInstrumentation}, {"service.version", kVersion}};
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(target), sdktrace::BatchSpanProcessorOptions{});
  g_provider     = sdktrace::TracerProviderFactory::Create(std::move(processor), opentelemetry::sdk::resource::Resource::Create(attrs));

  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kInstrumentation, kVersion);

  FLOWCHECK_LOG_DEBUG("tracing enabled", {StringField("endpoint", target.endpoint)});
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
}

// The scope makes the span current on the opening thread. Node spans open on
// worker threads, where nothing else is active, so each starts its own trace.
struct SpanScope::Impl {
  explicit Impl(nostd::shared_ptr<trace_api::Span> opened) : span(std::move(opened)), scope(span) {
  }

  nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                   scope;
};

SpanScope::SpanScope(std::string_view name) {
  if (g_tracer) {
    impl_ = std::make_unique<Impl>(g_tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    const std::string message(description);
    impl_->span->AddEvent("exception", {{"exception.message", message}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, message);
  }
}

} // namespace flowcheck::observability

#endif
