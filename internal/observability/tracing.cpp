#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "internal/observability/otlp_settings.hpp"

namespace vidpipe::observability {
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

using TracerHandle = opentelemetry::nostd::shared_ptr<trace_api::Tracer>;

std::mutex                                g_tracing_mu;
std::shared_ptr<sdktrace::TracerProvider> g_tracer_provider;
TracerHandle                              g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& config) {
  const auto endpoint = detail::ExportEndpoint(config, detail::Signal::kTraces);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions http;
    http.url = endpoint;
    return opentelemetry::exporter::otlp::OtlpHttpExporterFactory::Create(http);
  }
  opentelemetry::exporter::otlp::OtlpGrpcExporterOptions grpc_options;
  grpc_options.endpoint            = endpoint;
  grpc_options.use_ssl_credentials = !config.insecure;
  return opentelemetry::exporter::otlp::OtlpGrpcExporterFactory::Create(grpc_options);
}

bool Install(const OtlpConfig& config, bool simple_processor) {
  auto exporter = MakeSpanExporter(config);
  std::unique_ptr<sdktrace::SpanProcessor> processor =
      simple_processor ? sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter))
                       : sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});

  std::lock_guard<std::mutex> lock(g_tracing_mu);
  g_tracer_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), detail::ServiceResource(config)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));
  g_tracer = g_tracer_provider->GetTracer(detail::kInstrumentationName, detail::kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

// Falls back to whatever global provider is installed (noop by default).
TracerHandle CurrentTracer() {
  std::lock_guard<std::mutex> lock(g_tracing_mu);
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(detail::kInstrumentationName, detail::kInstrumentationVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  return Install(config, false);
}

bool InitializeTracing(const vidpipe::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }
  const bool simple = observability.tracing().processor() ==
                      vidpipe::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE;
  return Install(detail::FromRuntime(observability), simple);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard<std::mutex> lock(g_tracing_mu);
    provider = std::move(g_tracer_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

// ---------------------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;

  bool live() const { return static_cast<bool>(span); }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;
  impl_->span   = tracer->StartSpan(std::string(name));
  impl_->active = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->live()) return;
  impl_->active.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->live()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->live()) return;
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace vidpipe::observability

#endif
