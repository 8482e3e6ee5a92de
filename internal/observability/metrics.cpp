#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <mutex>
#include <utility>
// The reader header moved between opentelemetry-cpp releases.
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define VIDPIPE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define VIDPIPE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "internal/observability/otlp_settings.hpp"

namespace vidpipe::observability {
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;
template <typename T>
using Handle = opentelemetry::nostd::shared_ptr<T>;

constexpr std::chrono::milliseconds kDefaultExportInterval{1000};

std::mutex                                 g_metrics_mu;
std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  const auto endpoint = detail::ExportEndpoint(config, detail::Signal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    opentelemetry::exporter::otlp::OtlpHttpMetricExporterOptions http;
    http.url = endpoint;
    return opentelemetry::exporter::otlp::OtlpHttpMetricExporterFactory::Create(http);
  }
  opentelemetry::exporter::otlp::OtlpGrpcMetricExporterOptions grpc_options;
  grpc_options.endpoint            = endpoint;
  grpc_options.use_ssl_credentials = !config.insecure;
  return opentelemetry::exporter::otlp::OtlpGrpcMetricExporterFactory::Create(grpc_options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const OtlpConfig& config, const sdkmetrics::PeriodicExportingMetricReaderOptions& options) {
#ifdef VIDPIPE_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(config), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(config), options);
#endif
}

/* SDK releases differ in AddMetricReader ownership and in whether Add/Record take a Context. */
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Counter, typename Value>
void Increment(const Handle<Counter>& counter, Value value, Attributes attributes) {
  if (!counter) return;
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

template <typename Histogram>
void Sample(const Handle<Histogram>& histogram, double value, Attributes attributes) {
  if (!histogram) return;
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

void Install(const OtlpConfig& config, const sdkmetrics::PeriodicExportingMetricReaderOptions& options) {
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), detail::ServiceResource(config));
  AttachReader(*provider, MakeReader(config, options));

  std::lock_guard<std::mutex> lock(g_metrics_mu);
  g_meter_provider = provider;
  metrics_api::Provider::SetMeterProvider(Handle<metrics_api::MeterProvider>(g_meter_provider));
}

} // namespace

bool InitializeMetrics(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = kDefaultExportInterval;
  Install(config, options);
  return true;
}

bool InitializeMetrics(const vidpipe::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto&                                      tuning = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis =
      tuning.collection_interval_ms() > 0 ? std::chrono::milliseconds(tuning.collection_interval_ms()) : kDefaultExportInterval;
  if (tuning.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(tuning.export_timeout_ms());
  }

  Install(detail::FromRuntime(observability), options);
  return true;
}

void ShutdownMetrics() {
  std::shared_ptr<sdkmetrics::MeterProvider> provider;
  {
    std::lock_guard<std::mutex> lock(g_metrics_mu);
    provider = std::move(g_meter_provider);
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

// ---------------------------------------------------------------------------

struct Metrics::Impl {
  Handle<metrics_api::Meter> meter;

  // ingestion endpoint
  Handle<metrics_api::Counter<std::uint64_t>> requests;
  Handle<metrics_api::Histogram<double>>      request_latency;
  Handle<metrics_api::Counter<std::uint64_t>> ingested_bytes;

  // worker pool
  Handle<metrics_api::Histogram<double>>      stage_duration;
  Handle<metrics_api::Counter<std::uint64_t>> job_outcomes;
  Handle<metrics_api::Histogram<double>>      queue_depth;
};

/*
  Instruments bind to whichever provider is global when Instance() is first
  called, so the server initializes metrics before building any service.
*/
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& m = *impl_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter(detail::kInstrumentationName, detail::kInstrumentationVersion);

  m.requests        = m.meter->CreateUInt64Counter("vidpipe.request.count", "1", "gRPC requests handled, by route and success");
  m.request_latency = m.meter->CreateDoubleHistogram("vidpipe.request.latency_ms", "ms", "gRPC request latency");
  m.ingested_bytes  = m.meter->CreateUInt64Counter("vidpipe.ingest.bytes", "By", "Upload bytes accepted into staging");
  m.stage_duration  = m.meter->CreateDoubleHistogram("vidpipe.pipeline.stage_duration_ms", "ms", "Wall time per processing stage");
  m.job_outcomes    = m.meter->CreateUInt64Counter("vidpipe.pipeline.job_outcomes", "1", "Finished job runs, by outcome");
  m.queue_depth     = m.meter->CreateDoubleHistogram("vidpipe.queue.depth", "1", "Queued plus leased jobs seen at claim time");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Increment(impl_->requests, std::uint64_t{1}, {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Sample(impl_->request_latency, latency_ms, {{"route", std::string(route)}});
}

void Metrics::ObserveStageDurationMs(std::string_view stage, double duration_ms) {
  Sample(impl_->stage_duration, duration_ms, {{"stage", std::string(stage)}});
}

void Metrics::RecordJobOutcome(std::string_view outcome) {
  Increment(impl_->job_outcomes, std::uint64_t{1}, {{"outcome", std::string(outcome)}});
}

void Metrics::RecordIngestedBytes(std::uint64_t bytes) {
  Increment(impl_->ingested_bytes, bytes, {});
}

void Metrics::ObserveQueueDepth(std::uint64_t depth) {
  Sample(impl_->queue_depth, static_cast<double>(depth), {});
}

} // namespace vidpipe::observability

#endif
