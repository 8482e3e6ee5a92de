#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace vidpipe::observability::detail {

inline constexpr const char* kInstrumentationName    = "vidpipe";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

enum class Signal { kTraces, kMetrics };

/*
  Endpoint precedence: explicit config, signal-specific OTEL env var,
  generic OTEL env var, then the collector default for the transport.
*/
inline std::string ExportEndpoint(const OtlpConfig& config, Signal signal) {
  if (!config.endpoint.empty()) return config.endpoint;

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  for (const char* name : {signal_env, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name); value && *value) return value;
  }

  if (config.transport != OtlpTransport::kHttpProtobuf) return "localhost:4317";
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

inline OtlpConfig FromRuntime(const vidpipe::runtime::config::ObservabilityConfig& observability) {
  OtlpConfig out;
  out.endpoint  = observability.otlp_endpoint();
  out.transport = observability.transport() == vidpipe::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return out;
}

inline opentelemetry::sdk::resource::Resource ServiceResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", config.service_name}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace vidpipe::observability::detail

#endif
