#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vidpipe::runtime::config {
class RuntimeConfig;
}

namespace vidpipe::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"vidpipe"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const vidpipe::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const vidpipe::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/* RAII span; becomes the active span for its lifetime. */
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

/* Process-wide pipeline instruments. */
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  void RecordJobOutcome(std::string_view outcome);
  void RecordIngestedBytes(std::uint64_t bytes);
  void ObserveQueueDepth(std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
// Built without opentelemetry-cpp: every hook compiles to nothing.
inline bool InitializeTracing(const OtlpConfig&) { return false; }
inline bool InitializeMetrics(const OtlpConfig&) { return false; }
inline bool InitializeTracing(const vidpipe::runtime::config::RuntimeConfig&) { return false; }
inline bool InitializeMetrics(const vidpipe::runtime::config::RuntimeConfig&) { return false; }
inline void ShutdownTracing() {}
inline void ShutdownMetrics() {}

inline SpanScope::SpanScope(std::string_view) {}
inline SpanScope::~SpanScope() = default;
inline SpanScope::SpanScope(SpanScope&&) noexcept            = default;
inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;
inline void SpanScope::SetAttribute(std::string_view, std::string_view) {}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
inline void SpanScope::SetAttribute(std::string_view, double) {}
inline void SpanScope::AddEvent(std::string_view) {}
inline void SpanScope::RecordException(std::string_view) {}

inline Metrics::Metrics() = default;
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool) {}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {}
inline void Metrics::ObserveStageDurationMs(std::string_view, double) {}
inline void Metrics::RecordJobOutcome(std::string_view) {}
inline void Metrics::RecordIngestedBytes(std::uint64_t) {}
inline void Metrics::ObserveQueueDepth(std::uint64_t) {}
#endif

} // namespace vidpipe::observability
