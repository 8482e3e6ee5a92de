#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace vidpipe::service {

/*
  Span, request count and latency around one RPC body. Exceptions are
  logged and rethrown for the transport layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view key, std::string_view id, Fn&& fn) {
  vidpipe::observability::SpanScope span(route);
  if (!id.empty()) {
    span.SetAttribute(key, id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      vidpipe::observability::Metrics::Instance().RecordRequest(route, true);
      vidpipe::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      vidpipe::observability::Metrics::Instance().RecordRequest(route, true);
      vidpipe::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    VIDPIPE_LOG_WARN("RPC failed", {vidpipe::observability::StringField("route", route),
                                    vidpipe::observability::StringField(key, id),
                                    vidpipe::observability::StringField("error", ex.what())});
    vidpipe::observability::Metrics::Instance().RecordRequest(route, false);
    vidpipe::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace vidpipe::service
