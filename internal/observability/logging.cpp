#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace vidpipe::observability {
namespace {

constexpr const char* kLoggerName     = "vidpipe";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

struct LogSettings {
  std::string level{"info"};
  std::string pattern{kDefaultPattern};
  bool        trace_context{false};
};

// Environment overrides win over the config file.
LogSettings Resolve(const vidpipe::runtime::config::LoggingConfig& logging) {
  LogSettings settings;
  if (!logging.level().empty()) settings.level = logging.level();
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  settings.trace_context = logging.include_trace_context();

  if (const char* env = std::getenv("VIDPIPE_LOG_LEVEL"); env && *env) settings.level = env;
  if (const char* env = std::getenv("VIDPIPE_LOG_PATTERN"); env && *env) settings.pattern = env;
  if (const char* env = std::getenv("VIDPIPE_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(env);
    settings.trace_context = flag == "1" || flag == "true";
  }
  return settings;
}

/* key=value pairs; values with spaces, quotes or '=' are quoted so lines stay greppable */
void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out.push_back(' ');
  out.append(field.key).push_back('=');
  if (!field.value.empty() && field.value.find_first_of(" \"=") == std::string::npos) {
    out.append(field.value);
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  std::string out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) fmt::format_to(std::back_inserter(out), "{:02x}", static_cast<unsigned>(b));
  return out;
}

void AppendTraceContext(std::string& out) {
  if (!g_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto ctx = span->GetContext();
  if (!ctx.IsValid()) return;

  uint8_t trace_id[16];
  uint8_t span_id[8];
  ctx.trace_id().CopyBytesTo(trace_id);
  ctx.span_id().CopyBytesTo(span_id);
  AppendField(out, {"trace_id", Hex(trace_id)});
  AppendField(out, {"span_id", Hex(span_id)});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

void InitializeLogging(const vidpipe::runtime::config::RuntimeConfig& config) {
  const auto settings = Resolve(config.logging());

  // A second call replaces the registered logger.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_trace_context.store(settings.trace_context, std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string suffix;
  for (const auto& field : fields) AppendField(suffix, field);
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace vidpipe::observability
