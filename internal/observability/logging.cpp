#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace graphvc::observability {
namespace {

constexpr const char* kLoggerName     = "graphvc";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// environment first, then config, then fallback
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) return value;
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const graphvc::runtime::config::RuntimeConfig& config) {
  const char* env = std::getenv("GRAPHVC_LOG_INCLUDE_TRACE_CONTEXT");
  if (env == nullptr) return config.logging().include_trace_context();
  const std::string_view flag(env);
  return flag == "1" || flag == "true";
}

bool g_include_trace_context{false};

void AppendField(std::ostringstream& line, const LogField& field) {
  line << ' ' << field.key << '=';
  if (field.value.empty() || field.value.find_first_of(" \t\"=") != std::string::npos) {
    line << std::quoted(field.value);
  } else {
    line << field.value;
  }
}

#ifdef ENABLE_OTEL
template <std::size_t N>
void AppendHex(std::ostringstream& line, const char* key, const uint8_t (&bytes)[N]) {
  line << ' ' << key << '=' << std::hex << std::setfill('0');
  for (const uint8_t b : bytes) line << std::setw(2) << static_cast<unsigned>(b);
  line << std::dec;
}

void AppendTraceContext(std::ostringstream& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) return;

  const auto context = span->GetContext();
  uint8_t    trace_id[16];
  uint8_t    span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  AppendHex(line, "trace_id", trace_id);
  AppendHex(line, "span_id", span_id);
}
#else
void AppendTraceContext(std::ostringstream&) {}
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

LogField PathsField(std::string_view key, const std::vector<std::string>& paths) {
  std::string joined;
  for (const auto& path : paths) {
    if (!joined.empty()) joined.push_back(',');
    joined += path;
  }
  return {std::string(key), std::move(joined)};
}

// stderr keeps stdout free for the CLI's JSON output
void InitializeLogging(const graphvc::runtime::config::RuntimeConfig& config) {
  spdlog::drop(kLoggerName);

  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!config.logging().file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logging().file()));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(Setting("GRAPHVC_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("GRAPHVC_LOG_LEVEL", config.logging().level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = TraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  std::ostringstream line;
  line << message;
  for (const auto& field : fields) AppendField(line, field);
  AppendTraceContext(line);
  logger->log(level, "{}", line.str());
}

} // namespace graphvc::observability
