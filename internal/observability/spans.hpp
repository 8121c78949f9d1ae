#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace graphvc::runtime::config {
class RuntimeConfig;
}

namespace graphvc::observability {

/*
  Tracing is compiled in with ENABLE_OTEL. Without it every call below
  is an inline no-op, so call sites never need their own #ifdef.

  config.tracing():
    exporter      otlp (default) | stdout
    endpoint      OTLP gRPC endpoint; falls back to OTEL_EXPORTER_OTLP_*
    sample_ratio  parent based ratio sampler for root spans
*/
bool InitializeTracing(const graphvc::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// One span per graph operation; ends on destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // kind is a short class name: not_found, conflict, validation, internal
  void RecordError(std::string_view kind, std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const graphvc::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordError(std::string_view, std::string_view) {
}
#endif

} // namespace graphvc::observability
