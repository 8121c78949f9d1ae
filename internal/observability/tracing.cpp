#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/ostream/span_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace graphvc::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace ostream   = opentelemetry::exporter::trace;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kTracerName    = "graphvc";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string OtlpEndpoint(const graphvc::runtime::config::TracingConfig& config) {
  if (!config.endpoint().empty()) {
    return config.endpoint();
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
}

// stdout spans are exported as they end; OTLP spans are batched
std::unique_ptr<sdktrace::SpanProcessor> BuildProcessor(const graphvc::runtime::config::TracingConfig& config) {
  if (config.exporter() == "stdout") {
    return sdktrace::SimpleSpanProcessorFactory::Create(ostream::OStreamSpanExporterFactory::Create());
  }
  if (!config.exporter().empty() && config.exporter() != "otlp") {
    throw std::runtime_error("unknown trace exporter: " + config.exporter());
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = OtlpEndpoint(config);
  options.use_ssl_credentials = false;
  return sdktrace::BatchSpanProcessorFactory::Create(otlp::OtlpGrpcExporterFactory::Create(options), sdktrace::BatchSpanProcessorOptions{});
}

std::unique_ptr<sdktrace::Sampler> BuildSampler(const graphvc::runtime::config::TracingConfig& config) {
  const double ratio = config.sample_ratio() > 0 ? config.sample_ratio() : 1.0;
  std::shared_ptr<sdktrace::Sampler> root = sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio);
  return sdktrace::ParentBasedSamplerFactory::Create(root);
}

} // namespace

bool InitializeTracing(const graphvc::runtime::config::RuntimeConfig& config) {
  const auto& tracing = config.tracing();
  if (!tracing.enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto service_name = tracing.service_name().empty() ? std::string(kTracerName) : tracing.service_name();
  auto       attributes   = resource::ResourceAttributes{{"service.name", service_name}, {"service.version", kTracerVersion}};

  auto provider = sdktrace::TracerProviderFactory::Create(BuildProcessor(tracing), resource::Resource::Create(attributes), BuildSampler(tracing));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_->span) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordError(std::string_view kind, std::string_view message) {
  if (!impl_->span) {
    return;
  }
  impl_->span->SetAttribute("graphvc.error.kind", std::string(kind));
  impl_->span->AddEvent("exception", {{"exception.type", std::string(kind)}, {"exception.message", std::string(message)}});
  // conflicts and misses are answers, not faults
  if (kind == "internal") {
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(message));
  }
}

} // namespace graphvc::observability

#endif
