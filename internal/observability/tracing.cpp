#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace cirrus::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerVersion = "1.0.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

} // namespace

std::string OtlpEndpoint(const cirrus::runtime::config::ObservabilityConfig& config, const char* signal_variable,
                         std::string_view default_path) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  if (const char* endpoint = std::getenv(signal_variable)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return std::string(endpoint) + std::string(default_path);
  }
  return "http://localhost:4318" + std::string(default_path);
}

std::string OtlpServiceName(const cirrus::runtime::config::ObservabilityConfig& config) {
  return config.service_name().empty() ? "cirrus" : config.service_name();
}

bool InitializeTracing(const cirrus::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  otlp::OtlpHttpExporterOptions options;
  options.url = OtlpEndpoint(observability, "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");

  const auto service_name = OtlpServiceName(observability);
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(otlp::OtlpHttpExporterFactory::Create(options),
                                                               sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor),
                                                           resource::Resource::Create({{"service.name", service_name}}));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(service_name, kTracerVersion);
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
  // tracing disabled: spans stay empty
  if (!g_tracer) {
    return;
  }
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_->span) {
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

void SpanScope::MarkFailed(std::string_view error_kind, std::string_view message) {
  if (impl_->span) {
    impl_->span->SetAttribute("cirrus.error.kind", std::string(error_kind));
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(message));
  }
}

} // namespace cirrus::observability

#endif
