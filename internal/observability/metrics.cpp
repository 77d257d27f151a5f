#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace cirrus::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

opentelemetry::nostd::string_view Label(std::string_view value) {
  return opentelemetry::nostd::string_view(value.data(), value.size());
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bytes_streamed;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> fault_count;
};

bool InitializeMetrics(const cirrus::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpHttpMetricExporterOptions options;
  options.url   = OtlpEndpoint(observability, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");
  auto exporter = otlp::OtlpHttpMetricExporterFactory::Create(options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", OtlpServiceName(observability)}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("cirrus", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("cirrus.request.count", "Total number of HTTP requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("cirrus.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->bytes_streamed     = impl_->meter->CreateUInt64Counter("cirrus.retrieve.bytes", "Object bytes written to clients", "By");
  impl_->fault_count        = impl_->meter->CreateUInt64Counter("cirrus.fault.count", "Unexpected failures reported as faults", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, int status) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", Label(route)}, {"status", static_cast<int64_t>(status)}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", Label(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::AddBytesStreamed(std::string_view route, std::uint64_t bytes) {
  if (!impl_ || !impl_->bytes_streamed) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", Label(route)}};
  impl_->bytes_streamed->Add(bytes, attributes);
}

void Metrics::RecordFault(std::string_view error_class) {
  if (!impl_ || !impl_->fault_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"class", Label(error_class)}};
  impl_->fault_count->Add(1, attributes);
}

} // namespace cirrus::observability

#endif
