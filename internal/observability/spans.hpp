#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace cirrus::runtime::config {
class RuntimeConfig;
class ObservabilityConfig;
}

namespace cirrus::observability {

// Both are no-ops returning false unless built with ENABLE_OTEL and enabled
// in the observability config section.
bool InitializeTracing(const cirrus::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const cirrus::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  One span per request or service operation, active for the scope's
  lifetime. Failed operations carry their error kind as an attribute so a
  trace shows 404s apart from faults.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void MarkFailed(std::string_view error_kind, std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Gateway counters: requests by route and status, latency, retrieved bytes
// and reported faults.
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, int status);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void AddBytesStreamed(std::string_view route, std::uint64_t bytes);
  void RecordFault(std::string_view error_class);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifdef ENABLE_OTEL
// Configured endpoint, else the per-signal OTEL_EXPORTER_OTLP_* variable,
// else the generic one, else a local collector on `default_path`.
std::string OtlpEndpoint(const cirrus::runtime::config::ObservabilityConfig& config, const char* signal_variable,
                         std::string_view default_path);
std::string OtlpServiceName(const cirrus::runtime::config::ObservabilityConfig& config);
#else
inline bool InitializeTracing(const cirrus::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const cirrus::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::MarkFailed(std::string_view, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, int) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::AddBytesStreamed(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordFault(std::string_view) {
}
#endif

} // namespace cirrus::observability
