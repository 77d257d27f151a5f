#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/fault_reporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace cirrus::service {

/*
  Runs one service operation inside a span with latency metrics.

  Classified gateway errors propagate unchanged. Anything else is handed to
  the fault reporter first and replaced by util::InternalError.
*/
template <typename Fn>
auto ObserveRequest(std::string_view route, observability::FaultReporter& faults, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const util::GatewayError& ex) {
    span.MarkFailed(util::ErrorKindName(ex.Kind()), ex.what());
    CIRRUS_LOG_WARN("request failed", {observability::StringField("route", route), observability::StringField("kind", util::ErrorKindName(ex.Kind())),
                                       observability::StringField("error", ex.what())});
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  } catch (const std::exception& ex) {
    span.MarkFailed("fault", ex.what());
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw util::InternalError(observability::ReportFault(faults, route, ex));
  }
}

} // namespace cirrus::service
