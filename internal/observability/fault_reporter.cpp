#include "internal/observability/fault_reporter.hpp"

#include <boost/core/demangle.hpp>

#include <typeinfo>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace cirrus::observability {

void LoggingFaultReporter::Report(std::string_view component, std::string_view error_class, std::string_view message) noexcept {
  reported_.fetch_add(1);
  try {
    CIRRUS_LOG_ERROR("fault", {StringField("component", component), StringField("class", error_class), StringField("message", message)});
    Metrics::Instance().RecordFault(error_class);
  } catch (const std::exception&) {
    // logging itself failed; the counter above still records the fault
  }
}

std::string ErrorClassName(const std::exception& e) {
  return boost::core::demangle(typeid(e).name());
}

std::string ReportFault(FaultReporter& reporter, std::string_view component, const std::exception& e) {
  const auto error_class = ErrorClassName(e);
  reporter.Report(component, error_class, e.what());
  return std::string(component) + ": unexpected " + error_class;
}

} // namespace cirrus::observability
