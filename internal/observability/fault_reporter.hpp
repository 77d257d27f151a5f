#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

namespace cirrus::observability {

/*
  Collaborator that receives unexpected failures (anything that is not a
  classified gateway error). Implementations must not throw.
*/
class FaultReporter {
 public:
  virtual ~FaultReporter() = default;

  virtual void Report(std::string_view component, std::string_view error_class, std::string_view message) noexcept = 0;
};

using FaultReporterPtr = std::shared_ptr<FaultReporter>;

// Writes faults to the error log and the fault counter.
class LoggingFaultReporter final : public FaultReporter {
 public:
  void Report(std::string_view component, std::string_view error_class, std::string_view message) noexcept override;

  uint64_t ReportedCount() const {
    return reported_.load();
  }

 private:
  std::atomic<uint64_t> reported_{0};
};

// Demangled dynamic type of the exception.
std::string ErrorClassName(const std::exception& e);

// Reports `e` and returns the message of the util::InternalError that replaces it.
std::string ReportFault(FaultReporter& reporter, std::string_view component, const std::exception& e);

} // namespace cirrus::observability
