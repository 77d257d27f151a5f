#pragma once

#include <boost/beast/http/status.hpp>

#include <exception>
#include <string>
#include <string_view>

#include "internal/observability/fault_reporter.hpp"
#include "internal/util/errors.hpp"

namespace cirrus::http {

// Request line, target or query could not be interpreted.
class RequestParseError : public std::runtime_error {
 public:
  explicit RequestParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct ErrorReply {
  boost::beast::http::status status = boost::beast::http::status::internal_server_error;
  std::string                message;
};

boost::beast::http::status StatusFor(util::ErrorKind kind);

/*
  Translates a failure into the HTTP reply.

    RequestParseError      -> 400
    ClientSyntax           -> 503
    Unauthorized           -> 401
    Forbidden              -> 403
    NotFound               -> 404
    Conflict               -> 409
    DependencyUnavailable  -> 503
    Storage, Internal      -> 500

  Any other exception is reported to `faults` before becoming a 500.
*/
ErrorReply ToReply(const std::exception& e, observability::FaultReporter& faults, std::string_view component);

} // namespace cirrus::http
