#include "internal/http/http_error.hpp"

namespace cirrus::http {

namespace beast_http = boost::beast::http;

beast_http::status StatusFor(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::ClientSyntax:
    case util::ErrorKind::DependencyUnavailable:
      return beast_http::status::service_unavailable;
    case util::ErrorKind::Unauthorized:
      return beast_http::status::unauthorized;
    case util::ErrorKind::Forbidden:
      return beast_http::status::forbidden;
    case util::ErrorKind::NotFound:
      return beast_http::status::not_found;
    case util::ErrorKind::Conflict:
      return beast_http::status::conflict;
    case util::ErrorKind::Storage:
    case util::ErrorKind::Internal:
      return beast_http::status::internal_server_error;
  }
  return beast_http::status::internal_server_error;
}

ErrorReply ToReply(const std::exception& e, observability::FaultReporter& faults, std::string_view component) {
  if (const auto* parse = dynamic_cast<const RequestParseError*>(&e)) {
    return {beast_http::status::bad_request, parse->what()};
  }
  if (const auto* gateway = dynamic_cast<const util::GatewayError*>(&e)) {
    return {StatusFor(gateway->Kind()), gateway->what()};
  }
  return {beast_http::status::internal_server_error, observability::ReportFault(faults, component, e)};
}

} // namespace cirrus::http
