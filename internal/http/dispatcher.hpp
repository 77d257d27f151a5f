#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cirrus/gateway/v1.hpp"
#include "internal/access/access_evaluator.hpp"
#include "internal/access/authenticator.hpp"
#include "internal/access/request_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/http_error.hpp"
#include "internal/http/request_parser.hpp"
#include "internal/observability/fault_reporter.hpp"
#include "internal/retrieval/byte_stream.hpp"
#include "internal/service/read_service.hpp"
#include "internal/service/write_service.hpp"

namespace cirrus::http {

using Request = boost::beast::http::request<boost::beast::http::string_body>;

/*
  Fully decided reply to one request.

  When `stream` is set the body is pulled from it after the header has been
  sent; otherwise `body` is the complete payload. `content_length` is
  authoritative for both, and for HEAD replies that carry no body at all.
*/
struct GatewayResponse {
  boost::beast::http::status status = boost::beast::http::status::ok;
  boost::beast::http::fields headers;

  std::string                            body;
  std::unique_ptr<retrieval::ByteStream> stream;
  uint64_t                               content_length = 0;
  bool                                   headers_only   = false;

  std::string route;
};

struct GatewayOptions {
  ServiceRole role = ServiceRole::Reader;
  std::string service_domain;
};

/*
  Routes parsed requests to the read or write service.

  Every action has a fixed required access level. The collection policy is
  evaluated before the handler runs; handlers only see authorized requests.
*/
class Gateway {
 public:
  Gateway(GatewayOptions options, std::shared_ptr<db::Repository> repository, std::shared_ptr<service::ReadService> read,
          std::shared_ptr<service::WriteService> write, access::AuthenticatorPtr authenticator, observability::FaultReporterPtr faults);

  // Never throws; every failure becomes an error response.
  GatewayResponse Handle(const Request& request, std::string_view peer_address);

  ServiceRole Role() const {
    return options_.role;
  }

 private:
  struct RouteContext {
    const Request&                   request;
    const ParsedRequest&             parsed;
    const db::model::CollectionRecord& collection;
  };

  using Handler = GatewayResponse (Gateway::*)(const RouteContext&);

  struct Route {
    Handler                       handler;
    gateway::v1::AccessLevel      level;
  };

  static const std::map<ActionKind, Route>& Routes();

  GatewayResponse Dispatch(const Request& request, const ParsedRequest& parsed, std::string_view peer_address);
  db::model::CollectionRecord LookupCollection(const std::string& name);

  GatewayResponse Retrieve(const RouteContext& ctx);
  GatewayResponse Meta(const RouteContext& ctx);
  GatewayResponse ListKeys(const RouteContext& ctx);
  GatewayResponse ListVersions(const RouteContext& ctx);
  GatewayResponse ListConjoined(const RouteContext& ctx);
  GatewayResponse ListUploads(const RouteContext& ctx);
  GatewayResponse SpaceUsage(const RouteContext& ctx);
  GatewayResponse Archive(const RouteContext& ctx);
  GatewayResponse Delete(const RouteContext& ctx);
  GatewayResponse Conjoined(const RouteContext& ctx);

  service::ReadService&  Reader();
  service::WriteService& Writer();

  GatewayOptions                         options_;
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<service::ReadService>  read_;
  std::shared_ptr<service::WriteService> write_;
  access::AuthenticatorPtr               authenticator_;
  observability::FaultReporterPtr        faults_;
};

// Plain text reply with Connection: close.
GatewayResponse TextResponse(boost::beast::http::status status, std::string body);

// Proto message printed as JSON with the proto field names.
GatewayResponse JsonResponse(boost::beast::http::status status, const google::protobuf::Message& message);

GatewayResponse ErrorResponse(const ErrorReply& reply);

// Reply that ends the request for a decision that is not a grant, nullopt
// when the handler may run. An outcome outside the known set is reported as
// a fault and answered with 500.
std::optional<GatewayResponse> AuthorizationReply(const access::AccessDecision& decision, const access::RequestContext& context,
                                                  const db::model::CollectionRecord& collection, access::Authenticator& authenticator,
                                                  observability::FaultReporter& faults);

} // namespace cirrus::http
