#include "internal/http/dispatcher.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/access/access_evaluator.hpp"
#include "internal/access/access_policy.hpp"
#include "internal/access/request_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cirrus::http {

namespace beast_http = boost::beast::http;

using gateway::v1::ACCESS_LEVEL_DELETE;
using gateway::v1::ACCESS_LEVEL_LIST;
using gateway::v1::ACCESS_LEVEL_NO_ACCESS;
using gateway::v1::ACCESS_LEVEL_READ;
using gateway::v1::ACCESS_LEVEL_WRITE;
using observability::IntField;
using observability::StringField;

namespace {

std::optional<std::string_view> Header(const Request& request, std::string_view name) {
  const auto it = request.find(boost::beast::string_view(name.data(), name.size()));
  if (it == request.end()) return std::nullopt;
  return std::string_view(it->value().data(), it->value().size());
}

std::optional<std::string> HeaderString(const Request& request, std::string_view name) {
  const auto value = Header(request, name);
  if (!value) return std::nullopt;
  return std::string(*value);
}

beast_http::status StatusOf(retrieval::RetrievalStatus status) {
  switch (status) {
    case retrieval::RetrievalStatus::Ok:
      return beast_http::status::ok;
    case retrieval::RetrievalStatus::Partial:
      return beast_http::status::partial_content;
    case retrieval::RetrievalStatus::NotModified:
      return beast_http::status::not_modified;
    case retrieval::RetrievalStatus::PreconditionFailed:
      return beast_http::status::precondition_failed;
  }
  return beast_http::status::internal_server_error;
}

} // namespace

GatewayResponse TextResponse(beast_http::status status, std::string body) {
  GatewayResponse response;
  response.status = status;
  response.headers.set(beast_http::field::content_type, "text/plain");
  response.headers.set(beast_http::field::connection, "close");
  response.content_length = body.size();
  response.body           = std::move(body);
  return response;
}

GatewayResponse JsonResponse(beast_http::status status, const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        print_status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!print_status.ok()) {
    throw std::runtime_error("serialize " + message.GetTypeName() + ": " + std::string(print_status.message()));
  }

  GatewayResponse response;
  response.status = status;
  response.headers.set(beast_http::field::content_type, "application/json");
  response.headers.set(beast_http::field::connection, "close");
  response.content_length = json.size();
  response.body           = std::move(json);
  return response;
}

GatewayResponse ErrorResponse(const ErrorReply& reply) {
  return TextResponse(reply.status, reply.message + "\n");
}

Gateway::Gateway(GatewayOptions options, std::shared_ptr<db::Repository> repository, std::shared_ptr<service::ReadService> read,
                 std::shared_ptr<service::WriteService> write, access::AuthenticatorPtr authenticator, observability::FaultReporterPtr faults)
    : options_(std::move(options)),
      repository_(std::move(repository)),
      read_(std::move(read)),
      write_(std::move(write)),
      authenticator_(std::move(authenticator)),
      faults_(std::move(faults)) {
}

const std::map<ActionKind, Gateway::Route>& Gateway::Routes() {
  static const std::map<ActionKind, Route> routes = {
      {ActionKind::RetrieveKey, {&Gateway::Retrieve, ACCESS_LEVEL_READ}},
      {ActionKind::HeadKey, {&Gateway::Retrieve, ACCESS_LEVEL_READ}},
      {ActionKind::RetrieveMeta, {&Gateway::Meta, ACCESS_LEVEL_READ}},
      {ActionKind::ListKeys, {&Gateway::ListKeys, ACCESS_LEVEL_LIST}},
      {ActionKind::ListVersions, {&Gateway::ListVersions, ACCESS_LEVEL_LIST}},
      {ActionKind::ListConjoined, {&Gateway::ListConjoined, ACCESS_LEVEL_LIST}},
      {ActionKind::ListUploads, {&Gateway::ListUploads, ACCESS_LEVEL_LIST}},
      {ActionKind::SpaceUsage, {&Gateway::SpaceUsage, ACCESS_LEVEL_READ}},
      {ActionKind::ArchiveKey, {&Gateway::Archive, ACCESS_LEVEL_WRITE}},
      {ActionKind::DeleteKey, {&Gateway::Delete, ACCESS_LEVEL_DELETE}},
      {ActionKind::StartConjoined, {&Gateway::Conjoined, ACCESS_LEVEL_WRITE}},
      {ActionKind::FinishConjoined, {&Gateway::Conjoined, ACCESS_LEVEL_WRITE}},
      {ActionKind::AbortConjoined, {&Gateway::Conjoined, ACCESS_LEVEL_WRITE}},
  };
  return routes;
}

GatewayResponse Gateway::Handle(const Request& request, std::string_view peer_address) {
  observability::SpanScope span("http.request");

  GatewayResponse response;
  std::string     route = "unparsed";
  try {
    const auto host   = Header(request, "Host").value_or(std::string_view{});
    const auto target = std::string_view(request.target().data(), request.target().size());
    const auto parsed = ParseRequest(request.method(), target, host, options_.service_domain, options_.role);

    route = ActionName(parsed.action);
    span.SetAttribute("route", route);
    response = Dispatch(request, parsed, peer_address);
  } catch (const std::exception& ex) {
    response = ErrorResponse(ToReply(ex, *faults_, route));
  }

  response.route = route;
  span.SetAttribute("status", static_cast<int64_t>(response.status));
  observability::Metrics::Instance().RecordRequest(route, static_cast<int>(response.status));
  if (static_cast<int>(response.status) >= 400) {
    CIRRUS_LOG_WARN("request rejected", {StringField("route", route), IntField("status", static_cast<int64_t>(response.status)),
                                         StringField("target", std::string_view(request.target().data(), request.target().size()))});
  }
  return response;
}

GatewayResponse Gateway::Dispatch(const Request& request, const ParsedRequest& parsed, std::string_view peer_address) {
  if (parsed.action == ActionKind::Ping) {
    return TextResponse(beast_http::status::ok, "ok");
  }

  const auto& route      = Routes().at(parsed.action);
  const auto  collection = LookupCollection(parsed.collection);
  const auto  policy     = access::LoadAccessControl(collection.access_control);

  access::RequestContext context;
  context.source_ip  = access::ParseRequesterIp(Header(request, "X-Forwarded-For"), peer_address);
  context.referer    = access::ParseReferer(Header(request, "Referer"));
  context.credential = access::ParseBasicCredential(Header(request, "Authorization"));
  context.path       = parsed.path;

  const auto decision = access::Evaluate(route.level, policy, context);
  if (auto refusal = AuthorizationReply(decision, context, collection, *authenticator_, *faults_)) {
    return std::move(*refusal);
  }

  RouteContext ctx{request, parsed, collection};
  return (this->*route.handler)(ctx);
}

std::optional<GatewayResponse> AuthorizationReply(const access::AccessDecision& decision, const access::RequestContext& context,
                                                  const db::model::CollectionRecord& collection, access::Authenticator& authenticator,
                                                  observability::FaultReporter& faults) {
  switch (decision.outcome) {
    case access::Outcome::Granted:
      return std::nullopt;

    case access::Outcome::Forbidden:
      return TextResponse(beast_http::status::forbidden, "forbidden: " + decision.reason + "\n");

    case access::Outcome::RequiresSecondaryAuth: {
      if (!context.credential) {
        auto response = TextResponse(beast_http::status::unauthorized, "authentication required\n");
        response.headers.set(beast_http::field::www_authenticate, "Basic realm=\"" + collection.name + "\"");
        return response;
      }
      if (!authenticator.Verify(collection, *context.credential)) {
        return TextResponse(beast_http::status::forbidden, "forbidden: credential rejected\n");
      }
      return std::nullopt;
    }
  }

  const auto message = observability::ReportFault(
      faults, "authorization", util::InternalError("unknown access outcome " + std::to_string(static_cast<int>(decision.outcome))));
  return ErrorResponse({beast_http::status::internal_server_error, message});
}

db::model::CollectionRecord Gateway::LookupCollection(const std::string& name) {
  auto tx         = repository_->Begin();
  auto collection = repository_->GetCollectionByName(*tx, name);
  tx->Commit();
  if (!collection) {
    throw util::NotFound("unknown collection " + name);
  }
  return *collection;
}

service::ReadService& Gateway::Reader() {
  if (!read_) throw std::logic_error("read service is not configured");
  return *read_;
}

service::WriteService& Gateway::Writer() {
  if (!write_) throw std::logic_error("write service is not configured");
  return *write_;
}

GatewayResponse Gateway::Retrieve(const RouteContext& ctx) {
  retrieval::RetrievalRequest req;
  req.collection_id       = ctx.collection.id;
  req.key                 = ctx.parsed.key;
  req.version_identifier  = ctx.parsed.Param("version_identifier");
  req.range               = HeaderString(ctx.request, "Range");
  req.if_modified_since   = HeaderString(ctx.request, "If-Modified-Since");
  req.if_unmodified_since = HeaderString(ctx.request, "If-Unmodified-Since");
  req.headers_only        = ctx.parsed.action == ActionKind::HeadKey;

  auto result = Reader().Retrieve(req);

  GatewayResponse response;
  response.status = StatusOf(result.status);
  response.headers.set(beast_http::field::last_modified, util::FormatHttpDate(result.metadata.last_modified_ms));
  response.headers.set("X-Version-Identifier", result.metadata.version_identifier);

  if (result.status == retrieval::RetrievalStatus::NotModified || result.status == retrieval::RetrievalStatus::PreconditionFailed) {
    response.headers.set(beast_http::field::connection, "close");
    response.headers_only = true;
    return response;
  }

  response.headers.set(beast_http::field::content_type, result.metadata.content_type);
  response.headers.set(beast_http::field::accept_ranges, "bytes");
  if (result.content_range) {
    response.headers.set(beast_http::field::content_range, *result.content_range);
  }
  response.content_length = result.content_length;
  response.headers_only   = req.headers_only;
  if (req.headers_only) {
    response.headers.set(beast_http::field::connection, "close");
  }
  response.stream = std::move(result.body);
  return response;
}

GatewayResponse Gateway::Meta(const RouteContext& ctx) {
  return JsonResponse(beast_http::status::ok, Reader().Metadata(ctx.collection.id, ctx.parsed.key, ctx.parsed.Param("version_identifier")));
}

GatewayResponse Gateway::ListKeys(const RouteContext& ctx) {
  service::ListKeysParams params;
  params.prefix    = ctx.parsed.Param("prefix").value_or("");
  params.max_keys  = ctx.parsed.UIntParam("max_keys");
  params.marker    = ctx.parsed.Param("marker").value_or("");
  params.delimiter = ctx.parsed.Param("delimiter").value_or("");
  return JsonResponse(beast_http::status::ok, Reader().ListKeys(ctx.collection.id, params));
}

GatewayResponse Gateway::ListVersions(const RouteContext& ctx) {
  service::ListVersionsParams params;
  params.prefix                    = ctx.parsed.Param("prefix").value_or("");
  params.max_versions              = ctx.parsed.UIntParam("max_versions");
  params.key_marker                = ctx.parsed.Param("key_marker").value_or("");
  params.version_identifier_marker = ctx.parsed.Param("version_identifier_marker");
  return JsonResponse(beast_http::status::ok, Reader().ListVersions(ctx.collection.id, params));
}

GatewayResponse Gateway::ListConjoined(const RouteContext& ctx) {
  service::ListConjoinedParams params;
  params.max_conjoined               = ctx.parsed.UIntParam("max_conjoined");
  params.key_marker                  = ctx.parsed.Param("key_marker").value_or("");
  params.conjoined_identifier_marker = ctx.parsed.Param("conjoined_identifier_marker");
  return JsonResponse(beast_http::status::ok, Reader().ListConjoined(ctx.collection.id, params));
}

GatewayResponse Gateway::ListUploads(const RouteContext& ctx) {
  return JsonResponse(beast_http::status::ok,
                      Reader().ListUploads(ctx.collection.id, ctx.parsed.key, ctx.parsed.Param("conjoined_identifier").value_or("")));
}

GatewayResponse Gateway::SpaceUsage(const RouteContext& ctx) {
  return JsonResponse(beast_http::status::ok, Reader().SpaceUsage(ctx.collection.id, ctx.collection.name));
}

GatewayResponse Gateway::Archive(const RouteContext& ctx) {
  service::ArchiveParams params;
  params.conjoined_identifier = ctx.parsed.Param("conjoined_identifier");
  params.conjoined_part       = ctx.parsed.UIntParam("conjoined_part");
  return JsonResponse(beast_http::status::ok, Writer().ArchiveKey(ctx.collection.id, ctx.parsed.key, ctx.request.body(), params));
}

GatewayResponse Gateway::Delete(const RouteContext& ctx) {
  return JsonResponse(beast_http::status::ok, Writer().DeleteKey(ctx.collection.id, ctx.parsed.key));
}

GatewayResponse Gateway::Conjoined(const RouteContext& ctx) {
  const auto& key = ctx.parsed.key;
  switch (ctx.parsed.action) {
    case ActionKind::StartConjoined:
      return JsonResponse(beast_http::status::ok, Writer().StartConjoined(ctx.collection.id, key));
    case ActionKind::FinishConjoined:
      return JsonResponse(beast_http::status::ok, Writer().FinishConjoined(ctx.collection.id, key, *ctx.parsed.Param("conjoined_identifier")));
    case ActionKind::AbortConjoined:
      return JsonResponse(beast_http::status::ok, Writer().AbortConjoined(ctx.collection.id, key, *ctx.parsed.Param("conjoined_identifier")));
    default:
      throw std::logic_error(std::string("not a conjoined action: ") + ActionName(ctx.parsed.action));
  }
}

} // namespace cirrus::http
