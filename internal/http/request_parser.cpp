#include "internal/http/request_parser.hpp"

#include <charconv>

#include "internal/http/http_error.hpp"

namespace cirrus::http {

namespace beast_http = boost::beast::http;

namespace {

constexpr std::string_view kDataPrefix      = "/data/";
constexpr std::string_view kConjoinedPrefix = "/conjoined/";

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

ActionKind ReaderAction(beast_http::verb method, const ParsedRequest& req) {
  const auto& path = req.path;
  if (method == beast_http::verb::get && path == "/ping") return ActionKind::Ping;

  if (StartsWith(path, kDataPrefix)) {
    if (method == beast_http::verb::head && !req.key.empty()) return ActionKind::HeadKey;
    if (method != beast_http::verb::get) throw RequestParseError("unsupported method for " + path);
    if (req.key.empty()) return ActionKind::ListKeys;

    const auto action = req.Param("action");
    if (!action) return ActionKind::RetrieveKey;
    if (*action == "meta") return ActionKind::RetrieveMeta;
    throw RequestParseError("unknown action " + *action);
  }

  if (method != beast_http::verb::get) throw RequestParseError("unsupported method for " + path);
  if (path == "/versions" || path == "/versions/") return ActionKind::ListVersions;
  if (path == "/usage") return ActionKind::SpaceUsage;
  if (StartsWith(path, kConjoinedPrefix)) {
    if (req.key.empty()) return ActionKind::ListConjoined;
    if (!req.Param("conjoined_identifier")) throw RequestParseError("list uploads requires conjoined_identifier");
    return ActionKind::ListUploads;
  }
  throw RequestParseError("no such endpoint " + path);
}

ActionKind WriterAction(beast_http::verb method, const ParsedRequest& req) {
  const auto& path = req.path;
  if (method == beast_http::verb::get && path == "/ping") return ActionKind::Ping;

  const auto action = req.Param("action");
  if (StartsWith(path, kDataPrefix) && !req.key.empty()) {
    if (method == beast_http::verb::delete_) return ActionKind::DeleteKey;
    if (method != beast_http::verb::post) throw RequestParseError("unsupported method for " + path);
    if (!action) return ActionKind::ArchiveKey;
    if (*action == "delete") return ActionKind::DeleteKey;
    throw RequestParseError("unknown action " + *action);
  }

  if (StartsWith(path, kConjoinedPrefix) && !req.key.empty() && method == beast_http::verb::post) {
    if (!action) throw RequestParseError("conjoined request without action");
    if (*action == "start") return ActionKind::StartConjoined;
    if (*action != "finish" && *action != "abort") throw RequestParseError("unknown action " + *action);
    if (!req.Param("conjoined_identifier")) throw RequestParseError(*action + " requires conjoined_identifier");
    return *action == "finish" ? ActionKind::FinishConjoined : ActionKind::AbortConjoined;
  }
  throw RequestParseError("no such endpoint " + path);
}

} // namespace

const char* ActionName(ActionKind action) {
  switch (action) {
    case ActionKind::Ping:
      return "ping";
    case ActionKind::RetrieveKey:
      return "retrieve_key";
    case ActionKind::HeadKey:
      return "head_key";
    case ActionKind::RetrieveMeta:
      return "retrieve_meta";
    case ActionKind::ListKeys:
      return "list_keys";
    case ActionKind::ListVersions:
      return "list_versions";
    case ActionKind::ListConjoined:
      return "list_conjoined";
    case ActionKind::ListUploads:
      return "list_uploads";
    case ActionKind::SpaceUsage:
      return "space_usage";
    case ActionKind::ArchiveKey:
      return "archive_key";
    case ActionKind::DeleteKey:
      return "delete_key";
    case ActionKind::StartConjoined:
      return "start_conjoined";
    case ActionKind::FinishConjoined:
      return "finish_conjoined";
    case ActionKind::AbortConjoined:
      return "abort_conjoined";
  }
  return "unknown";
}

std::optional<std::string> ParsedRequest::Param(const std::string& name) const {
  const auto it = query.find(name);
  if (it == query.end()) return std::nullopt;
  return it->second;
}

std::optional<uint32_t> ParsedRequest::UIntParam(const std::string& name) const {
  const auto value = Param(name);
  if (!value) return std::nullopt;

  uint32_t parsed = 0;
  const auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
  if (value->empty() || ec != std::errc() || end != value->data() + value->size()) {
    throw RequestParseError(name + " must be a non-negative integer, got '" + *value + "'");
  }
  return parsed;
}

std::string PercentDecode(std::string_view text, bool plus_is_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '%') {
      if (i + 2 >= text.size()) {
        throw RequestParseError("truncated percent escape");
      }
      const int hi = HexDigit(text[i + 1]);
      const int lo = HexDigit(text[i + 2]);
      if (hi < 0 || lo < 0) throw RequestParseError("invalid percent escape");
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else if (c == '+' && plus_is_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

QueryParams ParseQuery(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    const auto amp  = query.find('&');
    const auto pair = query.substr(0, amp);
    query           = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) continue;

    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      params[PercentDecode(pair, true)] = "";
    } else {
      params[PercentDecode(pair.substr(0, eq), true)] = PercentDecode(pair.substr(eq + 1), true);
    }
  }
  return params;
}

std::string CollectionFromHost(std::string_view host, std::string_view service_domain) {
  if (!host.empty() && host.front() != '[') {
    const auto colon = host.rfind(':');
    if (colon != std::string_view::npos) host = host.substr(0, colon);
  }

  std::string_view collection;
  if (service_domain.empty()) {
    collection = host.substr(0, host.find('.'));
  } else {
    if (host.size() <= service_domain.size() + 1 || host.substr(host.size() - service_domain.size()) != service_domain ||
        host[host.size() - service_domain.size() - 1] != '.') {
      throw RequestParseError("host '" + std::string(host) + "' is not under " + std::string(service_domain));
    }
    collection = host.substr(0, host.size() - service_domain.size() - 1);
  }

  if (collection.empty() || collection.find('.') != std::string_view::npos) {
    throw RequestParseError("no collection in host '" + std::string(host) + "'");
  }
  return std::string(collection);
}

ParsedRequest ParseRequest(beast_http::verb method, std::string_view target, std::string_view host, std::string_view service_domain,
                           ServiceRole role) {
  if (target.empty() || target.front() != '/') {
    throw RequestParseError("request target must be an absolute path");
  }

  ParsedRequest req;
  const auto    question = target.find('?');
  req.path               = PercentDecode(target.substr(0, question), false);
  if (question != std::string_view::npos) {
    req.query = ParseQuery(target.substr(question + 1));
  }

  if (StartsWith(req.path, kDataPrefix)) {
    req.key = req.path.substr(kDataPrefix.size());
  } else if (StartsWith(req.path, kConjoinedPrefix)) {
    req.key = req.path.substr(kConjoinedPrefix.size());
  }

  req.action = role == ServiceRole::Reader ? ReaderAction(method, req) : WriterAction(method, req);
  if (req.action != ActionKind::Ping) {
    req.collection = CollectionFromHost(host, service_domain);
  }
  return req;
}

} // namespace cirrus::http
