#pragma once

#include <boost/beast/http/verb.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cirrus::http {

enum class ServiceRole {
  Reader,
  Writer,
};

enum class ActionKind {
  Ping,
  RetrieveKey,
  HeadKey,
  RetrieveMeta,
  ListKeys,
  ListVersions,
  ListConjoined,
  ListUploads,
  SpaceUsage,
  ArchiveKey,
  DeleteKey,
  StartConjoined,
  FinishConjoined,
  AbortConjoined,
};

const char* ActionName(ActionKind action);

using QueryParams = std::map<std::string, std::string>;

struct ParsedRequest {
  ActionKind  action = ActionKind::Ping;
  std::string collection; // empty for ping
  std::string path;       // decoded, without query
  std::string key;
  QueryParams query;

  std::optional<std::string> Param(const std::string& name) const;

  // Throws RequestParseError when present but not a non-negative integer.
  std::optional<uint32_t> UIntParam(const std::string& name) const;
};

/*
  Maps method, target and Host header to an action of the given service.

  Collections are addressed as <collection>.<service_domain>; an optional
  port on the Host header is ignored. Any request that does not name an
  action of this service throws RequestParseError.
*/
ParsedRequest ParseRequest(boost::beast::http::verb method, std::string_view target, std::string_view host,
                           std::string_view service_domain, ServiceRole role);

// %XX decoding; '+' becomes a space when plus_is_space is set.
std::string PercentDecode(std::string_view text, bool plus_is_space);

QueryParams ParseQuery(std::string_view query);

std::string CollectionFromHost(std::string_view host, std::string_view service_domain);

} // namespace cirrus::http
