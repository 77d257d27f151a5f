#pragma once

#include <boost/asio/ip/address.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace cirrus::access {

/*
  Request facts the access evaluator decides on.
*/
struct RequestContext {
  boost::asio::ip::address   source_ip;
  std::optional<std::string> referer;
  std::optional<std::string> credential;
  std::string                path;
};

/*
  Source address of a request.

  The first entry of X-Forwarded-For wins, with any port stripped. When the
  header is absent the socket peer address is used. A present but
  unparsable header throws util::ClientSyntaxError; it is never treated as
  absent.
*/
boost::asio::ip::address ParseRequesterIp(std::optional<std::string_view> forwarded_for, std::string_view peer_address);

// Absent referer is allowed. A referer that is not an absolute http(s) URL
// throws util::ClientSyntaxError.
std::optional<std::string> ParseReferer(std::optional<std::string_view> header);

// Password presented through "Authorization: Basic base64(user:password)".
std::optional<std::string> ParseBasicCredential(std::optional<std::string_view> authorization);

} // namespace cirrus::access
