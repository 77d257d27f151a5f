#include "request_context.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace cirrus::access {

namespace {

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
  return value;
}

// "[v6]:port", "v4:port" or a bare address.
std::string_view StripPort(std::string_view address) {
  if (!address.empty() && address.front() == '[') {
    const auto close = address.find(']');
    if (close == std::string_view::npos) {
      return address;
    }
    return address.substr(1, close - 1);
  }
  const auto colon = address.find(':');
  if (colon != std::string_view::npos && address.find(':', colon + 1) == std::string_view::npos) {
    return address.substr(0, colon);
  }
  return address;
}

bool StartsWithNoCase(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), value.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

} // namespace

boost::asio::ip::address ParseRequesterIp(std::optional<std::string_view> forwarded_for, std::string_view peer_address) {
  std::string_view candidate = peer_address;
  if (forwarded_for) {
    candidate = Trim(forwarded_for->substr(0, forwarded_for->find(',')));
    candidate = StripPort(candidate);
  }

  boost::system::error_code ec;
  auto                      address = boost::asio::ip::make_address(std::string(candidate), ec);
  if (ec) {
    throw util::ClientSyntaxError("unable to parse requester address '" + std::string(candidate) + "'");
  }
  return address;
}

std::optional<std::string> ParseReferer(std::optional<std::string_view> header) {
  if (!header) {
    return std::nullopt;
  }

  const auto referer = Trim(*header);
  if (referer.empty()) {
    return std::nullopt;
  }

  std::string_view rest;
  if (StartsWithNoCase(referer, "http://")) {
    rest = referer.substr(7);
  } else if (StartsWithNoCase(referer, "https://")) {
    rest = referer.substr(8);
  } else {
    throw util::ClientSyntaxError("referer is not an absolute http(s) URL");
  }

  const auto host = rest.substr(0, rest.find_first_of("/?#"));
  if (host.empty()) {
    throw util::ClientSyntaxError("referer has no host");
  }
  for (char c : referer) {
    if (std::iscntrl(static_cast<unsigned char>(c)) || c == ' ') {
      throw util::ClientSyntaxError("referer contains invalid characters");
    }
  }
  return std::string(referer);
}

std::optional<std::string> ParseBasicCredential(std::optional<std::string_view> authorization) {
  if (!authorization) {
    return std::nullopt;
  }

  const auto value = Trim(*authorization);
  if (!StartsWithNoCase(value, "basic ")) {
    throw util::ClientSyntaxError("unsupported authorization scheme");
  }

  const auto decoded = util::Base64Decode(Trim(value.substr(6)));
  if (!decoded) {
    throw util::ClientSyntaxError("authorization credential is not valid base64");
  }

  const auto colon = decoded->find(':');
  if (colon == std::string::npos) {
    throw util::ClientSyntaxError("authorization credential has no password");
  }
  return decoded->substr(colon + 1);
}

} // namespace cirrus::access
