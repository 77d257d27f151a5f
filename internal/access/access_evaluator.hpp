#pragma once

#include <string>
#include <string_view>

#include <boost/asio/ip/address.hpp>

#include "internal/access/access_policy.hpp"
#include "internal/access/request_context.hpp"

namespace cirrus::access {

enum class Outcome {
  Granted,
  Forbidden,
  RequiresSecondaryAuth,
};

const char* OutcomeName(Outcome outcome);

struct AccessDecision {
  Outcome     outcome = Outcome::Forbidden;
  std::string reason;

  bool granted() const {
    return outcome == Outcome::Granted;
  }

  bool requires_secondary_auth() const {
    return outcome == Outcome::RequiresSecondaryAuth;
  }
};

/*
  Decides whether a request may act at the required level.

  Rules are first-match in fixed precedence: IP rules, referer rules, the
  password requirement, then default deny. NoAccess is granted without
  looking at the policy. Pure function; safe under any concurrency.
*/
AccessDecision Evaluate(AccessLevel required, const AccessControl& policy, const RequestContext& context);

// cidr is "a.b.c.d/n", "v6/n" or a single address.
bool MatchesCidr(const boost::asio::ip::address& address, std::string_view cidr);

// '*' matches any run of characters, including none.
bool MatchesGlob(std::string_view pattern, std::string_view value);

} // namespace cirrus::access
