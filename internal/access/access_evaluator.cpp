#include "access_evaluator.hpp"

#include <charconv>

namespace cirrus::access {

using gateway::v1::RuleEffect;

namespace {

boost::asio::ip::address Unmapped(const boost::asio::ip::address& address) {
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
  }
  return address;
}

template <typename Bytes>
bool PrefixEqual(const Bytes& lhs, const Bytes& rhs, unsigned prefix) {
  const unsigned full_bytes = prefix / 8;
  for (unsigned i = 0; i < full_bytes; ++i) {
    if (lhs[i] != rhs[i]) return false;
  }
  const unsigned rest = prefix % 8;
  if (rest == 0) {
    return true;
  }
  const unsigned char mask = static_cast<unsigned char>(0xFF << (8 - rest));
  return (lhs[full_bytes] & mask) == (rhs[full_bytes] & mask);
}

AccessDecision FromEffect(RuleEffect effect, std::string reason) {
  switch (effect) {
    case gateway::v1::RULE_EFFECT_ALLOW:
      return {Outcome::Granted, std::move(reason)};
    case gateway::v1::RULE_EFFECT_REQUIRE_PASSWORD:
      return {Outcome::RequiresSecondaryAuth, std::move(reason)};
    default:
      return {Outcome::Forbidden, std::move(reason)};
  }
}

} // namespace

const char* OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::Granted:
      return "granted";
    case Outcome::Forbidden:
      return "forbidden";
    case Outcome::RequiresSecondaryAuth:
      return "requires_secondary_auth";
  }
  return "unknown";
}

bool MatchesCidr(const boost::asio::ip::address& address, std::string_view cidr) {
  const auto slash = cidr.find('/');

  boost::system::error_code ec;
  const auto network = Unmapped(boost::asio::ip::make_address(std::string(cidr.substr(0, slash)), ec));
  if (ec) {
    return false;
  }

  const auto candidate = Unmapped(address);
  if (candidate.is_v4() != network.is_v4()) {
    return false;
  }

  const unsigned max_prefix = network.is_v4() ? 32 : 128;
  unsigned       prefix     = max_prefix;
  if (slash != std::string_view::npos) {
    const auto digits = cidr.substr(slash + 1);
    const auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(), prefix);
    if (parsed.ec != std::errc{} || parsed.ptr != digits.data() + digits.size() || prefix > max_prefix) {
      return false;
    }
  }

  if (network.is_v4()) {
    return PrefixEqual(candidate.to_v4().to_bytes(), network.to_v4().to_bytes(), prefix);
  }
  return PrefixEqual(candidate.to_v6().to_bytes(), network.to_v6().to_bytes(), prefix);
}

bool MatchesGlob(std::string_view pattern, std::string_view value) {
  std::size_t p = 0, v = 0;
  std::size_t star = std::string_view::npos, resume = 0;

  while (v < value.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star   = p++;
      resume = v;
    } else if (p < pattern.size() && pattern[p] == value[v]) {
      ++p;
      ++v;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      v = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

AccessDecision Evaluate(AccessLevel required, const AccessControl& collection_policy, const RequestContext& context) {
  if (required == gateway::v1::ACCESS_LEVEL_NO_ACCESS) {
    return {Outcome::Granted, "no access level required"};
  }

  const auto& policy = ResolveForPath(collection_policy, context.path);

  for (const auto& rule : policy.ip_rules()) {
    if (CoversLevel(rule.levels(), required) && MatchesCidr(context.source_ip, rule.cidr())) {
      return FromEffect(rule.effect(), "ip rule " + rule.cidr());
    }
  }

  if (context.referer) {
    for (const auto& rule : policy.referer_rules()) {
      if (CoversLevel(rule.levels(), required) && MatchesGlob(rule.pattern(), *context.referer)) {
        return FromEffect(rule.effect(), "referer rule " + rule.pattern());
      }
    }
  }

  if (policy.password().required() && CoversLevel(policy.password().levels(), required)) {
    return {Outcome::RequiresSecondaryAuth, "password required"};
  }

  return {Outcome::Forbidden, "no rule grants access"};
}

} // namespace cirrus::access
