#pragma once

#include <string>
#include <string_view>

#include "cirrus/gateway/v1.hpp"

namespace cirrus::access {

using gateway::v1::AccessControl;
using gateway::v1::AccessLevel;

/*
  Access control policies are stored on collection rows as JSON text using
  the proto field names, e.g.

    {"ip_rules": [{"cidr": "10.0.0.0/8", "effect": "RULE_EFFECT_ALLOW"}],
     "password": {"required": true, "levels": ["ACCESS_LEVEL_WRITE"]}}

  An empty document is a policy without rules, which denies everything.
*/
AccessControl LoadAccessControl(const std::string& json);
std::string   DumpAccessControl(const AccessControl& policy);

// The first location whose prefix matches path replaces the collection policy.
const AccessControl& ResolveForPath(const AccessControl& policy, std::string_view path);

// An empty level list covers every level.
bool CoversLevel(const google::protobuf::RepeatedField<int>& levels, AccessLevel required);

} // namespace cirrus::access
