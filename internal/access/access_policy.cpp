#include "access_policy.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

namespace cirrus::access {

AccessControl LoadAccessControl(const std::string& json) {
  AccessControl policy;
  if (json.empty()) {
    return policy;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &policy, options);
  if (!status.ok()) {
    throw std::runtime_error("invalid access control document: " + std::string(status.message()));
  }
  return policy;
}

std::string DumpAccessControl(const AccessControl& policy) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(policy, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("serialize access control: " + std::string(status.message()));
  }
  return json;
}

const AccessControl& ResolveForPath(const AccessControl& policy, std::string_view path) {
  for (const auto& location : policy.locations()) {
    if (!location.prefix().empty() && path.substr(0, location.prefix().size()) == location.prefix()) {
      return location.access_control();
    }
  }
  return policy;
}

bool CoversLevel(const google::protobuf::RepeatedField<int>& levels, AccessLevel required) {
  if (levels.empty()) {
    return true;
  }
  return std::find(levels.begin(), levels.end(), static_cast<int>(required)) != levels.end();
}

} // namespace cirrus::access
