#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/ids/unified_id_factory.hpp"

namespace cirrus::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0001" keys, hex strings)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static cirrus::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  cirrus::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cirrus::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

cirrus::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(cirrus::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:8088");
  if (server->worker_threads() == 0) server->set_worker_threads(4);

  if (config.database().backend_case() == cirrus::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.storage().backend_case() == cirrus::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    config.mutable_storage()->mutable_ram();
  }

  auto* limits = config.mutable_limits();
  if (limits->max_segment_bytes() == 0) limits->set_max_segment_bytes(10 * 1024 * 1024);
  if (limits->stream_chunk_bytes() == 0) limits->set_stream_chunk_bytes(1024 * 1024);
  if (limits->dependency_timeout_ms() == 0) limits->set_dependency_timeout_ms(120000);
  if (limits->max_list_entries() == 0 || limits->max_list_entries() > 1000) limits->set_max_list_entries(1000);
  if (limits->max_body_bytes() == 0) limits->set_max_body_bytes(1024ULL * 1024 * 1024);

  auto* identifiers = config.mutable_identifiers();
  if (identifiers->hmac_size() == 0) identifiers->set_hmac_size(16);
  if (identifiers->hmac_size() > 32) {
    throw std::runtime_error("Invalid configuration: identifiers.hmac_size must be at most 32");
  }
  if (identifiers->shard_id() > ids::UnifiedIdFactory::kMaxShardId) {
    throw std::runtime_error("Invalid configuration: identifiers.shard_id exceeds " + std::to_string(ids::UnifiedIdFactory::kMaxShardId));
  }

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
}

} // namespace cirrus::config
