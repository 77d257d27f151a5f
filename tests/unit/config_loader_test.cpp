#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using cirrus::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cirrus_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "127.0.0.1:9000"
  service_domain: "cirrus.example.com"
  worker_threads: 8
database:
  sqlite:
    path: "C:\\cirrus\\\"quoted\"\\meta.sqlite"
    wal_mode: true
storage:
  disk:
    root_path: /var/lib/cirrus
    fsync: true
identifiers:
  shard_id: 17
  aes_key_hex: "0000000000000000000000000000000000000000000000000000000000000001"
  hmac_key_hex: "0102"
  iv_key_hex: "0304"
limits:
  max_segment_bytes: 4096
  max_list_entries: 50
collections:
  - name: photos
    access_control:
      ip_rules:
        - cidr: 10.0.0.0/8
          effect: RULE_EFFECT_ALLOW
          levels: [ACCESS_LEVEL_READ, ACCESS_LEVEL_LIST]
      password:
        required: true
    password_sha256: "abc123"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:9000");
  assert(config.server().service_domain() == "cirrus.example.com");
  assert(config.server().worker_threads() == 8);
  assert(config.database().sqlite().path() == "C:\\cirrus\\\"quoted\"\\meta.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.storage().disk().root_path() == "/var/lib/cirrus");
  assert(config.identifiers().shard_id() == 17);
  // quoted hex stays a string even when it looks numeric
  assert(config.identifiers().hmac_key_hex() == "0102");
  assert(config.limits().max_segment_bytes() == 4096);
  assert(config.limits().max_list_entries() == 50);

  assert(config.collections_size() == 1);
  const auto& photos = config.collections(0);
  assert(photos.name() == "photos");
  assert(photos.access_control().ip_rules_size() == 1);
  assert(photos.access_control().ip_rules(0).levels_size() == 2);
  assert(photos.access_control().password().required());
  assert(photos.password_sha256() == "abc123");
}

void TestDefaultsFillUnsetSections() {
  const auto config = ConfigLoader::LoadFromYamlString("server:\n  service_domain: \"example.org\"\n");
  assert(config.server().bind_address() == "0.0.0.0:8088");
  assert(config.server().worker_threads() == 4);
  assert(config.database().has_memory());
  assert(config.storage().has_ram());
  assert(config.limits().max_segment_bytes() == 10 * 1024 * 1024);
  assert(config.limits().stream_chunk_bytes() == 1024 * 1024);
  assert(config.limits().dependency_timeout_ms() == 120000);
  assert(config.limits().max_list_entries() == 1000);
  assert(config.limits().max_body_bytes() == 1024ULL * 1024 * 1024);
  assert(config.identifiers().hmac_size() == 16);
  assert(config.logging().level() == "info");
}

void TestListCapIsEnforced() {
  const auto config = ConfigLoader::LoadFromYamlString("limits:\n  max_list_entries: 5000\n");
  assert(config.limits().max_list_entries() == 1000);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("server:\n  bind_address: \"0.0.0.0:8088\"\nunknown_field: 123\n"));
  assert(Rejects("server:\n  bind_adress: \"0.0.0.0:8088\"\n"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("identifiers:\n  hmac_size: 64\n"));
  assert(Rejects("identifiers:\n  shard_id: 4096\n"));
  assert(Rejects("server: [unterminated\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/cirrus/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsFillUnsetSections();
  TestListCapIsEnforced();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();

  std::cout << "cirrus_unit_config_loader: pass\n";
  return 0;
}
