#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/access/access_policy.hpp"
#include "internal/access/authenticator.hpp"
#include "internal/accounting/bounded_space_accounting.hpp"
#include "internal/accounting/memory_space_accounting.hpp"
#include "internal/conjoined/conjoined_manager.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ids/unified_id_factory.hpp"
#include "internal/observability/fault_reporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retrieval/retrieval_engine.hpp"
#include "internal/service/read_service.hpp"
#include "internal/service/write_service.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/time.hpp"
#if CIRRUS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CIRRUS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace cirrus::factory {

using observability::StringField;

namespace {

std::string DecodeKey(const std::string& hex, const char* field) {
  auto bytes = util::HexDecode(hex);
  if (!bytes || bytes->empty()) {
    throw std::runtime_error(std::string("Invalid configuration: identifiers.") + field + " must be a non-empty hex string");
  }
  return *bytes;
}

} // namespace

ids::TranslatorKeys TranslatorKeysFromConfig(const cirrus::runtime::config::IdentifierConfig& config) {
  ids::TranslatorKeys keys;
  keys.aes_key  = DecodeKey(config.aes_key_hex(), "aes_key_hex");
  keys.hmac_key = DecodeKey(config.hmac_key_hex(), "hmac_key_hex");
  keys.iv_key   = DecodeKey(config.iv_key_hex(), "iv_key_hex");
  if (keys.aes_key.size() != 32) {
    throw std::runtime_error("Invalid configuration: identifiers.aes_key_hex must encode 32 bytes");
  }
  if (config.hmac_size() != 0) {
    keys.hmac_size = config.hmac_size();
  }
  return keys;
}

std::shared_ptr<db::Repository> BuildRepository(const cirrus::runtime::config::RuntimeConfig& config) {
  const auto& database   = config.database();
  const auto  timeout_ms = config.limits().dependency_timeout_ms();

  if (database.has_sqlite()) {
#if CIRRUS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), timeout_ms, database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CIRRUS_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 8 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections,
                                                                std::chrono::milliseconds(timeout_ms));
    db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

void BootstrapCollections(db::Repository& repository, const cirrus::runtime::config::RuntimeConfig& config) {
  for (const auto& bootstrap : config.collections()) {
    if (bootstrap.name().empty()) {
      throw std::runtime_error("Invalid configuration: collection without name");
    }

    auto tx = repository.Begin();
    if (repository.GetCollectionByName(*tx, bootstrap.name())) {
      tx->Commit();
      continue;
    }

    db::model::CollectionRecord record;
    record.name            = bootstrap.name();
    record.access_control  = access::DumpAccessControl(bootstrap.access_control());
    record.password_sha256 = bootstrap.password_sha256();
    record.created_at_ms   = util::ToUnixMillis(util::Now());

    // Another process sharing the database may have created it meanwhile.
    const auto result = repository.InsertCollection(*tx, record);
    if (!result && result.code == db::ErrorCode::AlreadyExists) {
      tx->Rollback();
      continue;
    }
    db::ThrowIfDbError(result, "bootstrap collection " + bootstrap.name());
    tx->Commit();

    CIRRUS_LOG_INFO("collection created", {StringField("collection", record.name)});
  }
}

/*
    Build full application dependency graph
*/
Application Build(const cirrus::runtime::config::RuntimeConfig& config, http::ServiceRole role) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and metadata
  // ------------------------------------------------------------------
  auto store      = storage::StorageFactory::Build(config.storage());
  auto repository = BuildRepository(config);
  BootstrapCollections(*repository, config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto& limits = config.limits();

  auto faults     = std::make_shared<observability::LoggingFaultReporter>();
  auto ids        = std::make_shared<ids::UnifiedIdFactory>(config.identifiers().shard_id());
  auto translator = std::make_shared<ids::IdTranslator>(TranslatorKeysFromConfig(config.identifiers()));

  auto& ctx         = app.context;
  ctx.repository    = repository;
  ctx.store         = store;
  ctx.ids           = ids;
  ctx.translator    = translator;
  ctx.retrieval     = std::make_shared<retrieval::RetrievalEngine>(repository, store, translator, faults, limits.stream_chunk_bytes());
  ctx.conjoined     = std::make_shared<conjoined::ConjoinedManager>(repository, ids, translator, limits.max_list_entries());
  const std::chrono::milliseconds ceiling(limits.dependency_timeout_ms());
  ctx.accounting    = std::make_shared<accounting::BoundedSpaceAccounting>(std::make_shared<accounting::MemorySpaceAccounting>(), ceiling);
  ctx.authenticator = std::make_shared<access::BoundedAuthenticator>(std::make_shared<access::PasswordAuthenticator>(), ceiling);
  ctx.faults        = faults;

  ctx.limits.max_segment_bytes  = limits.max_segment_bytes();
  ctx.limits.max_list_entries   = limits.max_list_entries();
  ctx.limits.max_body_bytes     = limits.max_body_bytes();
  ctx.limits.stream_chunk_bytes = limits.stream_chunk_bytes();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  if (role == http::ServiceRole::Reader) {
    app.read_service = std::make_shared<service::ReadService>(ctx);
  } else {
    app.write_service = std::make_shared<service::WriteService>(ctx);
  }

  http::GatewayOptions options;
  options.role           = role;
  options.service_domain = config.server().service_domain();
  app.gateway = std::make_shared<http::Gateway>(options, repository, app.read_service, app.write_service, ctx.authenticator, faults);

  return app;
}

} // namespace cirrus::factory
