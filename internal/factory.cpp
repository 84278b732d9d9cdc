#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/fetch/directory_module_source.hpp"
#include "internal/observability/logging.hpp"
#if MODSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MODSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace modstore::factory {

using modstore::runtime::config::RuntimeConfig;

namespace {

#if MODSTORE_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if MODSTORE_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  // Concurrent bootstraps serialize on a fixed advisory key.
  tx.exec("SELECT pg_advisory_xact_lock(7340001);");

  PostgresMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

template <typename T>
T OrDefault(T value, T fallback) {
  return value == T{} ? fallback : value;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MODSTORE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(
        sqlite.path(), static_cast<int>(OrDefault<uint32_t>(sqlite.busy_timeout_ms(), 5000)));

    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());

    MODSTORE_LOG_INFO("opened sqlite store", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MODSTORE_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri is required");
    }
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(),
                                                       OrDefault<uint32_t>(postgres.max_connections(), 16));
    BootstrapPostgresSchema(pool);

    MODSTORE_LOG_INFO("opened postgres store",
                      {observability::IntField("max_connections", OrDefault<uint32_t>(postgres.max_connections(), 16))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

queue::QueueOptions QueueOptionsFrom(const RuntimeConfig& config) {
  const auto&         q = config.queue();
  queue::QueueOptions options;
  options.large_module_package_threshold =
      OrDefault<int64_t>(q.large_module_package_threshold(), options.large_module_package_threshold);
  options.large_modules_limit = OrDefault<std::size_t>(q.large_modules_limit(), options.large_modules_limit);
  options.backoff.min_ms      = OrDefault<uint64_t>(uint64_t{q.min_backoff_sec()} * 1000, options.backoff.min_ms);
  options.backoff.max_ms      = OrDefault<uint64_t>(uint64_t{q.max_backoff_sec()} * 1000, options.backoff.max_ms);
  options.app_version         = config.ingest().app_version();
  return options;
}

retention::RetentionOptions RetentionOptionsFrom(const RuntimeConfig& config) {
  const auto&                 r = config.retention();
  retention::RetentionOptions options;
  if (r.min_age_days() > 0) {
    options.min_age = std::chrono::hours(24 * r.min_age_days());
  }
  if (r.pinned_versions_size() > 0) {
    options.pinned_versions.assign(r.pinned_versions().begin(), r.pinned_versions().end());
  }
  return options;
}

Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);
  rt.cache      = std::make_shared<core::LatestVersionCache>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::IngestOptions ingest;
  ingest.bypass_license_check = config.ingest().bypass_license_check();

  rt.coordinator = std::make_shared<core::IngestionCoordinator>(rt.repository, ingest, rt.cache);
  rt.queue       = std::make_shared<queue::WorkQueue>(rt.repository, QueueOptionsFrom(config));
  rt.ledger      = std::make_shared<symbols::SymbolHistoryLedger>(rt.repository);
  rt.sweeper     = std::make_shared<retention::RetentionSweeper>(rt.repository, rt.coordinator, rt.queue,
                                                                 RetentionOptionsFrom(config));

  // ------------------------------------------------------------------
  // Module source
  // ------------------------------------------------------------------
  if (!config.source().directory().empty()) {
    rt.source = std::make_shared<fetch::DirectoryModuleSource>(config.source().directory());
  }

  return rt;
}

} // namespace modstore::factory
