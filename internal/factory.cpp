#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#if CATALOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CATALOG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace catalog::factory {

using observability::StringField;

namespace {

#if CATALOG_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT entity_id,entity_ref,result_hash,needs_reprocessing FROM entities LIMIT 1;");
  sqlite_db->Exec("SELECT entity_id,hash,stitch_ticket FROM final_entities LIMIT 1;");
  sqlite_db->Exec("SELECT source_key,source_entity_ref,target_entity_ref FROM reference_edges LIMIT 1;");
}
#endif

#if CATALOG_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT entity_id,entity_ref,result_hash,needs_reprocessing FROM entities LIMIT 1;");
  tx.exec("SELECT entity_id,hash,stitch_ticket FROM final_entities LIMIT 1;");
  tx.exec("SELECT source_key,source_entity_ref,target_entity_ref FROM reference_edges LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const catalog::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CATALOG_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    CATALOG_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CATALOG_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 4u : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    CATALOG_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  if (database.has_memory()) {
    CATALOG_LOG_INFO("using memory repository");
  } else {
    CATALOG_LOG_WARN("no database configured, using volatile memory repository");
  }
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const catalog::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);
  app.collector  = std::make_shared<gc::OrphanCollector>(app.repository, gc::CollectorOptions::FromConfig(config.collector()));
  return app;
}

} // namespace catalog::factory
