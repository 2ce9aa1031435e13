#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/auth/membership.hpp"
#include "internal/core/aggregation_engine.hpp"
#include "internal/core/bundler.hpp"
#include "internal/core/ingest_validator.hpp"
#include "internal/core/relation_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/events/event_store.hpp"
#include "internal/grpc/relations_server.hpp"
#include "internal/grpc/room_server.hpp"
#include "internal/observability/logging.hpp"
#if RELATIONS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELATIONS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace relations::factory {

using namespace relations;

namespace {

#if RELATIONS_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT stream_ordering,event_id,room_id FROM events LIMIT 1;");
  sqlite_db->Exec("SELECT event_id,relates_to_id,rel_type FROM event_relations LIMIT 1;");
  sqlite_db->Exec("SELECT relates_to_id,event_type,aggregation_key,count FROM event_relation_aggregations LIMIT 1;");
}
#endif

#if RELATIONS_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const char* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT stream_ordering,event_id,room_id FROM events LIMIT 1;");
  tx.exec("SELECT event_id,relates_to_id,rel_type FROM event_relations LIMIT 1;");
  tx.exec("SELECT relates_to_id,event_type,aggregation_key,count FROM event_relation_aggregations LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const relations::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELATIONS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    RELATIONS_LOG_INFO("Using sqlite backend", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELATIONS_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    RELATIONS_LOG_INFO("Using postgres backend", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELATIONS_LOG_INFO("Using in-memory backend");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildContext(const relations::runtime::config::RuntimeConfig& config,
                                     std::shared_ptr<db::Repository> repository) {
  const auto& limits = config.relations();

  service::ServiceContext ctx;
  ctx.repository   = repository;
  ctx.events       = std::make_shared<events::EventStore>(repository, config.server().server_name());
  ctx.membership   = std::make_shared<auth::RepositoryMembershipChecker>(repository);
  ctx.relations    = std::make_shared<core::RelationStore>(repository);
  ctx.aggregations = std::make_shared<core::AggregationEngine>(repository, ctx.relations);
  ctx.ingest       = std::make_shared<core::IngestValidator>(repository, ctx.events, ctx.membership, ctx.relations);
  ctx.bundler      = std::make_shared<core::Bundler>(ctx.aggregations, ctx.relations, limits.bundle_limit());

  ctx.limits.default_limit = limits.default_limit();
  ctx.limits.max_limit     = limits.max_limit();
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const relations::runtime::config::RuntimeConfig& config) {
  Application app;

  app.context           = BuildContext(config, BuildRepository(config));
  app.relations_service = std::make_shared<service::RelationsService>(app.context);
  app.room_service      = std::make_shared<service::RoomService>(app.context);

  app.grpc_services.push_back(std::make_unique<grpc::RelationsServer>(app.relations_service));
  app.grpc_services.push_back(std::make_unique<grpc::RoomServer>(app.room_service));

  return app;
}

} // namespace relations::factory
