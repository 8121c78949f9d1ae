#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/diff/diff_engine.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/merge/merge_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provenance/provenance_recorder.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/store/object_store.hpp"
#include "internal/validation/schema_validator.hpp"
#if GRAPHVC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if GRAPHVC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace graphvc::factory {

using graphvc::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const graphvc::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if GRAPHVC_DB_SQLITE
    const auto busy_timeout = std::chrono::milliseconds(database.sqlite().busy_timeout_ms() == 0 ? 5000 : database.sqlite().busy_timeout_ms());
    auto       sqlite_db    = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout);
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    GRAPHVC_LOG_INFO("database opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if GRAPHVC_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    GRAPHVC_LOG_INFO("database opened", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  GRAPHVC_LOG_INFO("database opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const graphvc::runtime::config::RuntimeConfig& config, std::shared_ptr<events::EventSink> events) {
  Application app;

  if (!events) {
    events = std::make_shared<events::LoggingEventSink>();
  }

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.lineage    = std::make_shared<lineage::LineageResolver>(app.repository);
  app.provenance = std::make_shared<provenance::ProvenanceRecorder>(app.repository);
  app.store      = std::make_shared<store::ObjectStore>(app.repository, app.lineage, diff::DiffEngine(diff::DiffOptions::FromConfig(config.diff())),
                                                   validation::BuildValidator(config.validation()), events);
  app.merge      = std::make_shared<merge::MergeEngine>(app.repository, app.lineage, app.store, app.provenance);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.lineage    = app.lineage;
  ctx.store      = app.store;
  ctx.merge      = app.merge;
  ctx.provenance = app.provenance;

  app.service = std::make_shared<service::GraphService>(ctx);
  return app;
}

} // namespace graphvc::factory
