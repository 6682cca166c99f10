#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/sqlite_task_api.hpp"
#include "internal/util/errors.hpp"
#if FLOWCHECK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_store.hpp"
#endif

namespace flowcheck::factory {

using observability::StringField;

namespace {

std::shared_ptr<db::Store> BuildSqliteStore(const flowcheck::config::SqliteConfig& sqlite) {
  if (sqlite.path().empty()) {
    throw util::InvalidConfig("database.sqlite.path is required");
  }

  // never created, never reconfigured: the tracker is only inspected
  std::shared_ptr<db::sqlite::SqliteDB> handle;
  try {
    handle = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), true);
  } catch (const std::runtime_error& e) {
    throw util::StoreUnavailable("cannot open " + sqlite.path() + ": " + e.what());
  }
  return std::make_shared<db::sqlite::SqliteStore>(std::move(handle));
}

#if FLOWCHECK_DB_POSTGRES
std::shared_ptr<db::Store> BuildPostgresStore(const flowcheck::config::PostgresConfig& postgres) {
  const std::size_t max_connections = postgres.max_connections() == 0 ? 4 : postgres.max_connections();
  auto              pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
  return std::make_shared<db::postgres::PgStore>(std::move(pool), "postgres");
}
#endif

} // namespace

std::shared_ptr<db::Store> BuildStore(const flowcheck::config::FlowConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto store = BuildSqliteStore(database.sqlite());
    FLOWCHECK_LOG_INFO("store opened", {StringField("store", store->Describe())});
    return store;
  }

  if (database.has_postgres()) {
#if FLOWCHECK_DB_POSTGRES
    auto store = BuildPostgresStore(database.postgres());
    FLOWCHECK_LOG_INFO("store opened", {StringField("store", store->Describe())});
    return store;
#else
    throw util::InvalidConfig("postgres backend requested but not enabled at build time");
#endif
  }

  throw util::InvalidConfig("no database configured; set database.sqlite.path or pass --db");
}

std::shared_ptr<probe::TaskApi> BuildTaskApi(const flowcheck::config::FlowConfig& config) {
  const std::string& path = config.probe().sandbox_path();
  try {
    return std::make_shared<probe::SqliteTaskApi>(std::make_shared<db::sqlite::SqliteDB>(path.empty() ? ":memory:" : path));
  } catch (const std::runtime_error& e) {
    throw util::StoreUnavailable("cannot open probe sandbox " + path + ": " + e.what());
  }
}

RunDependencies Build(const flowcheck::config::FlowConfig& config) {
  RunDependencies deps;
  deps.store    = BuildStore(config);
  deps.task_api = BuildTaskApi(config);
  return deps;
}

} // namespace flowcheck::factory
