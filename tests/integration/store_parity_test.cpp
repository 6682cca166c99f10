#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/store.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"

#if FLOWCHECK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_store.hpp"
#endif

namespace {

using flowcheck::db::Store;
using flowcheck::db::StoreFilter;
using flowcheck::db::memory::MemoryStore;
using flowcheck::db::model::ProjectRecord;
using flowcheck::db::model::SprintRecord;
using flowcheck::db::model::TaskRecord;

// The same tracker contents, as SQL and as records.
const std::vector<std::string>& SeedSql() {
  static const std::vector<std::string> sql = {
      "INSERT INTO projects VALUES ('P-1','Tracker','active','2025-01-01T00:00:00Z','2025-01-02T00:00:00Z',NULL);",
      "INSERT INTO projects VALUES ('P-2','Docs','discovery','2025-01-01T00:00:00Z','2025-01-01T00:00:00Z',NULL);",
      "INSERT INTO sprints VALUES ('S-1','Sprint 1','active','P-1','2025-01-03T00:00:00Z','2025-01-03T00:00:00Z',NULL);",
      "INSERT INTO sprints VALUES ('S-2','Sprint 2','planned','P-2','2025-01-03T00:00:00Z','2025-01-03T00:00:00Z',NULL);",
      "INSERT INTO tasks VALUES ('T-2','Wire API','in_progress','high','P-1','S-1','ana','2025-01-04T00:00:00Z',"
      "'2025-01-05T00:00:00Z',NULL,NULL,'[\"T-1\"]','[]','[\"ana\"]',NULL,NULL);",
      "INSERT INTO tasks VALUES ('T-1','Schema','done','medium','P-1','S-1','ana','2025-01-04T00:00:00Z',"
      "'2025-01-06T00:00:00Z','2025-01-06T00:00:00Z',NULL,'[]','[\"T-2\"]','[]','import','hint-1');",
      "INSERT INTO tasks VALUES ('T-3','Old draft','new','low','P-2','S-2',NULL,'2025-01-04T00:00:00Z',"
      "'2025-01-04T00:00:00Z',NULL,'2025-01-07T00:00:00Z',NULL,NULL,NULL,NULL,NULL);",
      "INSERT INTO tasks VALUES ('T-4','Review docs','review','medium','P-1','S-2','bo','2025-01-04T00:00:00Z',"
      "'2025-01-08T00:00:00Z',NULL,NULL,'[]','[]','[]','import',NULL);",
  };
  return sql;
}

void SeedMemory(MemoryStore& store) {
  store.AddProject({"P-2", "Docs", "discovery", "2025-01-01T00:00:00Z", "2025-01-01T00:00:00Z", ""});
  store.AddProject({"P-1", "Tracker", "active", "2025-01-01T00:00:00Z", "2025-01-02T00:00:00Z", ""});
  store.AddSprint({"S-2", "Sprint 2", "planned", "P-2", "2025-01-03T00:00:00Z", "2025-01-03T00:00:00Z", ""});
  store.AddSprint({"S-1", "Sprint 1", "active", "P-1", "2025-01-03T00:00:00Z", "2025-01-03T00:00:00Z", ""});

  store.AddTask({"T-4", "Review docs", "review", "medium", "P-1", "S-2", "bo", "2025-01-04T00:00:00Z", "2025-01-08T00:00:00Z", "", "",
                 "[]", "[]", "[]", "import", ""});
  store.AddTask({"T-3", "Old draft", "new", "low", "P-2", "S-2", "", "2025-01-04T00:00:00Z", "2025-01-04T00:00:00Z", "",
                 "2025-01-07T00:00:00Z", "", "", "", "", ""});
  store.AddTask({"T-2", "Wire API", "in_progress", "high", "P-1", "S-1", "ana", "2025-01-04T00:00:00Z", "2025-01-05T00:00:00Z", "", "",
                 "[\"T-1\"]", "[]", "[\"ana\"]", "", ""});
  store.AddTask({"T-1", "Schema", "done", "medium", "P-1", "S-1", "ana", "2025-01-04T00:00:00Z", "2025-01-06T00:00:00Z",
                 "2025-01-06T00:00:00Z", "", "[]", "[\"T-2\"]", "[]", "import", "hint-1"});
}

struct BackendFactory {
  std::string                             name;
  std::function<std::shared_ptr<Store>()> make_store;
  std::function<void()>                   cleanup;
};

std::vector<std::string> TaskIds(const std::vector<TaskRecord>& rows) {
  std::vector<std::string> ids;
  for (const auto& t : rows) ids.push_back(t.id);
  return ids;
}

void VerifyUnfilteredListings(Store& store) {
  auto tasks = store.ListTasks(StoreFilter{});
  // soft-deleted rows included, ordered by id
  assert((TaskIds(tasks) == std::vector<std::string>{"T-1", "T-2", "T-3", "T-4"}));

  const auto& t1 = tasks[0];
  assert(t1.title == "Schema" && t1.status == "done" && t1.priority == "medium");
  assert(t1.completed_at == "2025-01-06T00:00:00Z");
  assert(t1.blocks == "[\"T-2\"]");
  assert(t1.audit_tag == "import" && t1.correlation_hint == "hint-1");
  assert(!t1.IsDeleted());

  // NULL columns read back as empty strings
  const auto& t3 = tasks[2];
  assert(t3.owner.empty() && t3.depends_on.empty() && t3.completed_at.empty());
  assert(t3.IsDeleted());

  assert(store.ListSprints(StoreFilter{}).size() == 2);

  auto projects = store.ListProjects(StoreFilter{});
  assert(projects.size() == 2);
  assert(projects[0].id == "P-1" && projects[0].status == "active");
  assert(projects[1].completed_at.empty());
}

void VerifyFilters(Store& store) {
  assert((TaskIds(store.ListTasks({"S-1", ""})) == std::vector<std::string>{"T-1", "T-2"}));
  assert((TaskIds(store.ListTasks({"", "P-1"})) == std::vector<std::string>{"T-1", "T-2", "T-4"}));
  assert((TaskIds(store.ListTasks({"S-2", "P-1"})) == std::vector<std::string>{"T-4"}));
  assert(store.ListTasks({"S-9", ""}).empty());

  auto by_project = store.ListSprints({"", "P-1"});
  assert(by_project.size() == 1 && by_project[0].id == "S-1");
  auto by_id = store.ListSprints({"S-2", ""});
  assert(by_id.size() == 1 && by_id[0].project_id == "P-2");

  auto project = store.ListProjects({"", "P-2"});
  assert(project.size() == 1 && project[0].name == "Docs");
}

void RunBackendSuite(BackendFactory& backend) {
  auto store = backend.make_store();
  assert(store->IsHealthy());
  assert(!store->Describe().empty());

  VerifyUnfilteredListings(*store);
  VerifyFilters(*store);

  store.reset();
  if (backend.cleanup) backend.cleanup();
  std::cout << "  " << backend.name << ": ok\n";
}

BackendFactory MakeMemoryFactory() {
  return {"memory",
          [] {
            auto store = std::make_shared<MemoryStore>();
            SeedMemory(*store);
            return std::static_pointer_cast<Store>(store);
          },
          nullptr};
}

BackendFactory MakeSqliteFactory() {
  const auto path = std::filesystem::temp_directory_path() / "flowcheck_store_parity.db";
  std::filesystem::remove(path);

  {
    flowcheck::db::sqlite::SqliteDB seed(path.string());
    flowcheck::db::sql::RunMigrations(seed, flowcheck::db::sql::TrackerSchema());
    flowcheck::db::sql::RunMigrations(seed, SeedSql());
    seed.Exec("PRAGMA journal_mode=DELETE;");
  }

  return {"sqlite",
          [path] {
            // opened the way the runner opens a tracker database
            auto db = std::make_shared<flowcheck::db::sqlite::SqliteDB>(path.string(), true);

            bool rejected = false;
            try {
              db->Exec("DELETE FROM tasks;");
            } catch (const std::runtime_error&) {
              rejected = true;
            }
            assert(rejected && "read-only handle must refuse writes");

            return std::static_pointer_cast<Store>(std::make_shared<flowcheck::db::sqlite::SqliteStore>(db));
          },
          [path] { std::filesystem::remove(path); }};
}

#if FLOWCHECK_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLOWCHECK_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLOWCHECK_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  {
    // pool connections prepare statements against the tables
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    tx.exec("DROP TABLE IF EXISTS tasks, sprints, projects;");
    for (const auto& sql : flowcheck::db::sql::TrackerSchema()) tx.exec(sql);
    for (const auto& sql : SeedSql()) tx.exec(sql);
    tx.commit();
  }

  auto pool = std::make_shared<flowcheck::db::postgres::PgPool>(conninfo);
  return {"postgres",
          [pool] { return std::static_pointer_cast<Store>(std::make_shared<flowcheck::db::postgres::PgStore>(pool, "postgres (test)")); },
          [pool] {
            auto       conn = pool->Acquire();
            pqxx::work tx(*conn);
            tx.exec("DROP TABLE IF EXISTS tasks, sprints, projects;");
            tx.commit();
          }};
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if FLOWCHECK_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "flowcheck_integration_store_parity: pass\n";
  return 0;
}
