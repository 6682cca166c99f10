#include "sqlite_store.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace flowcheck::db::sqlite {

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

template <typename Record, typename Reader>
std::vector<Record> SqliteStore::Query(const char* sql, std::initializer_list<std::string> params, Reader read) {
  Statement st;
  try {
    st = db_->Prepare(sql);
  } catch (const std::runtime_error& e) {
    throw util::StoreUnavailable(e.what());
  }

  int idx = 1;
  for (const auto& p : params) {
    // every filter value is bound twice: (? = '' OR col = ?)
    BindText(st.get(), idx++, p);
    BindText(st.get(), idx++, p);
  }

  std::vector<Record> out;
  SqliteRow           row(st.get());
  int                 rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(read(row));
  }
  if (rc != SQLITE_DONE) {
    throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db_->Handle()));
  }
  return out;
}

std::vector<model::TaskRecord> SqliteStore::ListTasks(const StoreFilter& filter) {
  return Query<model::TaskRecord>(sql::SELECT_TASKS, {filter.sprint_id, filter.project_id}, sql::ReadTask);
}

std::vector<model::SprintRecord> SqliteStore::ListSprints(const StoreFilter& filter) {
  return Query<model::SprintRecord>(sql::SELECT_SPRINTS, {filter.sprint_id, filter.project_id}, sql::ReadSprint);
}

std::vector<model::ProjectRecord> SqliteStore::ListProjects(const StoreFilter& filter) {
  return Query<model::ProjectRecord>(sql::SELECT_PROJECTS, {filter.project_id}, sql::ReadProject);
}

bool SqliteStore::IsHealthy() {
  try {
    auto st = db_->Prepare("SELECT 1;");
    return sqlite3_step(st.get()) == SQLITE_ROW;
  } catch (const std::runtime_error&) {
    return false;
  }
}

std::string SqliteStore::Describe() const {
  return "sqlite:" + db_->Path();
}

} // namespace flowcheck::db::sqlite
