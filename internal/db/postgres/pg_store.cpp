#include "pg_store.hpp"

#include "internal/db/sql/sql_row.hpp"
#include "internal/util/errors.hpp"

namespace flowcheck::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    const auto field = row_[col];
    return field.is_null() ? std::string{} : field.as<std::string>();
  }

  int64_t GetInt64(int col) const override {
    const auto field = row_[col];
    return field.is_null() ? 0 : field.as<int64_t>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

} // namespace

PgStore::PgStore(std::shared_ptr<PgPool> pool, std::string description)
    : pool_(std::move(pool)), description_(std::move(description)) {
}

template <typename Record, typename Reader>
std::vector<Record> PgStore::Query(const char* statement, const std::string& a, const std::string& b, Reader read) {
  std::vector<Record> out;
  try {
    auto               conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    const auto         res = tx.exec_prepared(statement, a, b);
    out.reserve(res.size());
    for (const auto& r : res) {
      PgRow row(r);
      out.push_back(read(row));
    }
    tx.commit();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres ") + statement + ": " + e.what());
  }
  return out;
}

std::vector<model::TaskRecord> PgStore::ListTasks(const StoreFilter& filter) {
  return Query<model::TaskRecord>("list_tasks", filter.sprint_id, filter.project_id, sql::ReadTask);
}

std::vector<model::SprintRecord> PgStore::ListSprints(const StoreFilter& filter) {
  return Query<model::SprintRecord>("list_sprints", filter.sprint_id, filter.project_id, sql::ReadSprint);
}

std::vector<model::ProjectRecord> PgStore::ListProjects(const StoreFilter& filter) {
  std::vector<model::ProjectRecord> out;
  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    const auto             res = tx.exec_prepared("list_projects", filter.project_id);
    for (const auto& r : res) {
      PgRow row(r);
      out.push_back(sql::ReadProject(row));
    }
    tx.commit();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres list_projects: ") + e.what());
  }
  return out;
}

bool PgStore::IsHealthy() {
  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    tx.exec("SELECT 1");
    tx.commit();
    return true;
  } catch (const pqxx::failure&) {
    return false;
  }
}

std::string PgStore::Describe() const {
  return description_;
}

} // namespace flowcheck::db::postgres
