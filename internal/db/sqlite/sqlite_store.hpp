#pragma once

#include <initializer_list>
#include <memory>
#include <string>

#include "internal/db/api/store.hpp"
#include "sqlite_db.hpp"

namespace flowcheck::db::sqlite {

class SqliteStore final : public db::Store {
public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  std::vector<model::TaskRecord> ListTasks(const StoreFilter& filter) override;
  std::vector<model::SprintRecord> ListSprints(const StoreFilter& filter) override;
  std::vector<model::ProjectRecord> ListProjects(const StoreFilter& filter) override;

  bool IsHealthy() override;
  std::string Describe() const override;

private:
  template <typename Record, typename Reader>
  std::vector<Record> Query(const char* sql, std::initializer_list<std::string> params, Reader read);

  std::shared_ptr<SqliteDB> db_;
};

}
