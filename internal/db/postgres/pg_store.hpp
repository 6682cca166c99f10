#pragma once

#include <memory>
#include <string>

#include "internal/db/api/store.hpp"
#include "pg_pool.hpp"

namespace flowcheck::db::postgres {

// Store over a PostgreSQL tracker database. Reads use read-only transactions.
class PgStore final : public db::Store {
 public:
  PgStore(std::shared_ptr<PgPool> pool, std::string description);

  std::vector<model::TaskRecord> ListTasks(const StoreFilter& filter) override;
  std::vector<model::SprintRecord> ListSprints(const StoreFilter& filter) override;
  std::vector<model::ProjectRecord> ListProjects(const StoreFilter& filter) override;

  bool IsHealthy() override;
  std::string Describe() const override;

 private:
  template <typename Record, typename Reader>
  std::vector<Record> Query(const char* statement, const std::string& a, const std::string& b, Reader read);

  std::shared_ptr<PgPool> pool_;
  std::string description_;
};

} // namespace flowcheck::db::postgres
