#pragma once

#include <string>
#include <vector>

namespace flowcheck::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// projects, sprints, tasks. Tasks carry no FOREIGN KEY clauses: the
// tracker never declared them and the integrity check exists to find
// what that lets through.
const std::vector<std::string>& TrackerSchema();

} // namespace flowcheck::db::sql
