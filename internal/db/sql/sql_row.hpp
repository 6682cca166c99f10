#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/project_record.hpp"
#include "internal/db/model/sprint_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace flowcheck::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into record mapping.
*/

class Row {
public:
  virtual ~Row() = default;

  // NULL reads as ""
  virtual std::string GetText(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual bool IsNull(int col) const = 0;
};

// Column order matches the SELECT lists in sql_queries.hpp.
model::TaskRecord    ReadTask(const Row& row);
model::SprintRecord  ReadSprint(const Row& row);
model::ProjectRecord ReadProject(const Row& row);

}
