#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace flowcheck::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  Opened with SQLITE_OPEN_FULLMUTEX so one handle can be shared by the
  worker pool; sqlite serializes access internally.

  read_only opens an existing file without CREATE and applies only
  connection-local pragmas; the file itself is never changed.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool read_only = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool ReadOnly() const {
    return read_only_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        read_only_ = false;
};

/*
  sql::Row over the current row of a stepped statement.
*/
class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override;
  int64_t     GetInt64(int col) const override;
  bool        IsNull(int col) const override;

 private:
  sqlite3_stmt* st_;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s);
void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s);
void BindI64(sqlite3_stmt* st, int idx, int64_t v);

} // namespace flowcheck::db::sqlite
