#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "task_api.hpp"

namespace flowcheck::probe {

/*
  TaskApi backed by a private SQLite database.

  The constructor applies the tracker schema, so a fresh ":memory:" or
  scratch file path is all it needs. Calls are serialized; the handle is
  shared but write transactions are not interleaved.
*/
class SqliteTaskApi final : public TaskApi {
 public:
  explicit SqliteTaskApi(std::shared_ptr<db::sqlite::SqliteDB> db);

  ApiResponse Create(const TaskDraft& draft) override;
  ApiResponse Get(const std::string& id) override;
  ApiResponse List(const TaskQuery& query) override;
  ApiResponse Update(const std::string& id, const TaskPatch& patch) override;
  ApiResponse Delete(const std::string& id) override;

 private:
  std::optional<db::model::TaskRecord> Load(const std::string& id);
  void                                 Store(const db::model::TaskRecord& task);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::mutex                            mutex_;
};

} // namespace flowcheck::probe
