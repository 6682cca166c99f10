#include "migrations.hpp"

namespace flowcheck::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& TrackerSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS projects (id TEXT PRIMARY KEY, name TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'discovery', created_at TEXT "
      "NOT NULL, updated_at TEXT NOT NULL, completed_at TEXT);",
      "CREATE TABLE IF NOT EXISTS sprints (id TEXT PRIMARY KEY, name TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'planned', project_id TEXT, "
      "created_at TEXT NOT NULL, updated_at TEXT NOT NULL, completed_at TEXT);",
      "CREATE TABLE IF NOT EXISTS tasks (id TEXT PRIMARY KEY, title TEXT NOT NULL, status TEXT NOT NULL, priority TEXT NOT NULL DEFAULT "
      "'medium', project_id TEXT, sprint_id TEXT, owner TEXT, created_at TEXT NOT NULL, updated_at TEXT NOT NULL, completed_at TEXT, "
      "deleted_at TEXT, depends_on TEXT, blocks TEXT, assignees TEXT, audit_tag TEXT, correlation_hint TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_sprint ON tasks(sprint_id);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_project ON tasks(project_id);"};
  return kSchema;
}

} // namespace flowcheck::db::sql
