#pragma once

namespace flowcheck::db::sql {

/*
  Canonical SQL for the tracker tables.

  IMPORTANT:
  SQLite placeholder syntax. The postgres backend prepares the same
  statements with $n placeholders in PgPool.

  Filter placeholders are bound twice: (? = '' OR col = ?).
*/

#define FLOWCHECK_TASK_COLUMNS                                                                  \
  "id,title,status,priority,project_id,sprint_id,owner,created_at,updated_at,completed_at," \
  "deleted_at,depends_on,blocks,assignees,audit_tag,correlation_hint"

static constexpr const char* SELECT_TASKS =
    "SELECT " FLOWCHECK_TASK_COLUMNS " FROM tasks"
    " WHERE (? = '' OR sprint_id = ?) AND (? = '' OR project_id = ?)"
    " ORDER BY id;";

static constexpr const char* SELECT_SPRINTS =
    "SELECT id,name,status,project_id,created_at,updated_at,completed_at FROM sprints"
    " WHERE (? = '' OR id = ?) AND (? = '' OR project_id = ?)"
    " ORDER BY id;";

static constexpr const char* SELECT_PROJECTS =
    "SELECT id,name,status,created_at,updated_at,completed_at FROM projects"
    " WHERE (? = '' OR id = ?)"
    " ORDER BY id;";

// task service (probe sandbox)

static constexpr const char* SELECT_TASK_BY_ID =
    "SELECT " FLOWCHECK_TASK_COLUMNS " FROM tasks WHERE id=?;";

static constexpr const char* SELECT_TASKS_BY_STATUS =
    "SELECT " FLOWCHECK_TASK_COLUMNS " FROM tasks"
    " WHERE deleted_at IS NULL AND (? = '' OR status = ?)"
    " ORDER BY id LIMIT ?;";

static constexpr const char* INSERT_TASK =
    "INSERT INTO tasks(" FLOWCHECK_TASK_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_TASK =
    "UPDATE tasks SET title=?,status=?,priority=?,project_id=?,sprint_id=?,owner=?,updated_at=?,"
    "completed_at=?,deleted_at=? WHERE id=?;";

}
