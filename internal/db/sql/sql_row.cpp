#include "sql_row.hpp"

namespace flowcheck::db::sql {

model::TaskRecord ReadTask(const Row& row) {
  model::TaskRecord r;
  r.id               = row.GetText(0);
  r.title            = row.GetText(1);
  r.status           = row.GetText(2);
  r.priority         = row.GetText(3);
  r.project_id       = row.GetText(4);
  r.sprint_id        = row.GetText(5);
  r.owner            = row.GetText(6);
  r.created_at       = row.GetText(7);
  r.updated_at       = row.GetText(8);
  r.completed_at     = row.GetText(9);
  r.deleted_at       = row.GetText(10);
  r.depends_on       = row.GetText(11);
  r.blocks           = row.GetText(12);
  r.assignees        = row.GetText(13);
  r.audit_tag        = row.GetText(14);
  r.correlation_hint = row.GetText(15);
  return r;
}

model::SprintRecord ReadSprint(const Row& row) {
  model::SprintRecord r;
  r.id           = row.GetText(0);
  r.name         = row.GetText(1);
  r.status       = row.GetText(2);
  r.project_id   = row.GetText(3);
  r.created_at   = row.GetText(4);
  r.updated_at   = row.GetText(5);
  r.completed_at = row.GetText(6);
  return r;
}

model::ProjectRecord ReadProject(const Row& row) {
  model::ProjectRecord r;
  r.id           = row.GetText(0);
  r.name         = row.GetText(1);
  r.status       = row.GetText(2);
  r.created_at   = row.GetText(3);
  r.updated_at   = row.GetText(4);
  r.completed_at = row.GetText(5);
  return r;
}

} // namespace flowcheck::db::sql
