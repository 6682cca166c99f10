#include "sqlite_task_api.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowcheck::probe {

using db::model::TaskRecord;
using db::sqlite::BindI64;
using db::sqlite::BindNullableText;
using db::sqlite::BindText;

namespace {

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

ApiResponse Error(int code, std::string message) {
  ApiResponse r;
  r.status_code = code;
  r.error       = std::move(message);
  return r;
}

ApiResponse WithTask(int code, TaskRecord task) {
  ApiResponse r;
  r.status_code = code;
  r.task        = std::move(task);
  return r;
}

void StepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  const int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteTaskApi::SqliteTaskApi(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  db::sql::RunMigrations(*db_, db::sql::TrackerSchema());
}

std::optional<TaskRecord> SqliteTaskApi::Load(const std::string& id) {
  auto st = db_->Prepare(db::sql::SELECT_TASK_BY_ID);
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("load task: ") + sqlite3_errmsg(db_->Handle()));
  }
  db::sqlite::SqliteRow row(st.get());
  return db::sql::ReadTask(row);
}

void SqliteTaskApi::Store(const TaskRecord& t) {
  auto st = db_->Prepare(db::sql::UPDATE_TASK);
  BindText(st.get(), 1, t.title);
  BindText(st.get(), 2, t.status);
  BindText(st.get(), 3, t.priority);
  BindNullableText(st.get(), 4, t.project_id);
  BindNullableText(st.get(), 5, t.sprint_id);
  BindNullableText(st.get(), 6, t.owner);
  BindText(st.get(), 7, t.updated_at);
  BindNullableText(st.get(), 8, t.completed_at);
  BindNullableText(st.get(), 9, t.deleted_at);
  BindText(st.get(), 10, t.id);
  StepDone(db_->Handle(), st.get(), "update task");
}

ApiResponse SqliteTaskApi::Create(const TaskDraft& draft) {
  if (IsBlank(draft.title)) return Error(kUnprocessable, "title is required");
  const auto status = model::ParseTaskStatus(draft.status);
  if (!status) return Error(kUnprocessable, "invalid status: " + draft.status);
  if (!model::ParseTaskPriority(draft.priority)) return Error(kUnprocessable, "invalid priority: " + draft.priority);

  TaskRecord t;
  t.id               = draft.id.empty() ? "T-" + util::ShortHex(12) : draft.id;
  t.title            = draft.title;
  t.status           = draft.status;
  t.priority         = draft.priority;
  t.project_id       = draft.project_id;
  t.sprint_id        = draft.sprint_id;
  t.owner            = draft.owner;
  t.created_at       = util::ToIso8601(util::Now());
  t.updated_at       = t.created_at;
  t.completed_at     = *status == model::TaskStatus::kDone ? t.created_at : "";
  t.depends_on       = draft.depends_on;
  t.blocks           = draft.blocks;
  t.assignees        = draft.assignees;
  t.audit_tag        = draft.audit_tag;
  t.correlation_hint = draft.correlation_hint;

  std::lock_guard lock(mutex_);
  db::sqlite::SqliteTransaction tx(db_);
  if (Load(t.id)) return Error(kConflict, "task already exists: " + t.id);

  auto st = db_->Prepare(db::sql::INSERT_TASK);
  const std::string* cols[] = {&t.id,         &t.title,      &t.status,       &t.priority,   &t.project_id, &t.sprint_id,
                               &t.owner,      &t.created_at, &t.updated_at,   &t.completed_at, &t.deleted_at, &t.depends_on,
                               &t.blocks,     &t.assignees,  &t.audit_tag,    &t.correlation_hint};
  int idx = 1;
  for (const auto* c : cols) BindNullableText(st.get(), idx++, *c);
  StepDone(db_->Handle(), st.get(), "insert task");
  tx.Commit();

  return WithTask(kCreated, std::move(t));
}

ApiResponse SqliteTaskApi::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            t = Load(id);
  if (!t) return Error(kNotFound, "task not found: " + id);
  return WithTask(kOk, std::move(*t));
}

ApiResponse SqliteTaskApi::List(const TaskQuery& query) {
  if (!query.status.empty() && !model::ParseTaskStatus(query.status)) {
    return Error(kUnprocessable, "invalid status filter: " + query.status);
  }

  std::lock_guard lock(mutex_);
  auto            st = db_->Prepare(db::sql::SELECT_TASKS_BY_STATUS);
  BindText(st.get(), 1, query.status);
  BindText(st.get(), 2, query.status);
  BindI64(st.get(), 3, static_cast<int64_t>(query.limit));

  ApiResponse r;
  r.status_code = kOk;
  db::sqlite::SqliteRow row(st.get());
  int                   rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    r.tasks.push_back(db::sql::ReadTask(row));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("list tasks: ") + sqlite3_errmsg(db_->Handle()));
  }
  return r;
}

ApiResponse SqliteTaskApi::Update(const std::string& id, const TaskPatch& patch) {
  if (patch.title && IsBlank(*patch.title)) return Error(kUnprocessable, "title is required");
  if (patch.priority && !model::ParseTaskPriority(*patch.priority)) {
    return Error(kUnprocessable, "invalid priority: " + *patch.priority);
  }
  std::optional<model::TaskStatus> to;
  if (patch.status) {
    to = model::ParseTaskStatus(*patch.status);
    if (!to) return Error(kUnprocessable, "invalid status: " + *patch.status);
  }

  std::lock_guard lock(mutex_);
  db::sqlite::SqliteTransaction tx(db_);

  auto t = Load(id);
  if (!t || t->IsDeleted()) return Error(kNotFound, "task not found: " + id);

  const auto now = util::ToIso8601(util::Now());
  if (to) {
    const auto from = model::ParseTaskStatus(t->status);
    if (!from) return Error(kConflict, "stored status is not recognised: " + t->status);
    if (!model::CanTransition(*from, *to)) {
      return Error(kConflict, "transition " + t->status + " -> " + *patch.status + " is not allowed");
    }
    if (*to == model::TaskStatus::kDone && *from != model::TaskStatus::kDone) t->completed_at = now;
    t->status = *patch.status;
  }
  if (patch.title) t->title = *patch.title;
  if (patch.priority) t->priority = *patch.priority;
  if (patch.project_id) t->project_id = *patch.project_id;
  if (patch.sprint_id) t->sprint_id = *patch.sprint_id;
  if (patch.owner) t->owner = *patch.owner;
  t->updated_at = now;

  Store(*t);
  tx.Commit();
  return WithTask(kOk, std::move(*t));
}

ApiResponse SqliteTaskApi::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);
  db::sqlite::SqliteTransaction tx(db_);

  auto t = Load(id);
  if (!t || t->IsDeleted()) return Error(kNotFound, "task not found: " + id);

  t->deleted_at = util::ToIso8601(util::Now());
  t->updated_at = t->deleted_at;
  Store(*t);
  tx.Commit();
  return WithTask(kOk, std::move(*t));
}

} // namespace flowcheck::probe
