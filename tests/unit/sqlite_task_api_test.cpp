#include "internal/probe/sqlite_task_api.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

using flowcheck::db::sqlite::SqliteDB;
using flowcheck::probe::SqliteTaskApi;
using flowcheck::probe::TaskDraft;
using flowcheck::probe::TaskPatch;
using flowcheck::probe::TaskQuery;
namespace probe = flowcheck::probe;

std::unique_ptr<SqliteTaskApi> MakeApi() {
  return std::make_unique<SqliteTaskApi>(std::make_shared<SqliteDB>(":memory:"));
}

TaskDraft Draft(const std::string& title, const std::string& status = "new") {
  TaskDraft d;
  d.title  = title;
  d.status = status;
  return d;
}

TaskPatch StatusPatch(const std::string& status) {
  TaskPatch p;
  p.status = status;
  return p;
}

void TestCreateValidatesInput() {
  auto api = MakeApi();

  auto ok = api->Create(Draft("write docs"));
  assert(ok.status_code == probe::kCreated);
  assert(ok.task && ok.task->id.rfind("T-", 0) == 0);
  assert(ok.task->priority == "medium");
  assert(!ok.task->created_at.empty() && ok.task->created_at == ok.task->updated_at);

  assert(api->Create(Draft("  ")).status_code == probe::kUnprocessable);
  assert(api->Create(Draft("x", "paused")).status_code == probe::kUnprocessable);

  auto bad_priority     = Draft("x");
  bad_priority.priority = "urgent";
  assert(api->Create(bad_priority).status_code == probe::kUnprocessable);

  auto fixed = Draft("fixed id");
  fixed.id   = "T-fixed";
  assert(api->Create(fixed).status_code == probe::kCreated);
  assert(api->Create(fixed).status_code == probe::kConflict);
}

void TestGetAndList() {
  auto api = MakeApi();
  auto a   = api->Create(Draft("a"));
  api->Create(Draft("b", "in_progress"));
  api->Create(Draft("c", "in_progress"));

  auto got = api->Get(a.task->id);
  assert(got.status_code == probe::kOk && got.task->title == "a");
  assert(api->Get("T-missing").status_code == probe::kNotFound);

  assert(api->List(TaskQuery{}).tasks.size() == 3);
  auto in_progress = api->List(TaskQuery{"in_progress", 100});
  assert(in_progress.tasks.size() == 2);
  assert(api->List(TaskQuery{"in_progress", 1}).tasks.size() == 1);
  assert(api->List(TaskQuery{"bogus", 10}).status_code == probe::kUnprocessable);
}

void TestUpdateFollowsWorkflow() {
  auto api = MakeApi();
  auto id  = api->Create(Draft("flow")).task->id;

  assert(api->Update(id, StatusPatch("review")).status_code == probe::kConflict);
  assert(api->Update(id, StatusPatch("in_progress")).status_code == probe::kOk);
  assert(api->Update(id, StatusPatch("review")).status_code == probe::kOk);

  auto done = api->Update(id, StatusPatch("done"));
  assert(done.status_code == probe::kOk);
  assert(!done.task->completed_at.empty());

  auto reopen = api->Update(id, StatusPatch("in_progress"));
  assert(reopen.status_code == probe::kConflict);
  assert(reopen.error == "transition done -> in_progress is not allowed");

  assert(api->Update(id, StatusPatch("nonsense")).status_code == probe::kUnprocessable);
  assert(api->Update("T-missing", StatusPatch("ready")).status_code == probe::kNotFound);

  TaskPatch priority;
  priority.priority = "high";
  auto updated      = api->Update(id, priority);
  assert(updated.status_code == probe::kOk && updated.task->priority == "high");
  assert(updated.task->status == "done");
}

void TestSoftDelete() {
  auto api = MakeApi();
  auto id  = api->Create(Draft("to delete")).task->id;

  auto deleted = api->Delete(id);
  assert(deleted.status_code == probe::kOk);
  assert(deleted.task->IsDeleted());

  auto after = api->Get(id);
  assert(after.status_code == probe::kOk && after.task->IsDeleted());

  assert(api->Delete(id).status_code == probe::kNotFound);
  assert(api->Update(id, StatusPatch("ready")).status_code == probe::kNotFound);
}

} // namespace

int main() {
  TestCreateValidatesInput();
  TestGetAndList();
  TestUpdateFollowsWorkflow();
  TestSoftDelete();

  std::cout << "flowcheck_unit_sqlite_task_api: pass\n";
  return 0;
}
