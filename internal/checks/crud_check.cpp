#include "crud_check.hpp"

#include "check_support.hpp"

namespace flowcheck::checks {

using flow::Severity;

flow::CheckOutcome CrudCheck::Validate(const flow::CheckContext& ctx) {
  auto&                api = RequireTaskApi(ctx, Name());
  flow::OutcomeBuilder out{std::string(Name())};

  // create
  auto minimal = api.Create(ProbeDraft("crud probe: minimal"));
  out.Expect(minimal.status_code == probe::kCreated, Severity::kCritical, "create_failed", "tasks", "", "",
             "create minimal task: " + Describe(minimal));

  auto complete_draft             = ProbeDraft("crud probe: complete");
  complete_draft.priority         = "high";
  complete_draft.owner            = "flowcheck";
  complete_draft.depends_on       = "[]";
  complete_draft.blocks           = "[]";
  complete_draft.assignees        = "[\"flowcheck\"]";
  complete_draft.correlation_hint = "crud-probe";
  auto complete = api.Create(complete_draft);
  out.Expect(complete.status_code == probe::kCreated, Severity::kCritical, "create_failed", "tasks", "", "",
             "create complete task: " + Describe(complete));

  auto invalid_status = api.Create(ProbeDraft("crud probe: invalid status", "not_a_status"));
  out.Expect(invalid_status.status_code == probe::kUnprocessable, Severity::kCritical, "validation_bypassed", "tasks", "status", "",
             "create with invalid status should be rejected, got " + Describe(invalid_status));

  auto no_title = api.Create(ProbeDraft(""));
  out.Expect(no_title.status_code == probe::kUnprocessable, Severity::kCritical, "validation_bypassed", "tasks", "title", "",
             "create without title should be rejected, got " + Describe(no_title));

  // read
  auto listed = api.List(probe::TaskQuery{});
  out.Expect(listed.status_code == probe::kOk, Severity::kCritical, "read_failed", "tasks", "", "", "list tasks: " + Describe(listed));

  if (minimal.task) {
    const auto& id  = minimal.task->id;
    auto        got = api.Get(id);
    out.Expect(got.status_code == probe::kOk && got.task && got.task->id == id, Severity::kCritical, "read_failed", "tasks", "id", id,
               "read task by id: " + Describe(got));
  }

  auto filtered = api.List(probe::TaskQuery{"new", 100});
  bool only_new = filtered.status_code == probe::kOk;
  for (const auto& t : filtered.tasks) only_new = only_new && t.status == "new";
  out.Expect(only_new, Severity::kCritical, "read_failed", "tasks", "status", "", "list filtered by status: " + Describe(filtered));

  auto missing = api.Get("flowcheck-missing-task");
  out.Expect(missing.status_code == probe::kNotFound, Severity::kWarning, "wrong_status_code", "tasks", "id", "flowcheck-missing-task",
             "read of unknown id should be 404, got " + Describe(missing));

  // update
  auto target = api.Create(ProbeDraft("crud probe: update target"));
  if (!target.task) {
    out.Critical("setup_failed", "tasks", "", "", "update setup: " + Describe(target));
  } else {
    const auto& id = target.task->id;

    probe::TaskPatch status_patch;
    status_patch.status = "in_progress";
    auto by_status      = api.Update(id, status_patch);
    out.Expect(by_status.status_code == probe::kOk && by_status.task && by_status.task->status == "in_progress", Severity::kCritical,
               "update_failed", "tasks", "status", id, "update status: " + Describe(by_status));

    probe::TaskPatch priority_patch;
    priority_patch.priority = "critical";
    auto by_priority        = api.Update(id, priority_patch);
    out.Expect(by_priority.status_code == probe::kOk && by_priority.task && by_priority.task->priority == "critical", Severity::kCritical,
               "update_failed", "tasks", "priority", id, "update priority: " + Describe(by_priority));

    probe::TaskPatch bad_patch;
    bad_patch.status = "not_a_status";
    auto bad         = api.Update(id, bad_patch);
    out.Expect(bad.status_code == probe::kUnprocessable, Severity::kCritical, "validation_bypassed", "tasks", "status", id,
               "update with invalid status should be rejected, got " + Describe(bad));
  }

  probe::TaskPatch title_patch;
  title_patch.title = "renamed";
  auto update_missing = api.Update("flowcheck-missing-task", title_patch);
  out.Expect(update_missing.status_code == probe::kNotFound, Severity::kWarning, "wrong_status_code", "tasks", "id",
             "flowcheck-missing-task", "update of unknown id should be 404, got " + Describe(update_missing));

  // delete
  auto victim = api.Create(ProbeDraft("crud probe: delete target"));
  if (!victim.task) {
    out.Critical("setup_failed", "tasks", "", "", "delete setup: " + Describe(victim));
  } else {
    const auto& id      = victim.task->id;
    auto        deleted = api.Delete(id);
    out.Expect(deleted.status_code == probe::kOk, Severity::kCritical, "delete_failed", "tasks", "deleted_at", id,
               "soft delete: " + Describe(deleted));

    auto after = api.Get(id);
    out.Expect(after.status_code == probe::kOk && after.task && after.task->IsDeleted(), Severity::kCritical, "delete_failed", "tasks",
               "deleted_at", id, "soft-deleted row should stay readable with deleted_at set: " + Describe(after));
  }

  return out.Build();
}

} // namespace flowcheck::checks
