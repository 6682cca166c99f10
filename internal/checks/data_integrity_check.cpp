#include "data_integrity_check.hpp"

#include <map>
#include <optional>
#include <set>
#include <tuple>

#include "internal/util/time.hpp"
#include "check_support.hpp"
#include "json_text.hpp"

namespace flowcheck::checks {

using db::model::SprintRecord;
using db::model::TaskRecord;

namespace {

// Rows under the run filter plus unfiltered lookups for parents.
struct Snapshot {
  std::vector<TaskRecord>                  tasks;
  std::vector<SprintRecord>                sprints;
  std::vector<TaskRecord>                  all_task_rows;
  std::map<std::string, const TaskRecord*> all_tasks;
  std::map<std::string, SprintRecord>      all_sprints;
  std::set<std::string>                    project_ids;
};

void CheckForeignKeys(const Snapshot& s, flow::OutcomeBuilder& out) {
  for (const auto& t : s.tasks) {
    if (t.IsDeleted()) continue;
    if (!t.project_id.empty() && !s.project_ids.count(t.project_id)) {
      out.Critical("foreign_key_violation", "tasks", "project_id", t.id,
                   "Task " + t.id + " references non-existent project " + t.project_id);
    }
    if (!t.sprint_id.empty() && !s.all_sprints.count(t.sprint_id)) {
      out.Critical("foreign_key_violation", "tasks", "sprint_id", t.id,
                   "Task " + t.id + " references non-existent sprint " + t.sprint_id);
    }
  }
  for (const auto& sp : s.sprints) {
    if (!sp.project_id.empty() && !s.project_ids.count(sp.project_id)) {
      out.Critical("foreign_key_violation", "sprints", "project_id", sp.id,
                   "Sprint " + sp.id + " references non-existent project " + sp.project_id);
    }
  }
}

void CheckEmbeddedStructures(const Snapshot& s, flow::OutcomeBuilder& out) {
  struct Column {
    const char*              name;
    std::string TaskRecord::*member;
    bool                     critical;
  };
  static const Column kColumns[] = {
      {"depends_on", &TaskRecord::depends_on, true},
      {"blocks", &TaskRecord::blocks, true},
      {"assignees", &TaskRecord::assignees, false},
  };

  for (const auto& t : s.tasks) {
    if (t.IsDeleted()) continue;
    for (const auto& col : kColumns) {
      const auto& text = t.*col.member;
      if (text.empty()) continue;

      std::string error;
      if (ParseJson(text, &error)) continue;

      auto description = "Task " + t.id + " has invalid JSON in " + col.name + ": " + error;
      if (col.critical) {
        out.Critical("invalid_json", "tasks", col.name, t.id, std::move(description));
      } else {
        out.Warn("invalid_json", "tasks", col.name, t.id, std::move(description));
      }
    }
  }
}

void CheckOrphanedReferences(const Snapshot& s, flow::OutcomeBuilder& out) {
  for (const auto& t : s.tasks) {
    if (t.IsDeleted() || t.depends_on.empty()) continue;
    // malformed text is reported by the structure category
    auto deps = ParseIdList(t.depends_on);
    if (!deps) continue;

    for (const auto& dep : *deps) {
      auto it = s.all_tasks.find(dep);
      if (it == s.all_tasks.end() || it->second->IsDeleted()) {
        out.Warn("orphaned_reference", "tasks", "depends_on", t.id,
                 "Task " + t.id + " depends on deleted/non-existent task " + dep);
      }
    }
  }
}

void CheckTimestamps(const Snapshot& s, flow::OutcomeBuilder& out) {
  for (const auto& t : s.tasks) {
    if (t.IsDeleted()) continue;

    std::optional<util::TimePoint> created;
    std::optional<util::TimePoint> updated;
    for (auto [field, text, parsed] : {std::make_tuple("created_at", &t.created_at, &created),
                                       std::make_tuple("updated_at", &t.updated_at, &updated)}) {
      if (text->empty()) continue;
      *parsed = util::ParseIso8601(*text);
      if (!*parsed) {
        out.Warn("invalid_format", "tasks", field, t.id, "Task " + t.id + " has invalid " + field + " format: " + *text);
      }
    }

    if (created && updated && *created > *updated) {
      out.Critical("timestamp_violation", "tasks", "created_at, updated_at", t.id, "Task " + t.id + " has created_at > updated_at");
    }

    if (t.status == "done" && t.completed_at.empty()) {
      out.Warn("missing_field", "tasks", "completed_at", t.id, "Task " + t.id + " has status=done but no completed_at");
    }
  }
}

void CheckUniqueness(const Snapshot& s, flow::OutcomeBuilder& out) {
  std::map<std::string, std::size_t> counts;
  for (const auto& t : s.tasks) ++counts[t.id];

  for (const auto& [id, count] : counts) {
    if (count > 1) {
      out.Critical("duplicate_id", "tasks", "id", id,
                   "Duplicate task ID found: " + id + " (" + std::to_string(count) + " instances)");
    }
  }
}

void CheckSoftDeletes(const Snapshot& s, flow::OutcomeBuilder& out) {
  for (const auto& t : s.tasks) {
    if (!t.IsDeleted() || t.sprint_id.empty()) continue;
    auto it = s.all_sprints.find(t.sprint_id);
    if (it != s.all_sprints.end() && it->second.status == "active") {
      out.Warn("deleted_in_active_sprint", "tasks", "deleted_at", t.id,
               "Deleted task " + t.id + " still assigned to active sprint " + t.sprint_id);
    }
  }
}

} // namespace

flow::CheckOutcome DataIntegrityCheck::Validate(const flow::CheckContext& ctx) {
  auto&                 store = RequireStore(ctx, Name());
  Snapshot              s;
  const db::StoreFilter all;

  s.all_task_rows = store.ListTasks(all);
  s.tasks         = ctx.filter.Empty() ? s.all_task_rows : store.ListTasks(ctx.filter);
  for (const auto& t : s.all_task_rows) {
    // a live row wins over a deleted duplicate
    auto [it, inserted] = s.all_tasks.emplace(t.id, &t);
    if (!inserted && it->second->IsDeleted() && !t.IsDeleted()) it->second = &t;
  }

  for (auto& sp : store.ListSprints(all)) s.all_sprints.emplace(sp.id, sp);
  s.sprints = ctx.filter.Empty() ? store.ListSprints(all) : store.ListSprints(ctx.filter);
  for (const auto& p : store.ListProjects(all)) s.project_ids.insert(p.id);

  flow::OutcomeBuilder out{std::string(Name())};
  using Category = void (*)(const Snapshot&, flow::OutcomeBuilder&);
  for (Category category : {CheckForeignKeys, CheckEmbeddedStructures, CheckOrphanedReferences, CheckTimestamps,
                            CheckUniqueness, CheckSoftDeletes}) {
    const auto before = out.FindingCount();
    category(s, out);
    if (out.FindingCount() == before) out.Pass();
  }
  return out.Build();
}

} // namespace flowcheck::checks
