#include "relationship_check.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "check_support.hpp"
#include "json_text.hpp"

namespace flowcheck::checks {

using db::model::TaskRecord;

namespace {

using DependencyGraph = std::map<std::string, std::vector<std::string>>;

std::string JoinPath(const std::vector<std::string>& path) {
  std::string out;
  for (const auto& id : path) {
    if (!out.empty()) out += " -> ";
    out += id;
  }
  return out;
}

class CycleFinder {
 public:
  explicit CycleFinder(const DependencyGraph& graph) : graph_(graph) {
  }

  std::vector<std::vector<std::string>> Find() {
    for (const auto& [id, deps] : graph_) {
      if (!visited_.count(id)) Visit(id);
    }
    return cycles_;
  }

 private:
  void Visit(const std::string& id) {
    visited_.insert(id);
    on_path_.insert(id);
    path_.push_back(id);

    auto it = graph_.find(id);
    if (it != graph_.end()) {
      for (const auto& next : it->second) {
        if (!visited_.count(next)) {
          Visit(next);
        } else if (on_path_.count(next)) {
          auto start = std::find(path_.begin(), path_.end(), next);
          std::vector<std::string> cycle(start, path_.end());
          cycle.push_back(next);
          cycles_.push_back(std::move(cycle));
        }
      }
    }

    path_.pop_back();
    on_path_.erase(id);
  }

  const DependencyGraph&                graph_;
  std::set<std::string>                 visited_;
  std::set<std::string>                 on_path_;
  std::vector<std::string>              path_;
  std::vector<std::vector<std::string>> cycles_;
};

} // namespace

flow::CheckOutcome RelationshipCheck::Validate(const flow::CheckContext& ctx) {
  auto&      store    = RequireStore(ctx, Name());
  const auto all_rows = store.ListTasks(db::StoreFilter{});
  const auto rows     = ctx.filter.Empty() ? all_rows : store.ListTasks(ctx.filter);

  std::map<std::string, const TaskRecord*> live;
  std::set<std::string>                    known;
  for (const auto& t : all_rows) {
    known.insert(t.id);
    if (!t.IsDeleted()) live.emplace(t.id, &t);
  }

  DependencyGraph                              depends_on;
  std::map<std::string, std::set<std::string>> blocks;
  for (const auto& t : all_rows) {
    if (t.IsDeleted()) continue;
    // unparseable text is the integrity check's finding
    if (auto deps = ParseIdList(t.depends_on)) depends_on[t.id] = std::move(*deps);
    if (auto b = ParseIdList(t.blocks)) blocks[t.id] = {b->begin(), b->end()};
  }

  flow::OutcomeBuilder out{std::string(Name())};

  for (const auto& cycle : CycleFinder(depends_on).Find()) {
    out.Critical("cycle_detected", "tasks", "depends_on", cycle.front(), "Circular dependency detected: " + JoinPath(cycle));
  }

  for (const auto& t : rows) {
    if (t.IsDeleted()) continue;
    auto it = depends_on.find(t.id);
    if (it == depends_on.end()) continue;

    for (const auto& dep : it->second) {
      auto dep_it = live.find(dep);
      if (dep_it == live.end()) {
        out.Warn("orphaned_dependency", "tasks", "depends_on", t.id,
                 "Task " + t.id + " depends on " + (known.count(dep) ? "deleted" : "missing") + " task " + dep);
        continue;
      }

      if (!blocks[dep].count(t.id)) {
        out.Warn("missing_reciprocal", "tasks", "blocks", t.id,
                 "Task " + t.id + " depends on " + dep + ", but " + dep + " does not list " + t.id + " in blocks");
      }

      const auto& dep_status = dep_it->second->status;
      if (t.status == "done" && dep_status != "done") {
        out.Warn("done_before_dependency", "tasks", "status", t.id,
                 "Task " + t.id + " is done but depends on incomplete task " + dep + " (status: " + dep_status + ")");
      }
    }
  }

  if (out.FindingCount() == 0) out.Pass();
  return out.Build();
}

} // namespace flowcheck::checks
