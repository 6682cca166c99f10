#include "state_transition_check.hpp"

#include <map>

#include "check_support.hpp"

namespace flowcheck::checks {

using flow::Severity;

namespace {

struct Transition {
  std::string from;
  std::string to;
};

// Updates that bring a freshly created task into each state.
const std::map<std::string, std::vector<std::string>>& PathTo() {
  static const std::map<std::string, std::vector<std::string>> paths = {
      {"new", {}},
      {"in_progress", {"in_progress"}},
      {"blocked", {"in_progress", "blocked"}},
      {"review", {"in_progress", "review"}},
      {"done", {"in_progress", "review", "done"}},
      {"dropped", {"dropped"}},
  };
  return paths;
}

probe::ApiResponse MoveTo(probe::TaskApi& api, const std::string& id, const std::string& status) {
  probe::TaskPatch patch;
  patch.status = status;
  return api.Update(id, patch);
}

} // namespace

std::optional<std::string> StateTransitionCheck::Reach(probe::TaskApi& api, const std::vector<std::string>& path, std::string* error) {
  auto created = api.Create(ProbeDraft("state probe"));
  if (created.status_code != probe::kCreated || !created.task) {
    *error = "create: " + Describe(created);
    return std::nullopt;
  }

  const std::string id = created.task->id;
  for (const auto& step : path) {
    auto moved = MoveTo(api, id, step);
    if (moved.status_code != probe::kOk) {
      *error = "move to " + step + ": " + Describe(moved);
      return std::nullopt;
    }
  }
  return id;
}

flow::CheckOutcome StateTransitionCheck::Validate(const flow::CheckContext& ctx) {
  auto&                api = RequireTaskApi(ctx, Name());
  flow::OutcomeBuilder out{std::string(Name())};

  const std::vector<Transition> valid = {
      {"new", "in_progress"},  {"in_progress", "blocked"}, {"blocked", "in_progress"}, {"in_progress", "review"},
      {"review", "done"},      {"new", "dropped"},         {"in_progress", "dropped"},
  };

  const std::vector<Transition> invalid = {
      {"new", "review"}, {"new", "done"}, {"done", "in_progress"}, {"dropped", "in_progress"}, {"new", "blocked"},
  };

  for (const auto& t : valid) {
    const std::string label = t.from + " -> " + t.to;
    std::string       error;
    auto              id = Reach(api, PathTo().at(t.from), &error);
    if (!id) {
      out.Critical("setup_failed", "tasks", "status", "", "reach " + t.from + " for " + label + ": " + error);
      continue;
    }

    auto moved = MoveTo(api, *id, t.to);
    out.Expect(moved.status_code == probe::kOk, Severity::kCritical, "valid_transition_rejected", "tasks", "status", *id,
               "transition " + label + " should be accepted, got " + Describe(moved));

    if (t.to == "done" && moved.task) {
      out.Expect(!moved.task->completed_at.empty(), Severity::kWarning, "completion_not_stamped", "tasks", "completed_at", *id,
                 "moving to done should set completed_at");
    }
  }

  for (const auto& t : invalid) {
    const std::string label = t.from + " -> " + t.to;
    std::string       error;
    auto              id = Reach(api, PathTo().at(t.from), &error);
    if (!id) {
      out.Critical("setup_failed", "tasks", "status", "", "reach " + t.from + " for " + label + ": " + error);
      continue;
    }

    auto moved = MoveTo(api, *id, t.to);
    out.Expect(!moved.Ok(), Severity::kCritical, "invalid_transition_accepted", "tasks", "status", *id,
               "transition " + label + " should be rejected, got " + Describe(moved));
  }

  // terminal states keep their status
  for (const std::string terminal : {"done", "dropped"}) {
    std::string error;
    auto        id = Reach(api, PathTo().at(terminal), &error);
    if (!id) {
      out.Critical("setup_failed", "tasks", "status", "", "reach " + terminal + ": " + error);
      continue;
    }

    auto reopened  = MoveTo(api, *id, "ready");
    auto after     = api.Get(*id);
    bool unchanged = !reopened.Ok() && after.task && after.task->status == terminal;
    out.Expect(unchanged, Severity::kCritical, "terminal_state_mutated", "tasks", "status", *id,
               terminal + " task should be immutable, reopen got " + Describe(reopened));
  }

  return out.Build();
}

} // namespace flowcheck::checks
