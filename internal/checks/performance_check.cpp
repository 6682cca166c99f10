#include "performance_check.hpp"

#include <future>
#include <vector>

#include "check_support.hpp"

namespace flowcheck::checks {

namespace {

using Clock = std::chrono::steady_clock;

std::int64_t ElapsedMs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

void ExpectWithin(flow::OutcomeBuilder& out, const std::string& step, std::int64_t elapsed_ms, std::chrono::milliseconds budget,
                  bool all_ok) {
  if (!all_ok) {
    out.Warn("request_failed", "tasks", "", "", step + ": at least one request failed");
    return;
  }
  out.Expect(elapsed_ms < budget.count(), flow::Severity::kWarning, "slow_operation", "tasks", "", "",
             step + " took " + std::to_string(elapsed_ms) + " ms, budget " + std::to_string(budget.count()) + " ms");
}

} // namespace

flow::CheckOutcome PerformanceCheck::Validate(const flow::CheckContext& ctx) {
  auto&                api = RequireTaskApi(ctx, Name());
  flow::OutcomeBuilder out{std::string(Name())};

  // bulk create
  std::string first_id;
  bool        all_ok = true;
  auto        start  = Clock::now();
  for (std::size_t i = 0; i < kBulkCreates; ++i) {
    auto r = api.Create(ProbeDraft("performance probe " + std::to_string(i)));
    all_ok = all_ok && r.status_code == probe::kCreated;
    if (first_id.empty() && r.task) first_id = r.task->id;
  }
  ExpectWithin(out, "create " + std::to_string(kBulkCreates) + " tasks", ElapsedMs(start), budgets_.bulk_create, all_ok);

  // list
  start       = Clock::now();
  auto listed = api.List(probe::TaskQuery{"", kListLimit});
  ExpectWithin(out, "list up to " + std::to_string(kListLimit) + " tasks", ElapsedMs(start), budgets_.list,
               listed.status_code == probe::kOk);

  // single update
  if (first_id.empty()) {
    out.Warn("request_failed", "tasks", "", "", "single update: no task to update");
  } else {
    probe::TaskPatch patch;
    patch.priority = "high";
    start          = Clock::now();
    auto updated   = api.Update(first_id, patch);
    ExpectWithin(out, "single update", ElapsedMs(start), budgets_.single_update, updated.status_code == probe::kOk);
  }

  // filtered query
  start         = Clock::now();
  auto filtered = api.List(probe::TaskQuery{"new", kListLimit});
  ExpectWithin(out, "filtered query", ElapsedMs(start), budgets_.filtered_query, filtered.status_code == probe::kOk);

  // concurrent creates
  start = Clock::now();
  std::vector<std::future<probe::ApiResponse>> pending;
  pending.reserve(kConcurrentCreates);
  for (std::size_t i = 0; i < kConcurrentCreates; ++i) {
    pending.push_back(std::async(std::launch::async, [&api, i] {
      return api.Create(ProbeDraft("concurrent probe " + std::to_string(i)));
    }));
  }
  all_ok = true;
  for (auto& f : pending) all_ok = f.get().status_code == probe::kCreated && all_ok;
  ExpectWithin(out, std::to_string(kConcurrentCreates) + " concurrent creates", ElapsedMs(start), budgets_.concurrent_create, all_ok);

  return out.Build();
}

} // namespace flowcheck::checks
