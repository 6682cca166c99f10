#include "internal/checks/performance_check.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/probe/sqlite_task_api.hpp"

namespace {

using namespace std::chrono_literals;

using flowcheck::checks::PerformanceCheck;
using flowcheck::flow::CheckContext;
using flowcheck::flow::CheckOutcome;
using flowcheck::flow::OutcomeStatus;
namespace probe = flowcheck::probe;

// Every request answers 503.
class UnavailableTaskApi final : public probe::TaskApi {
 public:
  probe::ApiResponse Create(const probe::TaskDraft&) override { return Down(); }
  probe::ApiResponse Get(const std::string&) override { return Down(); }
  probe::ApiResponse List(const probe::TaskQuery&) override { return Down(); }
  probe::ApiResponse Update(const std::string&, const probe::TaskPatch&) override { return Down(); }
  probe::ApiResponse Delete(const std::string&) override { return Down(); }

 private:
  static probe::ApiResponse Down() {
    return {503, std::nullopt, {}, "service unavailable"};
  }
};

CheckContext SqliteContext() {
  CheckContext ctx;
  ctx.task_api = std::make_shared<probe::SqliteTaskApi>(std::make_shared<flowcheck::db::sqlite::SqliteDB>(":memory:"));
  return ctx;
}

std::size_t Count(const CheckOutcome& o, const std::string& category) {
  std::size_t n = 0;
  for (const auto& f : o.findings) n += f.category == category;
  return n;
}

void TestWithinBudgetsPasses() {
  PerformanceCheck::Budgets generous{60s, 60s, 60s, 60s, 60s};

  auto o = PerformanceCheck(generous).Validate(SqliteContext());
  assert(o.status == OutcomeStatus::kPassed);
  assert(o.total_checks == 5 && o.passed == 5);
}

void TestBudgetMissesAreWarnings() {
  PerformanceCheck::Budgets none{0ms, 0ms, 0ms, 0ms, 0ms};

  auto o = PerformanceCheck(none).Validate(SqliteContext());
  assert(Count(o, "slow_operation") == 5);
  assert(o.critical_count == 0);
  assert(o.status == OutcomeStatus::kPassedWithWarnings);
}

void TestFailedRequestsAreWarnings() {
  CheckContext ctx;
  ctx.task_api = std::make_shared<UnavailableTaskApi>();

  auto o = PerformanceCheck().Validate(ctx);
  // bulk, list, update without a target, filtered, concurrent
  assert(Count(o, "request_failed") == 5);
  assert(o.critical_count == 0);
  assert(o.status == OutcomeStatus::kPassedWithWarnings);
}

} // namespace

int main() {
  TestWithinBudgetsPasses();
  TestBudgetMissesAreWarnings();
  TestFailedRequestsAreWarnings();

  std::cout << "flowcheck_unit_performance_check: pass\n";
  return 0;
}
