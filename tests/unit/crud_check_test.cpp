#include "internal/checks/crud_check.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/probe/sqlite_task_api.hpp"
#include "lenient_task_api.hpp"

namespace {

using flowcheck::checks::CrudCheck;
using flowcheck::flow::CheckContext;
using flowcheck::flow::CheckOutcome;
using flowcheck::flow::OutcomeStatus;
using flowcheck::flow::Severity;

std::size_t Count(const CheckOutcome& o, const std::string& category, Severity severity) {
  std::size_t n = 0;
  for (const auto& f : o.findings) n += f.category == category && f.severity == severity;
  return n;
}

void TestConformingServicePasses() {
  CheckContext ctx;
  ctx.task_api = std::make_shared<flowcheck::probe::SqliteTaskApi>(std::make_shared<flowcheck::db::sqlite::SqliteDB>(":memory:"));

  auto o = CrudCheck().Validate(ctx);
  assert(o.status == OutcomeStatus::kPassed);
  assert(o.findings.empty());
  assert(o.total_checks == o.passed);
  assert(o.total_checks >= 14);
}

void TestLenientServiceIsCritical() {
  CheckContext ctx;
  ctx.task_api = std::make_shared<flowcheck::testing::LenientTaskApi>();

  auto o = CrudCheck().Validate(ctx);
  assert(o.status == OutcomeStatus::kFailed);
  // invalid status and empty title on create, invalid status on update
  assert(Count(o, "validation_bypassed", Severity::kCritical) == 3);
  // hard delete loses the row
  assert(Count(o, "delete_failed", Severity::kCritical) == 1);
  // 200 instead of 404
  assert(Count(o, "wrong_status_code", Severity::kWarning) == 2);
  assert(o.critical_count == 4);
  assert(o.warnings == 2);
}

void TestMissingTaskApiThrows() {
  bool threw = false;
  try {
    (void)CrudCheck().Validate(CheckContext{});
  } catch (const std::invalid_argument& e) {
    threw = std::string(e.what()).find("crud") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestConformingServicePasses();
  TestLenientServiceIsCritical();
  TestMissingTaskApiThrows();

  std::cout << "flowcheck_unit_crud_check: pass\n";
  return 0;
}
