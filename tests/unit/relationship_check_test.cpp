#include "internal/checks/relationship_check.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_store.hpp"

namespace {

using flowcheck::checks::RelationshipCheck;
using flowcheck::db::memory::MemoryStore;
using flowcheck::db::model::TaskRecord;
using flowcheck::flow::CheckContext;
using flowcheck::flow::CheckOutcome;
using flowcheck::flow::OutcomeStatus;

TaskRecord Task(const std::string& id, const std::string& depends_on, const std::string& blocks, const std::string& status = "in_progress") {
  TaskRecord t;
  t.id         = id;
  t.title      = "task " + id;
  t.status     = status;
  t.depends_on = depends_on;
  t.blocks     = blocks;
  return t;
}

CheckOutcome Run(const std::shared_ptr<MemoryStore>& store) {
  CheckContext ctx;
  ctx.store = store;
  return RelationshipCheck().Validate(ctx);
}

std::size_t Count(const CheckOutcome& o, const std::string& category) {
  std::size_t n = 0;
  for (const auto& f : o.findings) n += f.category == category;
  return n;
}

void TestConsistentGraphPasses() {
  auto store = std::make_shared<MemoryStore>();
  store->AddTask(Task("A", "[]", "[\"B\"]", "done"));
  store->AddTask(Task("B", "[\"A\"]", "[]"));

  auto o = Run(store);
  assert(o.status == OutcomeStatus::kPassed);
  assert(o.total_checks == 1 && o.passed == 1);
}

void TestCycleIsOneCriticalFinding() {
  auto store = std::make_shared<MemoryStore>();
  store->AddTask(Task("A", "[\"B\"]", "[\"B\"]"));
  store->AddTask(Task("B", "[\"A\"]", "[\"A\"]"));
  store->AddTask(Task("C", "[]", "[]"));

  auto o = Run(store);
  assert(Count(o, "cycle_detected") == 1);
  assert(o.critical_count == 1);
  assert(o.status == OutcomeStatus::kFailed);
  assert(o.findings.front().description == "Circular dependency detected: A -> B -> A");
}

void TestMissingReciprocalIsWarning() {
  auto store = std::make_shared<MemoryStore>();
  store->AddTask(Task("A", "[]", "[]"));
  store->AddTask(Task("B", "[\"A\"]", "[]"));

  auto o = Run(store);
  assert(Count(o, "missing_reciprocal") == 1);
  assert(o.status == OutcomeStatus::kPassedWithWarnings);
}

void TestDoneBeforeDependency() {
  auto store = std::make_shared<MemoryStore>();
  store->AddTask(Task("A", "[]", "[\"B\"]", "review"));
  store->AddTask(Task("B", "[\"A\"]", "[]", "done"));

  auto o = Run(store);
  assert(Count(o, "done_before_dependency") == 1);
  assert(o.findings.front().description.find("status: review") != std::string::npos);
}

void TestDeletedAndMissingDependencies() {
  auto store = std::make_shared<MemoryStore>();
  auto gone       = Task("A", "[]", "[\"B\"]");
  gone.deleted_at = "2025-01-12T00:00:00Z";
  store->AddTask(gone);
  store->AddTask(Task("B", "[\"A\", \"Z\"]", "[]"));

  auto o = Run(store);
  assert(Count(o, "orphaned_dependency") == 2);
  bool saw_deleted = false, saw_missing = false;
  for (const auto& f : o.findings) {
    saw_deleted = saw_deleted || f.description == "Task B depends on deleted task A";
    saw_missing = saw_missing || f.description == "Task B depends on missing task Z";
  }
  assert(saw_deleted && saw_missing);
}

void TestDeletedTasksDoNotFormCycles() {
  auto store = std::make_shared<MemoryStore>();
  auto a       = Task("A", "[\"B\"]", "[\"B\"]");
  a.deleted_at = "2025-01-12T00:00:00Z";
  store->AddTask(a);
  store->AddTask(Task("B", "[]", "[\"A\"]"));

  auto o = Run(store);
  assert(Count(o, "cycle_detected") == 0);
}

} // namespace

int main() {
  TestConsistentGraphPasses();
  TestCycleIsOneCriticalFinding();
  TestMissingReciprocalIsWarning();
  TestDoneBeforeDependency();
  TestDeletedAndMissingDependencies();
  TestDeletedTasksDoNotFormCycles();

  std::cout << "flowcheck_unit_relationship_check: pass\n";
  return 0;
}
