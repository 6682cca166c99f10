#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using flowcheck::model::CanTransition;
using flowcheck::model::ParseTaskPriority;
using flowcheck::model::ParseTaskStatus;
using flowcheck::model::TaskPriority;
using flowcheck::model::TaskStatus;

static_assert(CanTransition(TaskStatus::kNew, TaskStatus::kInProgress));
static_assert(!CanTransition(TaskStatus::kDone, TaskStatus::kInProgress));

void TestWorkflowEdges() {
  assert(CanTransition(TaskStatus::kNew, TaskStatus::kReady));
  assert(CanTransition(TaskStatus::kReady, TaskStatus::kInProgress));
  assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kBlocked));
  assert(CanTransition(TaskStatus::kBlocked, TaskStatus::kInProgress));
  assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kReview));
  assert(CanTransition(TaskStatus::kReview, TaskStatus::kDone));
  assert(CanTransition(TaskStatus::kReview, TaskStatus::kInProgress));

  assert(!CanTransition(TaskStatus::kNew, TaskStatus::kReview));
  assert(!CanTransition(TaskStatus::kNew, TaskStatus::kDone));
  assert(!CanTransition(TaskStatus::kNew, TaskStatus::kBlocked));
  assert(!CanTransition(TaskStatus::kBlocked, TaskStatus::kDone));
}

void TestDroppedAndTerminalStates() {
  for (auto s : {TaskStatus::kNew, TaskStatus::kReady, TaskStatus::kInProgress, TaskStatus::kBlocked, TaskStatus::kReview}) {
    assert(CanTransition(s, TaskStatus::kDropped));
  }
  for (auto s : {TaskStatus::kNew, TaskStatus::kReady, TaskStatus::kInProgress}) {
    assert(!CanTransition(TaskStatus::kDone, s));
    assert(!CanTransition(TaskStatus::kDropped, s));
  }
  assert(!CanTransition(TaskStatus::kDone, TaskStatus::kDropped));
  assert(CanTransition(TaskStatus::kDone, TaskStatus::kDone));
}

void TestParsing() {
  assert(ParseTaskStatus("in_progress") == TaskStatus::kInProgress);
  assert(!ParseTaskStatus("In_Progress"));
  assert(!ParseTaskStatus(""));
  assert(ParseTaskPriority("critical") == TaskPriority::kCritical);
  assert(!ParseTaskPriority("urgent"));
  assert(ToString(TaskStatus::kDropped) == "dropped");
}

} // namespace

int main() {
  TestWorkflowEdges();
  TestDroppedAndTerminalStates();
  TestParsing();

  std::cout << "flowcheck_unit_state_machine: pass\n";
  return 0;
}
