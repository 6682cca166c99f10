#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace flowcheck::model {

enum class TaskStatus : std::uint8_t {
  kNew = 0,
  kReady = 1,
  kInProgress = 2,
  kBlocked = 3,
  kReview = 4,
  kDone = 5,
  kDropped = 6,
};

enum class TaskPriority : std::uint8_t {
  kLow = 0,
  kMedium = 1,
  kHigh = 2,
  kCritical = 3,
};

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kNew: return "new";
    case TaskStatus::kReady: return "ready";
    case TaskStatus::kInProgress: return "in_progress";
    case TaskStatus::kBlocked: return "blocked";
    case TaskStatus::kReview: return "review";
    case TaskStatus::kDone: return "done";
    case TaskStatus::kDropped: return "dropped";
  }
  return "new";
}

constexpr std::string_view ToString(TaskPriority priority) {
  switch (priority) {
    case TaskPriority::kLow: return "low";
    case TaskPriority::kMedium: return "medium";
    case TaskPriority::kHigh: return "high";
    case TaskPriority::kCritical: return "critical";
  }
  return "medium";
}

constexpr std::optional<TaskStatus> ParseTaskStatus(std::string_view s) {
  for (auto v : {TaskStatus::kNew, TaskStatus::kReady, TaskStatus::kInProgress, TaskStatus::kBlocked,
                 TaskStatus::kReview, TaskStatus::kDone, TaskStatus::kDropped}) {
    if (ToString(v) == s) return v;
  }
  return std::nullopt;
}

constexpr std::optional<TaskPriority> ParseTaskPriority(std::string_view s) {
  for (auto v : {TaskPriority::kLow, TaskPriority::kMedium, TaskPriority::kHigh, TaskPriority::kCritical}) {
    if (ToString(v) == s) return v;
  }
  return std::nullopt;
}

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kDone || status == TaskStatus::kDropped;
}

/*
  Workflow edges:

    new         -> ready | in_progress | dropped
    ready       -> in_progress | dropped
    in_progress -> blocked | review | dropped
    blocked     -> in_progress | dropped
    review      -> in_progress | done | dropped

  done and dropped are terminal. Staying in the same state is allowed.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TaskStatus::kDropped) {
    return true;
  }

  switch (from) {
    case TaskStatus::kNew:
      return to == TaskStatus::kReady || to == TaskStatus::kInProgress;
    case TaskStatus::kReady:
      return to == TaskStatus::kInProgress;
    case TaskStatus::kInProgress:
      return to == TaskStatus::kBlocked || to == TaskStatus::kReview;
    case TaskStatus::kBlocked:
      return to == TaskStatus::kInProgress;
    case TaskStatus::kReview:
      return to == TaskStatus::kInProgress || to == TaskStatus::kDone;
    default:
      return false;
  }
}

}  // namespace flowcheck::model
