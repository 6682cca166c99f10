#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "check.hpp"
#include "internal/util/time.hpp"

namespace flowcheck::flow {

enum class NodeStatus {
  kPending,
  kRunning,
  kCompleted,
  kFailed,
  kBlocked,
  kSkipped,
};

constexpr std::string_view ToString(NodeStatus status) {
  switch (status) {
    case NodeStatus::kPending: return "PENDING";
    case NodeStatus::kRunning: return "RUNNING";
    case NodeStatus::kCompleted: return "COMPLETED";
    case NodeStatus::kFailed: return "FAILED";
    case NodeStatus::kBlocked: return "BLOCKED";
    case NodeStatus::kSkipped: return "SKIPPED";
  }
  return "PENDING";
}

constexpr bool IsTerminal(NodeStatus status) {
  return status != NodeStatus::kPending && status != NodeStatus::kRunning;
}

// Declarative input to FlowGraph.
struct NodeSpec {
  std::string              id;
  std::string              name;
  std::shared_ptr<Check>   check;
  std::vector<std::string> dependencies;

  // Scope or configuration excludes the node; it ends SKIPPED.
  bool        skip = false;
  std::string skip_reason;
};

/*
  One scheduled unit.

  Created PENDING by FlowGraph and moved to exactly one terminal state by
  the ExecutionEngine. `outcome` is set iff the node ended COMPLETED or
  FAILED; a faulted node carries a synthesized outcome with one critical
  failed check.
*/
struct Node {
  std::string              id;
  std::string              name;
  std::shared_ptr<Check>   check;
  std::vector<std::string> dependencies;
  bool                     skip = false;
  std::string              skip_reason;

  NodeStatus                  status = NodeStatus::kPending;
  std::optional<CheckOutcome> outcome;
  std::string                 error;
  std::size_t                 layer = 0;

  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> finished_at;

  std::optional<double> DurationSeconds() const {
    if (!started_at || !finished_at) return std::nullopt;
    return util::SecondsBetween(*started_at, *finished_at);
  }
};

} // namespace flowcheck::flow
