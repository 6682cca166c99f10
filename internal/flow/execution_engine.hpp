#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "flow_graph.hpp"
#include "report_builder.hpp"

namespace flowcheck::flow {

struct EngineOptions {
  bool        parallel    = true;
  std::size_t max_workers = 4;

  // 0 disables the limit.
  std::chrono::milliseconds check_timeout{30000};
  std::chrono::milliseconds flow_timeout{0};

  // Block everything not yet run once a node faults or reports a
  // critical finding.
  bool abort_on_failure = false;

  // Called on the coordinating thread for each node that ended COMPLETED.
  std::function<void(const Node&)> on_completed;
};

struct EngineResult {
  bool            aborted = false;
  std::string     abort_reason;
  util::TimePoint started_at;
  util::TimePoint finished_at;
};

/*
  ExecutionEngine

  Walks the graph layer by layer. Per layer the coordinating thread:

    1. resolves every node: SKIPPED if excluded, BLOCKED if a dependency
       did not complete or completed with a FAILED outcome, otherwise
       RUNNING
    2. hands the running nodes to the worker pool and waits for all of
       them (the layer barrier)
    3. records the layer in the ReportBuilder

  A check that throws or overruns its timeout leaves its node FAILED;
  nothing it throws escapes Run(). A timed-out check is abandoned on its
  own thread so the worker can move on; AbandonedChecks() counts those
  still running.

  With a flow timeout, the deadline is tested before and after every
  layer. Passing it aborts the run and blocks every node not yet started.

  Node state is written by one worker per node during a layer and by the
  coordinator between layers, never concurrently.
*/
class ExecutionEngine {
 public:
  explicit ExecutionEngine(EngineOptions options);

  EngineResult Run(FlowGraph& graph, const CheckContext& ctx, ReportBuilder& report);

  // Checks that overran their timeout and have not returned yet, across
  // all engines in the process.
  static std::size_t AbandonedChecks();

 private:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  void         Execute(Node& node, const CheckContext& ctx, Deadline deadline) const;
  CheckOutcome Invoke(const Node& node, const CheckContext& ctx, std::chrono::milliseconds timeout) const;

  EngineOptions options_;
};

} // namespace flowcheck::flow
