#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "flowcheck/v1/report.pb.h"
#include "internal/factory.hpp"
#include "internal/flow/check_registry.hpp"
#include "internal/flow/execution_engine.hpp"
#include "internal/flow/flow_graph.hpp"

namespace flowcheck::runtime {

struct FlowRun {
  v1::FlowReport     report;
  flow::EngineResult engine;
};

/*
  FlowOrchestrator

  Turns a FlowConfig into a graph, runs it and returns the report.

  Default flow:

      integrity
         |
      crud  state  relationship  audit
         \    |        |         /
              performance

  scope=quick skips crud, state, audit and performance; a run without
  include_performance skips performance. Skipped nodes stay in the graph.

  Graph construction errors propagate out of BuildGraph() and Run();
  nothing a check does does.
*/
class FlowOrchestrator {
 public:
  FlowOrchestrator(flowcheck::config::FlowConfig config, flow::CheckRegistry registry);

  std::vector<flow::NodeSpec> DefaultFlow() const;

  flow::FlowGraph BuildGraph() const;

  FlowRun Run(const factory::RunDependencies& deps) const;
  FlowRun Run(flow::FlowGraph graph, const factory::RunDependencies& deps) const;

  const flowcheck::config::FlowConfig& Config() const {
    return *config_;
  }

 private:
  flow::EngineOptions  EngineOptionsFor() const;
  v1::RunConfiguration RunConfiguration() const;

  std::shared_ptr<const flowcheck::config::FlowConfig> config_;
  flow::CheckRegistry                                  registry_;
};

} // namespace flowcheck::runtime
