#include "flow_orchestrator.hpp"

#include <set>
#include <string>

#include "internal/evidence/evidence_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace flowcheck::runtime {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

struct FlowEntry {
  const char*              id;
  const char*              name;
  std::vector<std::string> dependencies;
};

const std::vector<FlowEntry>& DefaultEntries() {
  static const std::vector<FlowEntry> entries = {
      {"integrity", "Data Integrity Validator", {}},
      {"crud", "CRUD Validator", {"integrity"}},
      {"state", "State Transition Validator", {"integrity"}},
      {"relationship", "Relationship Validator", {"integrity"}},
      {"audit", "Audit Trail Validator", {"integrity"}},
      {"performance", "Performance Validator", {"crud", "state", "relationship", "audit"}},
  };
  return entries;
}

// Nodes that drive the task service; quick scope leaves them out.
const std::set<std::string>& ProbeNodes() {
  static const std::set<std::string> ids = {"crud", "state", "audit", "performance"};
  return ids;
}

} // namespace

FlowOrchestrator::FlowOrchestrator(flowcheck::config::FlowConfig config, flow::CheckRegistry registry)
    : config_(std::make_shared<const flowcheck::config::FlowConfig>(std::move(config))), registry_(std::move(registry)) {
}

std::vector<flow::NodeSpec> FlowOrchestrator::DefaultFlow() const {
  const auto& validation = config_->validation();
  const bool  quick      = validation.scope() == "quick";

  std::vector<flow::NodeSpec> specs;
  specs.reserve(DefaultEntries().size());
  for (const auto& entry : DefaultEntries()) {
    flow::NodeSpec spec;
    spec.id           = entry.id;
    spec.name         = entry.name;
    spec.check        = registry_.Create(entry.id);
    spec.dependencies = entry.dependencies;

    if (quick && ProbeNodes().count(spec.id)) {
      spec.skip        = true;
      spec.skip_reason = "excluded by quick scope";
    } else if (spec.id == "performance" && !validation.include_performance()) {
      spec.skip        = true;
      spec.skip_reason = "performance checks disabled";
    }
    specs.push_back(std::move(spec));
  }
  return specs;
}

flow::FlowGraph FlowOrchestrator::BuildGraph() const {
  return flow::FlowGraph(DefaultFlow());
}

FlowRun FlowOrchestrator::Run(const factory::RunDependencies& deps) const {
  return Run(BuildGraph(), deps);
}

FlowRun FlowOrchestrator::Run(flow::FlowGraph graph, const factory::RunDependencies& deps) const {
  const auto& validation = config_->validation();
  const auto  flow_id    = util::GenerateFlowId();

  observability::SpanScope span("flowcheck.flow");
  span.SetAttribute("flow.id", flow_id);
  span.SetAttribute("flow.scope", validation.scope());

  FLOWCHECK_LOG_INFO("flow start", {StringField("flow_id", flow_id), StringField("scope", validation.scope()),
                                    BoolField("parallel", validation.parallel()),
                                    IntField("nodes", static_cast<std::int64_t>(graph.Size()))});

  flow::CheckContext ctx;
  ctx.store             = deps.store;
  ctx.task_api          = deps.task_api;
  ctx.config            = config_;
  ctx.filter.sprint_id  = validation.filters().sprint_id();
  ctx.filter.project_id = validation.filters().project_id();

  auto options = EngineOptionsFor();
  if (config_->report().emit_evidence()) {
    auto writer          = std::make_shared<evidence::EvidenceWriter>(config_->report().evidence_dir());
    options.on_completed = [writer](const flow::Node& node) {
      try {
        auto path = writer->Write(node.id, *node.outcome);
        FLOWCHECK_LOG_DEBUG("evidence written", {StringField("node", node.id), StringField("path", path.string())});
      } catch (const std::exception& e) {
        FLOWCHECK_LOG_WARN("evidence write failed", {StringField("node", node.id), StringField("error", e.what())});
      }
    };
  }

  flow::ReportBuilder   builder(validation.max_recommendations());
  flow::ExecutionEngine engine(std::move(options));

  FlowRun run;
  run.engine = engine.Run(graph, ctx, builder);

  flow::RunInfo info;
  info.flow_id       = flow_id;
  info.started_at    = run.engine.started_at;
  info.completed_at  = run.engine.finished_at;
  info.configuration = RunConfiguration();
  run.report         = builder.Build(info);

  observability::Metrics::Instance().RecordFlow(run.report.overall_status());
  span.SetAttribute("flow.overall_status", run.report.overall_status());

  FLOWCHECK_LOG_INFO("flow completed", {StringField("flow_id", flow_id), StringField("overall_status", run.report.overall_status()),
                                        DoubleField("success_rate", run.report.validation_summary().success_rate()),
                                        DoubleField("seconds", run.report.duration_seconds()),
                                        BoolField("aborted", run.engine.aborted)});
  return run;
}

flow::EngineOptions FlowOrchestrator::EngineOptionsFor() const {
  const auto& validation = config_->validation();

  flow::EngineOptions options;
  options.parallel         = validation.parallel();
  options.max_workers      = validation.max_workers();
  options.check_timeout    = std::chrono::milliseconds(validation.check_timeout_ms());
  options.flow_timeout     = std::chrono::milliseconds(validation.flow_timeout_ms());
  options.abort_on_failure = validation.abort_on_failure();
  return options;
}

v1::RunConfiguration FlowOrchestrator::RunConfiguration() const {
  const auto& validation = config_->validation();

  v1::RunConfiguration out;
  out.set_scope(validation.scope());
  out.set_include_performance(validation.include_performance());
  out.set_parallel(validation.parallel());
  out.set_max_workers(validation.max_workers());
  out.set_sprint_id(validation.filters().sprint_id());
  out.set_project_id(validation.filters().project_id());
  return out;
}

} // namespace flowcheck::runtime
