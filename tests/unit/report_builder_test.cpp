#include "internal/flow/report_builder.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/flow/flow_graph.hpp"
#include "internal/flow/report_writer.hpp"

namespace {

using flowcheck::flow::DeriveOverallStatus;
using flowcheck::flow::Node;
using flowcheck::flow::NodeSpec;
using flowcheck::flow::NodeStatus;
using flowcheck::flow::OutcomeBuilder;
using flowcheck::flow::OverallStatus;
using flowcheck::flow::ReportBuilder;
using flowcheck::flow::ReportWriter;
using flowcheck::flow::RunInfo;

Node MakeNode(const std::string& id, NodeStatus status) {
  Node node;
  node.id     = id;
  node.name   = id + " validator";
  node.status = status;
  return node;
}

Node Completed(const std::string& id, std::uint32_t passed, int warnings, int critical) {
  OutcomeBuilder out(id);
  out.Pass(passed);
  for (int i = 0; i < warnings; ++i) out.Warn("w", "tasks", "", "", "warning");
  for (int i = 0; i < critical; ++i) out.Critical("c", "tasks", "", "", "critical");

  auto node    = MakeNode(id, NodeStatus::kCompleted);
  node.outcome = out.Build();
  return node;
}

RunInfo Info() {
  RunInfo info;
  info.flow_id      = "FLOW-20250131-120000-0a1b2c3d";
  info.started_at   = flowcheck::util::Now();
  info.completed_at = info.started_at + std::chrono::milliseconds(1500);
  info.configuration.set_scope("full");
  return info;
}

void TestOverallStatusOrdering() {
  assert(DeriveOverallStatus(1, 0, 100.0) == OverallStatus::kFailed);
  assert(DeriveOverallStatus(0, 0, 0.0) == OverallStatus::kPassed);
  assert(DeriveOverallStatus(0, 1, 95.0) == OverallStatus::kPassedWithWarnings);
  assert(DeriveOverallStatus(0, 1, 90.0) == OverallStatus::kPassedWithWarnings);
  assert(DeriveOverallStatus(0, 5, 89.9) == OverallStatus::kDegraded);
  assert(DeriveOverallStatus(0, 5, 70.0) == OverallStatus::kDegraded);
  assert(DeriveOverallStatus(0, 9, 69.9) == OverallStatus::kFailed);

  assert(flowcheck::flow::IsSuccess("PASSED"));
  assert(flowcheck::flow::IsSuccess("PASSED_WITH_WARNINGS"));
  assert(!flowcheck::flow::IsSuccess("DEGRADED"));
  assert(!flowcheck::flow::IsSuccess("FAILED"));
}

void TestSuccessRateBounds() {
  assert(flowcheck::flow::SuccessRate(0, 0) == 0.0);
  assert(flowcheck::flow::SuccessRate(5, 5) == 100.0);
  assert(flowcheck::flow::SuccessRate(1, 4) == 25.0);
}

void TestAggregatesCompletedAndFaultedNodes() {
  ReportBuilder builder;
  builder.SetSchedule({"integrity", "crud", "state", "performance"}, 2);

  builder.RecordNode(Completed("integrity", 6, 0, 0));
  builder.RecordNode(Completed("crud", 10, 2, 0));

  auto faulted    = MakeNode("state", NodeStatus::kFailed);
  faulted.error   = "check state timed out after 10ms";
  OutcomeBuilder synthesized("state");
  synthesized.Critical("fault", "", "", "", faulted.error);
  faulted.outcome = synthesized.Build();
  builder.RecordNode(faulted);

  auto skipped        = MakeNode("performance", NodeStatus::kSkipped);
  skipped.skip_reason = "performance checks disabled";
  builder.RecordNode(skipped);

  auto report = builder.Build(Info());

  const auto& v = report.validation_summary();
  assert(v.total_checks() == 19);
  assert(v.passed() == 16);
  assert(v.failed() == 3);
  assert(v.warnings() == 2);
  assert(v.critical_failures() == 1);
  assert(v.success_rate() > 84.0 && v.success_rate() < 84.3);
  assert(report.overall_status() == "FAILED");

  const auto& f = report.flow_summary();
  assert(f.total_nodes() == 4);
  assert(f.completed() == 2);
  assert(f.failed() == 1);
  assert(f.skipped() == 1);
  assert(f.layers() == 2);

  assert(report.flow_type() == "validation_swarm");
  assert(report.duration_seconds() > 1.49 && report.duration_seconds() < 1.51);
  assert(report.execution_order_size() == 4);
  assert(report.recommendations_size() == 1);
  assert(report.recommendations(0) == "[CRITICAL] state validator failed: check state timed out after 10ms");
}

void TestRecommendationsAreRankedAndBounded() {
  ReportBuilder builder(3);
  builder.RecordNode(Completed("a", 1, 0, 2));
  builder.RecordNode(Completed("b", 1, 0, 1));
  auto blocked  = MakeNode("c", NodeStatus::kBlocked);
  blocked.error = "Dependencies failed - execution blocked: a reported 2 critical finding(s)";
  builder.RecordNode(blocked);
  auto faulted  = MakeNode("d", NodeStatus::kFailed);
  faulted.error = "boom";
  builder.RecordNode(faulted);

  auto report = builder.Build(Info());
  assert(report.recommendations_size() == 3);
  assert(report.recommendations(0) == "[CRITICAL] d validator failed: boom");
  assert(report.recommendations(1) == "[BLOCKED] c validator was blocked due to dependency failures");
  assert(report.recommendations(2) == "Address critical issues in a validator");
}

void TestNonTerminalNodeIsRejected() {
  ReportBuilder builder;
  bool          threw = false;
  try {
    builder.RecordNode(MakeNode("pending", NodeStatus::kPending));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestJsonPersistenceAndSummary() {
  ReportBuilder builder;
  builder.SetSchedule({"integrity"}, 1);
  builder.RecordNode(Completed("integrity", 4, 0, 0));
  auto report = builder.Build(Info());

  const auto json = ReportWriter::ToJson(report);
  assert(json.find("\"flow_type\": \"validation_swarm\"") != std::string::npos);
  assert(json.find("\"overall_status\": \"PASSED\"") != std::string::npos);
  // defaults are printed
  assert(json.find("\"critical_failures\": 0") != std::string::npos);

  const auto dir  = std::filesystem::temp_directory_path() / "flowcheck_report_builder_tests";
  std::filesystem::remove_all(dir);
  const auto path = ReportWriter::Persist(report, dir);
  assert(path.filename() == "flow_FLOW-20250131-120000-0a1b2c3d.json");

  std::ifstream      in(path);
  std::ostringstream text;
  text << in.rdbuf();
  assert(text.str() == json);

  const auto summary = ReportWriter::RenderSummary(report);
  assert(summary.find("Overall Status: PASSED") != std::string::npos);
  assert(summary.find("Nodes: 1/1 completed") != std::string::npos);
  assert(summary.find("Checks: 4/4 passed") != std::string::npos);
  assert(summary.find("Success Rate: 100.00%") != std::string::npos);
  assert(summary.find("Recommendations") == std::string::npos);
}

void TestGraphRendering() {
  NodeSpec root;
  root.id   = "integrity";
  root.name = "Data Integrity Validator";
  NodeSpec leaf;
  leaf.id           = "performance";
  leaf.name         = "Performance Validator";
  leaf.dependencies = {"integrity"};
  leaf.skip         = true;

  flowcheck::flow::FlowGraph graph({root, leaf});
  const auto                 text = ReportWriter::RenderGraph(graph);
  assert(text.find("Layer 0") != std::string::npos);
  assert(text.find("[integrity] Data Integrity Validator") != std::string::npos);
  assert(text.find("[performance] Performance Validator  <- integrity  (skipped)") != std::string::npos);
}

} // namespace

int main() {
  TestOverallStatusOrdering();
  TestSuccessRateBounds();
  TestAggregatesCompletedAndFaultedNodes();
  TestRecommendationsAreRankedAndBounded();
  TestNonTerminalNodeIsRejected();
  TestJsonPersistenceAndSummary();
  TestGraphRendering();

  std::cout << "flowcheck_unit_report_builder: pass\n";
  return 0;
}
