#include "report_builder.hpp"

#include <stdexcept>

namespace flowcheck::flow {

std::string_view ToString(OverallStatus status) {
  switch (status) {
    case OverallStatus::kPassed:
      return "PASSED";
    case OverallStatus::kPassedWithWarnings:
      return "PASSED_WITH_WARNINGS";
    case OverallStatus::kDegraded:
      return "DEGRADED";
    case OverallStatus::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

bool IsSuccess(std::string_view overall_status) {
  return overall_status == ToString(OverallStatus::kPassed) || overall_status == ToString(OverallStatus::kPassedWithWarnings);
}

double SuccessRate(std::uint32_t passed, std::uint32_t total) {
  if (total == 0) return 0.0;
  return static_cast<double>(passed) / static_cast<double>(total) * 100.0;
}

OverallStatus DeriveOverallStatus(std::uint32_t critical_failures, std::uint32_t failed, double success_rate) {
  if (critical_failures > 0) return OverallStatus::kFailed;
  if (failed == 0) return OverallStatus::kPassed;
  if (success_rate >= 90.0) return OverallStatus::kPassedWithWarnings;
  if (success_rate >= 70.0) return OverallStatus::kDegraded;
  return OverallStatus::kFailed;
}

void ToProto(const CheckOutcome& outcome, v1::CheckOutcome* out) {
  out->set_total_checks(outcome.total_checks);
  out->set_passed(outcome.passed);
  out->set_failed(outcome.failed);
  out->set_warnings(outcome.warnings);
  out->set_critical_count(outcome.critical_count);
  out->set_status(std::string(ToString(outcome.status)));
  out->set_message(outcome.message);
  for (const auto& f : outcome.findings) {
    auto* pf = out->add_findings();
    pf->set_check_name(f.check_name);
    pf->set_category(f.category);
    pf->set_severity(std::string(ToString(f.severity)));
    pf->set_table(f.table);
    pf->set_field(f.field);
    pf->set_record_id(f.record_id);
    pf->set_description(f.description);
  }
}

ReportBuilder::ReportBuilder(std::size_t max_recommendations) : max_recommendations_(max_recommendations) {
}

void ReportBuilder::RecordNode(const Node& node) {
  if (!IsTerminal(node.status)) {
    throw std::invalid_argument("node " + node.id + " recorded in state " + std::string(ToString(node.status)));
  }

  v1::NodeSummary s;
  s.set_id(node.id);
  s.set_name(node.name);
  for (const auto& dep : node.dependencies) s.add_dependencies(dep);
  s.set_status(std::string(ToString(node.status)));
  s.set_error(node.error);
  s.set_layer(static_cast<std::uint32_t>(node.layer));
  if (node.started_at) *s.mutable_started_at() = util::ToProto(*node.started_at);
  if (node.finished_at) *s.mutable_finished_at() = util::ToProto(*node.finished_at);
  if (auto d = node.DurationSeconds()) s.set_duration_seconds(*d);
  if (node.outcome) ToProto(*node.outcome, s.mutable_outcome());
  nodes_.push_back(std::move(s));

  flow_summary_.set_total_nodes(flow_summary_.total_nodes() + 1);
  switch (node.status) {
    case NodeStatus::kCompleted:
      flow_summary_.set_completed(flow_summary_.completed() + 1);
      break;
    case NodeStatus::kFailed:
      flow_summary_.set_failed(flow_summary_.failed() + 1);
      faulted_.push_back("[CRITICAL] " + node.name + " failed: " + node.error);
      break;
    case NodeStatus::kBlocked:
      flow_summary_.set_blocked(flow_summary_.blocked() + 1);
      blocked_.push_back("[BLOCKED] " + node.name + " was blocked due to dependency failures");
      break;
    case NodeStatus::kSkipped:
      flow_summary_.set_skipped(flow_summary_.skipped() + 1);
      break;
    default:
      break;
  }

  if (!node.outcome) return;

  const auto& o = *node.outcome;
  summary_.set_total_checks(summary_.total_checks() + o.total_checks);
  summary_.set_passed(summary_.passed() + o.passed);
  summary_.set_failed(summary_.failed() + o.failed);
  summary_.set_warnings(summary_.warnings() + o.warnings);
  summary_.set_critical_failures(summary_.critical_failures() + o.critical_count);
  summary_.set_success_rate(SuccessRate(summary_.passed(), summary_.total_checks()));

  if (node.status == NodeStatus::kCompleted && o.critical_count > 0) {
    critical_.push_back("Address critical issues in " + node.name);
  }
}

void ReportBuilder::SetSchedule(const std::vector<std::string>& order, std::size_t layer_count) {
  order_ = order;
  flow_summary_.set_layers(static_cast<std::uint32_t>(layer_count));
}

void ReportBuilder::MarkAborted() {
  flow_summary_.set_aborted(true);
}

v1::FlowReport ReportBuilder::Build(const RunInfo& info) const {
  v1::FlowReport report;
  report.set_flow_id(info.flow_id);
  report.set_flow_type("validation_swarm");
  *report.mutable_started_at()   = util::ToProto(info.started_at);
  *report.mutable_completed_at() = util::ToProto(info.completed_at);
  report.set_duration_seconds(util::SecondsBetween(info.started_at, info.completed_at));
  *report.mutable_configuration() = info.configuration;
  *report.mutable_flow_summary()  = flow_summary_;
  for (const auto& id : order_) report.add_execution_order(id);
  for (const auto& n : nodes_) *report.add_nodes() = n;
  *report.mutable_validation_summary() = summary_;

  const auto status =
      DeriveOverallStatus(summary_.critical_failures(), summary_.failed(), summary_.success_rate());
  report.set_overall_status(std::string(ToString(status)));

  for (const auto* group : {&faulted_, &blocked_, &critical_}) {
    for (const auto& r : *group) {
      if (static_cast<std::size_t>(report.recommendations_size()) >= max_recommendations_) return report;
      report.add_recommendations(r);
    }
  }
  return report;
}

} // namespace flowcheck::flow
