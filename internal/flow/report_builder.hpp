#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "flowcheck/v1/report.pb.h"
#include "node.hpp"

namespace flowcheck::flow {

enum class OverallStatus {
  kPassed,
  kPassedWithWarnings,
  kDegraded,
  kFailed,
};

std::string_view ToString(OverallStatus status);

// PASSED and PASSED_WITH_WARNINGS.
bool IsSuccess(std::string_view overall_status);

// passed / total * 100, or 0 when total is 0.
double SuccessRate(std::uint32_t passed, std::uint32_t total);

/*
  Evaluated in order:
    critical > 0  -> FAILED
    failed == 0   -> PASSED
    rate >= 90    -> PASSED_WITH_WARNINGS
    rate >= 70    -> DEGRADED
    otherwise     -> FAILED
*/
OverallStatus DeriveOverallStatus(std::uint32_t critical_failures, std::uint32_t failed, double success_rate);

void ToProto(const CheckOutcome& outcome, v1::CheckOutcome* out);

struct RunInfo {
  std::string          flow_id;
  util::TimePoint      started_at;
  util::TimePoint      completed_at;
  v1::RunConfiguration configuration;
};

/*
  ReportBuilder

  Collects terminal nodes as the engine finishes each layer and produces
  the FlowReport once at the end. Only the coordinating thread touches it.

  Recommendations are ranked: faulted nodes, then blocked nodes, then
  completed nodes whose outcome carries critical findings. The list is cut
  at max_recommendations.
*/
class ReportBuilder {
 public:
  explicit ReportBuilder(std::size_t max_recommendations = 10);

  // Throws std::invalid_argument for a node that is not terminal.
  void RecordNode(const Node& node);

  void SetSchedule(const std::vector<std::string>& order, std::size_t layer_count);
  void MarkAborted();

  const v1::ValidationSummary& Summary() const {
    return summary_;
  }

  v1::FlowReport Build(const RunInfo& info) const;

 private:
  std::size_t max_recommendations_;

  std::vector<v1::NodeSummary> nodes_;
  std::vector<std::string>     order_;
  v1::FlowSummary              flow_summary_;
  v1::ValidationSummary        summary_;

  std::vector<std::string> faulted_;
  std::vector<std::string> blocked_;
  std::vector<std::string> critical_;
};

} // namespace flowcheck::flow
