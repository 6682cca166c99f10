#include "check_outcome.hpp"

#include <algorithm>

namespace flowcheck::flow {

std::string_view ToString(Severity severity) {
  return severity == Severity::kCritical ? "critical" : "warning";
}

std::string_view ToString(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::kPassed:
      return "PASSED";
    case OutcomeStatus::kPassedWithWarnings:
      return "PASSED_WITH_WARNINGS";
    case OutcomeStatus::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

OutcomeStatus DeriveStatus(const std::vector<Finding>& findings) {
  if (findings.empty()) return OutcomeStatus::kPassed;

  const bool any_critical =
      std::any_of(findings.begin(), findings.end(), [](const Finding& f) { return f.severity == Severity::kCritical; });
  return any_critical ? OutcomeStatus::kFailed : OutcomeStatus::kPassedWithWarnings;
}

OutcomeBuilder::OutcomeBuilder(std::string check_name) : check_name_(std::move(check_name)) {
}

void OutcomeBuilder::Pass(std::uint32_t count) {
  passed_ += count;
}

void OutcomeBuilder::Warn(std::string category, std::string table, std::string field, std::string record_id, std::string description) {
  Add(Finding{check_name_, std::move(category), Severity::kWarning, std::move(table), std::move(field), std::move(record_id),
              std::move(description)});
}

void OutcomeBuilder::Critical(std::string category, std::string table, std::string field, std::string record_id,
                              std::string description) {
  Add(Finding{check_name_, std::move(category), Severity::kCritical, std::move(table), std::move(field), std::move(record_id),
              std::move(description)});
}

void OutcomeBuilder::Add(Finding finding) {
  if (finding.check_name.empty()) finding.check_name = check_name_;
  findings_.push_back(std::move(finding));
}

void OutcomeBuilder::Expect(bool ok, Severity severity, std::string category, std::string table, std::string field,
                            std::string record_id, std::string description) {
  if (ok) {
    Pass();
    return;
  }
  Add(Finding{check_name_, std::move(category), severity, std::move(table), std::move(field), std::move(record_id),
              std::move(description)});
}

CheckOutcome OutcomeBuilder::Build() const {
  CheckOutcome out;
  out.findings = findings_;
  out.passed   = passed_;
  out.failed   = static_cast<std::uint32_t>(findings_.size());
  for (const auto& f : findings_) {
    if (f.severity == Severity::kCritical) {
      ++out.critical_count;
    } else {
      ++out.warnings;
    }
  }
  out.total_checks = out.passed + out.failed;
  out.status       = DeriveStatus(findings_);

  switch (out.status) {
    case OutcomeStatus::kPassed:
      out.message = "all " + std::to_string(out.total_checks) + " checks passed";
      break;
    case OutcomeStatus::kPassedWithWarnings:
      out.message = std::to_string(out.warnings) + " warning(s)";
      break;
    case OutcomeStatus::kFailed:
      out.message = std::to_string(out.critical_count) + " critical finding(s), " + std::to_string(out.warnings) + " warning(s)";
      break;
  }
  return out;
}

} // namespace flowcheck::flow
