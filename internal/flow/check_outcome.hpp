#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flowcheck::flow {

enum class Severity {
  kWarning,
  kCritical,
};

enum class OutcomeStatus {
  kPassed,
  kPassedWithWarnings,
  kFailed,
};

std::string_view ToString(Severity severity);
std::string_view ToString(OutcomeStatus status);

/*
  One observation made by a check. Findings describe the store; producing
  one never changes it.
*/
struct Finding {
  std::string check_name;
  std::string category;
  Severity    severity = Severity::kWarning;
  std::string table;
  std::string field;
  std::string record_id;
  std::string description;
};

struct CheckOutcome {
  std::uint32_t total_checks   = 0;
  std::uint32_t passed         = 0;
  std::uint32_t failed         = 0;
  std::uint32_t warnings       = 0;
  std::uint32_t critical_count = 0;

  OutcomeStatus        status = OutcomeStatus::kPassed;
  std::string          message;
  std::vector<Finding> findings;
};

// FAILED on any critical finding, PASSED with no findings, otherwise
// PASSED_WITH_WARNINGS.
OutcomeStatus DeriveStatus(const std::vector<Finding>& findings);

/*
  Accumulates the results of a check run.

  Every passing sub-check counts one passed check, every finding one
  failed check. Build() derives the counts and the status from that.
*/
class OutcomeBuilder {
 public:
  explicit OutcomeBuilder(std::string check_name);

  void Pass(std::uint32_t count = 1);

  void Warn(std::string category, std::string table, std::string field, std::string record_id, std::string description);
  void Critical(std::string category, std::string table, std::string field, std::string record_id, std::string description);

  void Add(Finding finding);

  // Pass() when ok, otherwise a finding of the given severity.
  void Expect(bool ok, Severity severity, std::string category, std::string table, std::string field, std::string record_id,
              std::string description);

  std::size_t FindingCount() const {
    return findings_.size();
  }

  CheckOutcome Build() const;

 private:
  std::string          check_name_;
  std::uint32_t        passed_ = 0;
  std::vector<Finding> findings_;
};

} // namespace flowcheck::flow
