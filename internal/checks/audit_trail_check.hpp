#pragma once

#include <filesystem>

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

/*
  Looks for the trail the tracker and earlier checks leave behind: evidence
  files in the report evidence directory and audit metadata on live tasks.

  All findings are warnings. correlation_hint coverage is informational
  and always counts as passed.
*/
class AuditTrailCheck final : public flow::Check {
 public:
  static constexpr double      kMinAuditTagCoverage = 80.0;
  static constexpr std::size_t kEvidenceSample      = 10;

  std::string_view Name() const override {
    return "audit";
  }

  flow::CheckOutcome Validate(const flow::CheckContext& ctx) override;

 private:
  void CheckEvidence(const std::filesystem::path& dir, flow::OutcomeBuilder& out) const;
  void CheckTaskMetadata(const flow::CheckContext& ctx, flow::OutcomeBuilder& out) const;
};

} // namespace flowcheck::checks
