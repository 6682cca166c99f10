#pragma once

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

/*
  Root check of the default flow. Reads the store only.

  Categories (each clean one counts a passed check):
    foreign keys         task->project, task->sprint, sprint->project  critical
    embedded structures  depends_on / blocks critical, assignees warning
    orphaned references  depends_on entry missing or soft-deleted      warning
    timestamps           created_at > updated_at critical,
                         done without completed_at / bad format        warning
    uniqueness           duplicate task ids                            critical
    soft deletes         deleted task in an active sprint              warning

  Soft-deleted tasks are ignored except by the uniqueness and soft-delete
  categories. Parents are looked up without the run filter.
*/
class DataIntegrityCheck final : public flow::Check {
 public:
  std::string_view Name() const override {
    return "integrity";
  }

  flow::CheckOutcome Validate(const flow::CheckContext& ctx) override;
};

} // namespace flowcheck::checks
