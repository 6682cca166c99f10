#pragma once

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

/*
  Task dependency graph checks over live tasks:

    - cycles in depends_on                      critical, one per cycle
    - depends_on without the reciprocal blocks  warning
    - done task depending on an unfinished one  warning
    - dependency on a deleted or missing task   warning

  A run without findings records a single passed check.
*/
class RelationshipCheck final : public flow::Check {
 public:
  std::string_view Name() const override {
    return "relationship";
  }

  flow::CheckOutcome Validate(const flow::CheckContext& ctx) override;
};

} // namespace flowcheck::checks
