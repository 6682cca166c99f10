#pragma once

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

/*
  Drives create/read/update/delete through the task service sandbox and
  compares status codes with what the service contract promises.

  Rejections the service must make (invalid status, missing title,
  invalid status update) are critical when they do not happen, as are
  failures of operations that must succeed. Misreported not-found cases
  are warnings.
*/
class CrudCheck final : public flow::Check {
 public:
  std::string_view Name() const override {
    return "crud";
  }

  flow::CheckOutcome Validate(const flow::CheckContext& ctx) override;
};

} // namespace flowcheck::checks
