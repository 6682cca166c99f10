#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

/*
  Walks probe tasks through the task lifecycle and checks that the service
  accepts exactly the legal moves.
*/
class StateTransitionCheck final : public flow::Check {
 public:
  std::string_view Name() const override {
    return "state";
  }

  flow::CheckOutcome Validate(const flow::CheckContext& ctx) override;

 private:
  // Creates a task and moves it along path; nullopt if any step is refused.
  static std::optional<std::string> Reach(probe::TaskApi& api, const std::vector<std::string>& path, std::string* error);
};

} // namespace flowcheck::checks
