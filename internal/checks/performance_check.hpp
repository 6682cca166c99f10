#pragma once

#include <chrono>

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

/*
  Times the task service against fixed budgets. A miss is a warning;
  a failed request during a timed step is a warning as well.
*/
class PerformanceCheck final : public flow::Check {
 public:
  struct Budgets {
    std::chrono::milliseconds bulk_create{5000};
    std::chrono::milliseconds list{1000};
    std::chrono::milliseconds single_update{100};
    std::chrono::milliseconds filtered_query{500};
    std::chrono::milliseconds concurrent_create{10000};
  };

  static constexpr std::size_t kBulkCreates       = 100;
  static constexpr std::size_t kListLimit         = 1000;
  static constexpr std::size_t kConcurrentCreates = 10;

  PerformanceCheck() = default;
  explicit PerformanceCheck(Budgets budgets) : budgets_(budgets) {}

  std::string_view Name() const override {
    return "performance";
  }

  flow::CheckOutcome Validate(const flow::CheckContext& ctx) override;

 private:
  Budgets budgets_;
};

} // namespace flowcheck::checks
