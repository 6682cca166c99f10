#pragma once

#include <stdexcept>
#include <string>

#include "internal/flow/check.hpp"

namespace flowcheck::checks {

// Probe records are tagged so they are recognisable in a shared sandbox.
constexpr const char* kProbeAuditTag = "flowcheck-probe";

inline db::Store& RequireStore(const flow::CheckContext& ctx, std::string_view check) {
  if (!ctx.store) {
    throw std::invalid_argument(std::string(check) + " check needs a store");
  }
  return *ctx.store;
}

inline probe::TaskApi& RequireTaskApi(const flow::CheckContext& ctx, std::string_view check) {
  if (!ctx.task_api) {
    throw std::invalid_argument(std::string(check) + " check needs a task service sandbox");
  }
  return *ctx.task_api;
}

inline probe::TaskDraft ProbeDraft(std::string title, std::string status = "new") {
  probe::TaskDraft d;
  d.title     = std::move(title);
  d.status    = std::move(status);
  d.audit_tag = kProbeAuditTag;
  return d;
}

inline std::string Describe(const probe::ApiResponse& r) {
  std::string s = "HTTP " + std::to_string(r.status_code);
  if (!r.error.empty()) s += ": " + r.error;
  return s;
}

} // namespace flowcheck::checks
