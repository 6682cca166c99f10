#include "audit_trail_check.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <vector>

#include "check_support.hpp"
#include "internal/observability/logging.hpp"
#include "json_text.hpp"

namespace flowcheck::checks {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRequiredKeys[] = {"agent", "timestamp", "action", "payload"};

double Percent(std::size_t part, std::size_t whole) {
  return whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

std::string FormatPercent(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", value);
  return buf;
}

} // namespace

flow::CheckOutcome AuditTrailCheck::Validate(const flow::CheckContext& ctx) {
  flow::OutcomeBuilder out{std::string(Name())};

  fs::path dir;
  if (ctx.config) dir = ctx.config->report().evidence_dir();
  CheckEvidence(dir, out);
  CheckTaskMetadata(ctx, out);

  return out.Build();
}

void AuditTrailCheck::CheckEvidence(const fs::path& dir, flow::OutcomeBuilder& out) const {
  std::error_code ec;
  if (dir.empty() || !fs::is_directory(dir, ec)) {
    out.Warn("missing_evidence_dir", "evidence", "", dir.string(), "evidence directory " + dir.string() + " does not exist");
    return;
  }
  out.Pass();

  std::vector<fs::path> files;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == ".json") files.push_back(it->path());
  }
  if (ec) {
    out.Warn("unreadable_evidence", "evidence", "", dir.string(), "listing " + dir.string() + ": " + ec.message());
    return;
  }
  if (files.empty()) {
    out.Warn("missing_evidence", "evidence", "", dir.string(), "no evidence files in " + dir.string());
    return;
  }
  out.Pass();

  std::sort(files.begin(), files.end());
  if (files.size() > kEvidenceSample) files.resize(kEvidenceSample);

  for (const auto& file : files) {
    const std::string name = file.filename().string();

    std::ifstream in(file, std::ios::binary);
    if (!in) {
      out.Warn("unreadable_evidence", "evidence", "", name, "cannot open " + file.string());
      continue;
    }
    std::ostringstream text;
    text << in.rdbuf();

    std::string error;
    auto        doc = ParseJson(text.str(), &error);
    if (!doc || !doc->has_struct_value()) {
      out.Warn("invalid_evidence", "evidence", "", name, "evidence file " + name + " is not a JSON object: " + error);
      continue;
    }

    const auto& fields = doc->struct_value().fields();
    std::string missing;
    for (const char* key : kRequiredKeys) {
      if (!fields.count(key)) missing += missing.empty() ? key : std::string(", ") + key;
    }
    out.Expect(missing.empty(), flow::Severity::kWarning, "incomplete_evidence", "evidence", missing, name,
               "evidence file " + name + " lacks " + missing);
  }
}

void AuditTrailCheck::CheckTaskMetadata(const flow::CheckContext& ctx, flow::OutcomeBuilder& out) const {
  std::size_t live = 0, tagged = 0, hinted = 0;
  for (const auto& t : RequireStore(ctx, Name()).ListTasks(ctx.filter)) {
    if (t.IsDeleted()) continue;
    ++live;
    if (!t.audit_tag.empty()) ++tagged;
    if (!t.correlation_hint.empty()) ++hinted;
  }

  const double tag_coverage = Percent(tagged, live);
  out.Expect(tag_coverage >= kMinAuditTagCoverage, flow::Severity::kWarning, "low_audit_coverage", "tasks", "audit_tag", "",
             "audit_tag set on " + FormatPercent(tag_coverage) + " of " + std::to_string(live) + " live tasks");

  // informational only
  FLOWCHECK_LOG_INFO("correlation hint coverage", {observability::DoubleField("percent", Percent(hinted, live)),
                                                   observability::IntField("live_tasks", static_cast<std::int64_t>(live))});
  out.Pass();
}

} // namespace flowcheck::checks
