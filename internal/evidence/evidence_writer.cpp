#include "evidence_writer.hpp"

#include <stdexcept>
#include <string>

#include "flowcheck/v1/report.pb.h"
#include "internal/flow/report_builder.hpp"
#include "internal/flow/report_writer.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowcheck::evidence {

EvidenceWriter::EvidenceWriter(std::filesystem::path dir) : dir_(std::move(dir)) {
}

std::filesystem::path EvidenceWriter::Write(std::string_view check, const flow::CheckOutcome& outcome) const {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw std::runtime_error("cannot create evidence dir " + dir_.string() + ": " + ec.message());
  }

  const auto now = util::Now();

  v1::EvidenceRecord record;
  record.set_agent(std::string(check) + "_validator");
  record.set_timestamp(util::ToIso8601(now));
  record.set_action("validation_executed");
  flow::ToProto(outcome, record.mutable_payload());

  const auto unix_seconds = util::ToUnixMillis(now) / 1000;
  auto       path = dir_ / ("validation_" + std::string(check) + "_" + std::to_string(unix_seconds) + "_" + util::ShortHex(6) + ".json");

  flow::ReportWriter::WriteFile(path, flow::ReportWriter::ToJson(record));
  return path;
}

} // namespace flowcheck::evidence
