#pragma once

#include <filesystem>
#include <string_view>

#include "internal/flow/check_outcome.hpp"

namespace flowcheck::evidence {

/*
  Writes one JSON evidence record per executed check:

    <dir>/validation_<check>_<unix-seconds>_<suffix>.json
    {agent, timestamp, action: "validation_executed", payload: <outcome>}
*/
class EvidenceWriter {
 public:
  explicit EvidenceWriter(std::filesystem::path dir);

  const std::filesystem::path& Dir() const {
    return dir_;
  }

  // Creates the directory on first use. Throws std::runtime_error.
  std::filesystem::path Write(std::string_view check, const flow::CheckOutcome& outcome) const;

 private:
  std::filesystem::path dir_;
};

} // namespace flowcheck::evidence
