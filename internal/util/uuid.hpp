#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "time.hpp"

namespace flowcheck::util {

/*
  UUID helpers

  Flow ids and probe record ids are derived from random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// First n hex digits of a fresh UUID (n <= 32).
std::string ShortHex(std::size_t n = 8);

// FLOW-YYYYMMDD-HHMMSS-xxxxxxxx
std::string GenerateFlowId(TimePoint at = Now());

} // namespace flowcheck::util
