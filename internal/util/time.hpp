#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace flowcheck::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// UTC, microsecond precision: 2025-01-31T12:00:00.000000+00:00
std::string ToIso8601(TimePoint tp);

// Accepts the subset of ISO-8601 the tracker writes: a date, optionally
// followed by 'T' or ' ' and a time with optional fraction and zone
// (Z, +HH:MM, -HH:MM). Returns nullopt if the text does not parse.
std::optional<TimePoint> ParseIso8601(std::string_view text);

// Seconds between two points as a double.
double SecondsBetween(TimePoint start, TimePoint end);

} // namespace flowcheck::util
