#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <regex>

#include "internal/util/uuid.hpp"

namespace {

using flowcheck::util::ParseIso8601;

void TestParsesTrackerFormats() {
  auto a = ParseIso8601("2025-01-31T12:00:00Z");
  auto b = ParseIso8601("2025-01-31 12:00:00");
  auto c = ParseIso8601("2025-01-31T13:30:00+01:30");
  auto d = ParseIso8601("2025-01-31T12:00:00.250000+00:00");
  assert(a && b && c && d);
  assert(*a == *b);
  assert(*a == *c);
  assert(std::chrono::duration_cast<std::chrono::milliseconds>(*d - *a).count() == 250);

  auto date_only = ParseIso8601("2025-01-31");
  assert(date_only && *date_only < *a);
}

void TestRejectsGarbage() {
  assert(!ParseIso8601(""));
  assert(!ParseIso8601("yesterday"));
  assert(!ParseIso8601("2025-13-01T00:00:00Z"));
  assert(!ParseIso8601("2025-01-31T25:00:00Z"));
  assert(!ParseIso8601("2025-01-31T12:00:00 trailing"));
}

void TestIsoRoundTrip() {
  const auto now  = flowcheck::util::Now();
  const auto text = flowcheck::util::ToIso8601(now);
  auto       back = ParseIso8601(text);
  assert(back);
  assert(std::chrono::duration_cast<std::chrono::microseconds>(now - *back).count() == 0);
}

void TestFlowIdShape() {
  const auto id = flowcheck::util::GenerateFlowId();
  assert(std::regex_match(id, std::regex("FLOW-[0-9]{8}-[0-9]{6}-[0-9a-f]{8}")));
  assert(flowcheck::util::GenerateFlowId() != id);
  assert(flowcheck::util::ShortHex(6).size() == 6);
}

} // namespace

int main() {
  TestParsesTrackerFormats();
  TestRejectsGarbage();
  TestIsoRoundTrip();
  TestFlowIdShape();

  std::cout << "flowcheck_unit_time: pass\n";
  return 0;
}
