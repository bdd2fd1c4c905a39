#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace {

using auditgate::util::FormatIso8601;
using auditgate::util::FromUnixMillis;
using auditgate::util::ParseIso8601;
using auditgate::util::ToUnixMillis;

std::optional<int64_t> ParseMs(const std::string& text) {
  auto parsed = ParseIso8601(text);
  if (!parsed) return std::nullopt;
  return ToUnixMillis(*parsed);
}

void TestFormatsUtcWithMilliseconds() {
  assert(FormatIso8601(FromUnixMillis(0)) == "1970-01-01T00:00:00.000Z");
  assert(FormatIso8601(FromUnixMillis(1'709'287'200'123)) == "2024-03-01T10:00:00.123Z");
}

void TestAcceptedForms() {
  const int64_t midnight = 1'709'251'200'000; // 2024-03-01T00:00:00Z
  const int64_t ten_am   = midnight + 10LL * 3600 * 1000;

  assert(ParseMs("2024-03-01") == midnight);
  assert(ParseMs("2024-03-01T10:00") == ten_am);
  assert(ParseMs("2024-03-01T10:00:00") == ten_am);
  assert(ParseMs("2024-03-01 10:00:00") == ten_am);
  assert(ParseMs("2024-03-01t10:00:00z") == ten_am);
  assert(ParseMs("2024-03-01T10:00:00Z") == ten_am);
  assert(ParseMs("2024-03-01T10:00:00.5Z") == ten_am + 500);
  assert(ParseMs("2024-03-01T10:00:00.123456789") == ten_am + 123);
  assert(ParseMs("2024-03-01T12:30:00+02:30") == ten_am);
  assert(ParseMs("2024-03-01T05:00:00-05:00") == ten_am);
  assert(ParseMs("2024-02-29") == midnight - 24LL * 3600 * 1000);
}

void TestRejectedForms() {
  for (const char* bad : {"", "2024", "2024-3-1", "2024-03-01T", "2024-03-01T10", "2024-03-01T1000", "2024-03-01T10:00:00.",
                          "2024-03-01T10:00:00+0200", "2024-03-01T10:00:00Zjunk", "2024-02-30", "2023-02-29", "2024-03-01T24:00",
                          "2024-03-01T10:60", "01/03/2024", "yesterday"}) {
    assert(!ParseIso8601(bad).has_value());
  }
}

void TestRoundTripOfFormattedValue() {
  const auto now  = FromUnixMillis(ToUnixMillis(auditgate::util::Now()));
  const auto text = FormatIso8601(now);
  assert(ParseIso8601(text) == std::optional(now));
}

} // namespace

int main() {
  TestFormatsUtcWithMilliseconds();
  TestAcceptedForms();
  TestRejectedForms();
  TestRoundTripOfFormattedValue();

  std::cout << "auditgate_unit_time: pass\n";
  return 0;
}
