#include "time.hpp"

#include <cstdio>

namespace auditgate::util {

namespace {

using namespace std::chrono;

bool ReadDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool Expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + duration_cast<Clock::duration>(milliseconds(ms));
}

std::string FormatIso8601(TimePoint tp) {
  const auto ms_total = floor<milliseconds>(tp);
  const auto day      = floor<days>(ms_total);
  const year_month_day ymd{day};
  const hh_mm_ss      hms{ms_total - day};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()),
                static_cast<int>(hms.subseconds().count()));
  return buf;
}

std::optional<TimePoint> ParseIso8601(std::string_view text) {
  std::size_t pos = 0;
  int         y = 0, mo = 0, d = 0;

  if (!ReadDigits(text, pos, 4, y) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, mo) || !Expect(text, pos, '-') ||
      !ReadDigits(text, pos, 2, d)) {
    return std::nullopt;
  }

  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;

  auto tp = time_point_cast<Clock::duration>(sys_days{ymd});
  if (pos == text.size()) return tp;

  if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') return std::nullopt;
  ++pos;

  int h = 0, mi = 0, s = 0;
  if (!ReadDigits(text, pos, 2, h) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, mi)) {
    return std::nullopt;
  }
  if (pos < text.size() && text[pos] == ':') {
    ++pos;
    if (!ReadDigits(text, pos, 2, s)) return std::nullopt;
  }
  if (h > 23 || mi > 59 || s > 59) return std::nullopt;

  // Fractional seconds: keep up to nanosecond precision, ignore the rest.
  nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const std::size_t start  = pos;
    int64_t           value  = 0;
    int               digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        value = value * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (pos == start) return std::nullopt;
    for (; digits < 9; ++digits) value *= 10;
    fraction = nanoseconds(value);
  }

  tp += duration_cast<Clock::duration>(hours(h) + minutes(mi) + seconds(s) + fraction);

  if (pos == text.size()) return tp;

  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    const int sign = text[pos] == '+' ? 1 : -1;
    ++pos;
    int oh = 0, om = 0;
    if (!ReadDigits(text, pos, 2, oh) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, om)) {
      return std::nullopt;
    }
    if (oh > 23 || om > 59) return std::nullopt;
    // local = utc + offset
    tp -= duration_cast<Clock::duration>(sign * (hours(oh) + minutes(om)));
  } else {
    return std::nullopt;
  }

  if (pos != text.size()) return std::nullopt;
  return tp;
}

} // namespace auditgate::util
