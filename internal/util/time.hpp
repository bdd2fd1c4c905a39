#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace auditgate::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Renders UTC as YYYY-MM-DDTHH:MM:SS.mmmZ
std::string FormatIso8601(TimePoint tp);

/*
  Accepts:
    YYYY-MM-DD
    YYYY-MM-DD[T| ]HH:MM[:SS[.fraction]][Z|+HH:MM|-HH:MM]

  Returns nullopt for anything else, including out-of-range fields.
*/
std::optional<TimePoint> ParseIso8601(std::string_view text);

} // namespace auditgate::util
