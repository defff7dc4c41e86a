#pragma once

#include <chrono>
#include <string>

namespace registry::util {

/*
  Time utilities. Every timestamp the process renders goes through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// "2026-10-19T08:15:02.337Z" (UTC, millisecond precision)
std::string FormatIso8601(TimePoint tp);

// Inverse of FormatIso8601. Throws std::invalid_argument on malformed input.
TimePoint ParseIso8601(const std::string& text);

} // namespace registry::util
