#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace wayfarer {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

inline constexpr SysTimePoint kInvalidTimePoint = SysTimePoint::max();

inline constexpr std::size_t kRFC7231DateStrLen = 29;

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Sub-second precision is truncated.
[[nodiscard]] std::string TimeToStringRFC7231(SysTimePoint tp);

// Parse a string representation of a given time point in RFC7231 IMF-fixdate format.
// Surrounding whitespace is ignored. If parsing fails, returns kInvalidTimePoint.
[[nodiscard]] SysTimePoint TryParseTimeRFC7231(std::string_view value);

/// Format a time point as used by the NCSA Common Log Format, in UTC: "10/Oct/2000:13:55:36 +0000".
[[nodiscard]] std::string TimeToStringCommonLog(SysTimePoint tp);

}  // namespace wayfarer
