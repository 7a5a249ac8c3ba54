#include "wayfarer/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/ascii.hpp"

namespace wayfarer {

namespace {

constexpr std::string_view kWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::string_view kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

void Append2(std::string &out, std::integral auto value) {
  out.push_back(static_cast<char>('0' + (value / 10)));
  out.push_back(static_cast<char>('0' + (value % 10)));
}

void Append4(std::string &out, std::integral auto value) {
  out.push_back(static_cast<char>('0' + (value / 1000)));
  out.push_back(static_cast<char>('0' + ((value / 100) % 10)));
  out.push_back(static_cast<char>('0' + ((value / 10) % 10)));
  out.push_back(static_cast<char>('0' + (value % 10)));
}

constexpr int Read2(const char *ptr) { return ((ptr[0] - '0') * 10) + (ptr[1] - '0'); }

constexpr int Read4(const char *ptr) {
  return ((ptr[0] - '0') * 1000) + ((ptr[1] - '0') * 100) + ((ptr[2] - '0') * 10) + (ptr[3] - '0');
}

struct BrokenDownTime {
  std::chrono::year_month_day ymd;
  std::chrono::weekday wd;
  std::chrono::hh_mm_ss<std::chrono::seconds> hms;
};

BrokenDownTime BreakDown(SysTimePoint tp) {
  using namespace std::chrono;
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  return {year_month_day{dayPoint}, weekday{dayPoint}, hh_mm_ss<seconds>{secTp - dayPoint}};
}

void AppendHms(std::string &out, const BrokenDownTime &bdt) {
  Append2(out, bdt.hms.hours().count());
  out.push_back(':');
  Append2(out, bdt.hms.minutes().count());
  out.push_back(':');
  Append2(out, bdt.hms.seconds().count());
}

}  // namespace

std::string TimeToStringRFC7231(SysTimePoint tp) {
  const BrokenDownTime bdt = BreakDown(tp);

  std::string ret;
  ret.reserve(kRFC7231DateStrLen);
  ret.append(kWeekdays[bdt.wd.c_encoding()]);
  ret.append(", ");
  Append2(ret, static_cast<unsigned>(bdt.ymd.day()));
  ret.push_back(' ');
  ret.append(kMonths[static_cast<unsigned>(bdt.ymd.month()) - 1U]);
  ret.push_back(' ');
  Append4(ret, static_cast<int>(bdt.ymd.year()));
  ret.push_back(' ');
  AppendHms(ret, bdt);
  ret.append(" GMT");
  return ret;
}

std::string TimeToStringCommonLog(SysTimePoint tp) {
  const BrokenDownTime bdt = BreakDown(tp);

  std::string ret;
  ret.reserve(26);
  Append2(ret, static_cast<unsigned>(bdt.ymd.day()));
  ret.push_back('/');
  ret.append(kMonths[static_cast<unsigned>(bdt.ymd.month()) - 1U]);
  ret.push_back('/');
  Append4(ret, static_cast<int>(bdt.ymd.year()));
  ret.push_back(':');
  AppendHms(ret, bdt);
  ret.append(" +0000");
  return ret;
}

SysTimePoint TryParseTimeRFC7231(std::string_view value) {
  while (!value.empty() && isspace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && isspace(value.back())) {
    value.remove_suffix(1);
  }
  if (value.size() != kRFC7231DateStrLen) {
    return kInvalidTimePoint;
  }

  const char *ptr = value.data();
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[19] != ':' ||
      ptr[22] != ':' || ptr[25] != ' ') {
    return kInvalidTimePoint;
  }
  for (int digitPos : {5, 6, 12, 13, 14, 15, 17, 18, 20, 21, 23, 24}) {
    if (!isdigit(ptr[digitPos])) {
      return kInvalidTimePoint;
    }
  }
  if (value.substr(26) != "GMT") {
    return kInvalidTimePoint;
  }

  const auto monthIt = std::ranges::find(kMonths, value.substr(8, 3));
  const auto weekdayIt = std::ranges::find(kWeekdays, value.substr(0, 3));
  if (monthIt == std::end(kMonths) || weekdayIt == std::end(kWeekdays)) {
    return kInvalidTimePoint;
  }

  const int dayValue = Read2(ptr + 5);
  const int hourValue = Read2(ptr + 17);
  const int minuteValue = Read2(ptr + 20);
  const int secondValue = Read2(ptr + 23);
  if (dayValue == 0 || hourValue > 23 || minuteValue > 59 || secondValue > 60) {
    return kInvalidTimePoint;
  }

  // std::chrono::month is 1-based
  const std::chrono::year_month_day ymd{std::chrono::year{Read4(ptr + 12)},
                                        std::chrono::month{static_cast<unsigned>(monthIt - std::begin(kMonths)) + 1U},
                                        std::chrono::day{static_cast<unsigned>(dayValue)}};
  if (!ymd.ok()) {
    return kInvalidTimePoint;
  }

  const std::chrono::sys_days dayPoint{ymd};
  if (std::cmp_not_equal(weekdayIt - std::begin(kWeekdays), std::chrono::weekday{dayPoint}.c_encoding())) {
    return kInvalidTimePoint;
  }

  return dayPoint + std::chrono::hours{hourValue} + std::chrono::minutes{minuteValue} +
         std::chrono::seconds{secondValue};
}

}  // namespace wayfarer
