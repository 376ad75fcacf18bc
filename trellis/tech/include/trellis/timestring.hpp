#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "trellis/timedef.hpp"

namespace trellis {

inline constexpr std::size_t kISO8601WithMsStrLen = 24;
inline constexpr std::size_t kRFC7231DateStrLen = 29;

namespace detail {

// Writes the 'width' lowest decimal digits of 'value', zero padded.
constexpr char* PutDigits(char* out, long long value, int width) {
  for (int pos = width - 1; pos >= 0; --pos) {
    out[pos] = static_cast<char>('0' + (value % 10));
    value /= 10;
  }
  return out + width;
}

constexpr char* PutText(char* out, std::string_view text) {
  for (const char ch : text) {
    *out++ = ch;
  }
  return out;
}

}  // namespace detail

/// Writes 'YYYY-MM-DDTHH:MM:SS.sssZ' (UTC) for given time point and returns a pointer after the last char written.
/// 'out' should have room for kISO8601WithMsStrLen chars, no null terminator is added.
constexpr char* TimeToStringISO8601UTCWithMs(SysTimePoint timePoint, char* out) {
  using namespace std::chrono;
  const auto dayPoint = floor<days>(timePoint);
  const year_month_day date{dayPoint};
  const hh_mm_ss time{floor<milliseconds>(timePoint - dayPoint)};

  out = detail::PutDigits(out, static_cast<int>(date.year()), 4);
  *out++ = '-';
  out = detail::PutDigits(out, static_cast<unsigned>(date.month()), 2);
  *out++ = '-';
  out = detail::PutDigits(out, static_cast<unsigned>(date.day()), 2);
  *out++ = 'T';
  out = detail::PutDigits(out, time.hours().count(), 2);
  *out++ = ':';
  out = detail::PutDigits(out, time.minutes().count(), 2);
  *out++ = ':';
  out = detail::PutDigits(out, time.seconds().count(), 2);
  *out++ = '.';
  out = detail::PutDigits(out, time.subseconds().count(), 3);
  *out++ = 'Z';
  return out;
}

/// Writes an RFC 7231 IMF-fixdate ("Sun, 06 Nov 1994 08:49:37 GMT") and returns a pointer past the last char.
/// 'out' should have room for kRFC7231DateStrLen chars, no null terminator is added.
constexpr char* TimeToStringRFC7231(SysTimePoint timePoint, char* out) {
  using namespace std::chrono;
  constexpr std::string_view kDayNames = "SunMonTueWedThuFriSat";
  constexpr std::string_view kMonthNames = "JanFebMarAprMayJunJulAugSepOctNovDec";

  const auto dayPoint = floor<days>(timePoint);
  const year_month_day date{dayPoint};
  const hh_mm_ss time{floor<seconds>(timePoint - dayPoint)};

  out = detail::PutText(out, kDayNames.substr(3 * weekday{dayPoint}.c_encoding(), 3));
  out = detail::PutText(out, ", ");
  out = detail::PutDigits(out, static_cast<unsigned>(date.day()), 2);
  *out++ = ' ';
  out = detail::PutText(out, kMonthNames.substr(3 * (static_cast<unsigned>(date.month()) - 1), 3));
  *out++ = ' ';
  out = detail::PutDigits(out, static_cast<int>(date.year()), 4);
  *out++ = ' ';
  out = detail::PutDigits(out, time.hours().count(), 2);
  *out++ = ':';
  out = detail::PutDigits(out, time.minutes().count(), 2);
  *out++ = ':';
  out = detail::PutDigits(out, time.seconds().count(), 2);
  return detail::PutText(out, " GMT");
}

// Owning versions of the writers above.
std::string ISO8601String(SysTimePoint timePoint);

std::string RFC7231String(SysTimePoint timePoint);

}  // namespace trellis
