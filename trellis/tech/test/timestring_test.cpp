#include "trellis/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "trellis/timedef.hpp"

namespace trellis {

namespace {
SysTimePoint MakeTimePoint(int year, unsigned month, unsigned day, int hour, int minute, int second, int ms = 0) {
  using namespace std::chrono;
  return sys_days{year_month_day{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}}} +
         hours{hour} + minutes{minute} + seconds{second} + milliseconds{ms};
}
}  // namespace

TEST(TimeString, RFC7231) {
  EXPECT_EQ(RFC7231String(MakeTimePoint(1994, 11, 6, 8, 49, 37)), "Sun, 06 Nov 1994 08:49:37 GMT");
  EXPECT_EQ(RFC7231String(MakeTimePoint(2035, 1, 1, 0, 0, 0, 999)), "Mon, 01 Jan 2035 00:00:00 GMT");
}

TEST(TimeString, ISO8601WithMilliseconds) {
  EXPECT_EQ(ISO8601String(MakeTimePoint(2024, 2, 29, 23, 59, 58, 7)), "2024-02-29T23:59:58.007Z");
  EXPECT_EQ(ISO8601String(MakeTimePoint(1999, 12, 31, 1, 2, 3, 456)), "1999-12-31T01:02:03.456Z");
}

TEST(TimeString, BufferVersionsReturnEnd) {
  char buf[kRFC7231DateStrLen];
  EXPECT_EQ(TimeToStringRFC7231(MakeTimePoint(2001, 9, 9, 1, 46, 40), buf), buf + kRFC7231DateStrLen);
  char isoBuf[kISO8601WithMsStrLen];
  EXPECT_EQ(TimeToStringISO8601UTCWithMs(MakeTimePoint(2001, 9, 9, 1, 46, 40), isoBuf), isoBuf + kISO8601WithMsStrLen);
}

}  // namespace trellis
