#include "trellis/cookie.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "trellis/timedef.hpp"

namespace trellis {

TEST(CookieJar, ParseSimple) {
  const auto jar = CookieJar::Parse("session.id=abc; theme=dark");
  EXPECT_EQ(jar.size(), 2U);
  EXPECT_EQ(jar.first("session.id"), "abc");
  EXPECT_EQ(jar.first("theme"), "dark");
  EXPECT_FALSE(jar.first("missing").has_value());
  EXPECT_FALSE(jar.contains("missing"));
}

TEST(CookieJar, ParseCommaSeparatorsAndDuplicates) {
  const auto jar = CookieJar::Parse("a=1, b=2; a=3");
  ASSERT_EQ(jar.all("a").size(), 2U);
  EXPECT_EQ(jar.all("a")[0], "1");
  EXPECT_EQ(jar.all("a")[1], "3");
  EXPECT_EQ(jar.first("b"), "2");
}

TEST(CookieJar, ParseDecodesAndTrims) {
  const auto jar = CookieJar::Parse(" na%20me = hello+world%21 ;flag; ;");
  EXPECT_EQ(jar.first("na me"), "hello world!");
  EXPECT_EQ(jar.first("flag"), "");
  EXPECT_EQ(jar.size(), 2U);
}

TEST(CookieJar, ParseEmpty) {
  EXPECT_EQ(CookieJar::Parse("").size(), 0U);
  EXPECT_TRUE(CookieJar::Parse("").all("x").empty());
}

TEST(FormatCookie, NameAndValueOnly) { EXPECT_EQ(FormatCookie("session.id", "1234"), "session.id=1234"); }

TEST(FormatCookie, EncodesNameAndValue) { EXPECT_EQ(FormatCookie("a b", "x;y"), "a%20b=x%3By"); }

TEST(FormatCookie, AllAttributes) {
  using namespace std::chrono;
  CookieOptions options;
  options.domain = "example.com";
  options.path = "/app/";
  options.expires = SysTimePoint(sys_days{year{1994} / November / 6} + hours{8} + minutes{49} + seconds{37});
  options.secure = true;
  options.httpOnly = true;
  EXPECT_EQ(FormatCookie("k", "v", options),
            "k=v; domain=example.com; path=/app/; expires=Sun, 06 Nov 1994 08:49:37 GMT; secure; HttpOnly");
}

}  // namespace trellis
