#include "trellis/headers-map.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "trellis/http-constants.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis {

TEST(HeadersMap, CaseInsensitiveLookupLowerCaseStorage) {
  HeadersMap headers;
  headers.set("Content-Type", "text/plain");
  EXPECT_EQ(headers.get("content-type"), "text/plain");
  EXPECT_EQ(headers.get("CONTENT-TYPE"), "text/plain");
  EXPECT_EQ(headers.begin()->first, "content-type");
}

TEST(HeadersMap, SetReplacesInPlace) {
  HeadersMap headers{{"a", "1"}, {"b", "2"}};
  headers.set("A", "3");
  ASSERT_EQ(headers.size(), 2U);
  EXPECT_EQ(headers.begin()->first, "a");
  EXPECT_EQ(headers.begin()->second, "3");
}

TEST(HeadersMap, SetIfAbsentKeepsExisting) {
  HeadersMap headers{{"etag", "x"}};
  EXPECT_FALSE(headers.setIfAbsent("ETag", "y"));
  EXPECT_TRUE(headers.setIfAbsent("date", "now"));
  EXPECT_EQ(headers.getOrEmpty("etag"), "x");
  EXPECT_EQ(headers.getOrEmpty("date"), "now");
}

TEST(HeadersMap, Erase) {
  HeadersMap headers{{"a", "1"}, {"b", "2"}, {"c", "3"}};
  EXPECT_TRUE(headers.erase("B"));
  EXPECT_FALSE(headers.erase("b"));
  EXPECT_FALSE(headers.contains("b"));
  EXPECT_EQ(headers.size(), 2U);
  EXPECT_EQ(headers.getOrEmpty("missing"), "");
}

TEST(HttpConstants, ReasonPhrases) {
  EXPECT_EQ(http::ReasonPhraseFor(http::StatusCodeOK), "OK");
  EXPECT_EQ(http::ReasonPhraseFor(http::StatusCodeRangeNotSatisfiable), "Range Not Satisfiable");
  EXPECT_EQ(http::ReasonPhraseFor(http::StatusCodeTemporaryRedirect), "Temporary Redirect");
  EXPECT_TRUE(http::ReasonPhraseFor(299).empty());
}

TEST(HttpConstants, BodilessStatuses) {
  EXPECT_TRUE(http::IsBodilessStatus(100));
  EXPECT_TRUE(http::IsBodilessStatus(http::StatusCodeNoContent));
  EXPECT_TRUE(http::IsBodilessStatus(http::StatusCodeNotModified));
  EXPECT_FALSE(http::IsBodilessStatus(http::StatusCodeOK));
  EXPECT_FALSE(http::IsBodilessStatus(http::StatusCodeNotFound));
}

}  // namespace trellis
