#include "trellis/negotiation.hpp"

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <string_view>

namespace trellis {

TEST(ParseQualityList, WeightsAndParameters) {
  const auto entries = ParseQualityList("text/html;level=1, application/json ; q=0.5,, */*;q=0.1");
  ASSERT_EQ(entries.size(), 3U);
  EXPECT_EQ(entries[0].value, "text/html");
  EXPECT_DOUBLE_EQ(entries[0].quality, 1.0);
  EXPECT_EQ(entries[1].value, "application/json");
  EXPECT_DOUBLE_EQ(entries[1].quality, 0.5);
  EXPECT_EQ(entries[2].value, "*/*");
  EXPECT_DOUBLE_EQ(entries[2].quality, 0.1);
}

TEST(ParseQualityList, InvalidAndOutOfRangeQ) {
  const auto entries = ParseQualityList("gzip;q=abc, br;q=2, zstd;q=-1, deflate;q=");
  ASSERT_EQ(entries.size(), 4U);
  EXPECT_DOUBLE_EQ(entries[0].quality, 0.0);
  EXPECT_DOUBLE_EQ(entries[1].quality, 1.0);
  EXPECT_DOUBLE_EQ(entries[2].quality, 0.0);
  EXPECT_DOUBLE_EQ(entries[3].quality, 0.0);
}

TEST(BestMatch, MediaTypes) {
  static constexpr std::array<std::string_view, 3> kTypes{"text/plain", "text/html", "application/json"};
  EXPECT_EQ(BestMatch(kTypes, "text/html", NegotiationKind::MediaType), 1U);
  EXPECT_EQ(BestMatch(kTypes, "application/*;q=0.9, text/plain;q=0.5", NegotiationKind::MediaType), 2U);
  EXPECT_EQ(BestMatch(kTypes, "image/png", NegotiationKind::MediaType), std::nullopt);
  EXPECT_EQ(BestMatch(kTypes, "*/*", NegotiationKind::MediaType), 0U);
  EXPECT_EQ(BestMatch(kTypes, "", NegotiationKind::MediaType), 0U);
  EXPECT_EQ(BestMatch(kTypes, "*", NegotiationKind::MediaType), 0U);
}

TEST(BestMatch, MostSpecificRangeGivesQuality) {
  static constexpr std::array<std::string_view, 2> kTypes{"text/html", "text/plain"};
  EXPECT_EQ(BestMatch(kTypes, "text/*;q=0.9, text/html;q=0.2", NegotiationKind::MediaType), 1U);
  EXPECT_EQ(BestMatch(kTypes, "text/html;q=0, */*", NegotiationKind::MediaType), 1U);
}

TEST(BestMatch, TiesGoToFirstCandidate) {
  static constexpr std::array<std::string_view, 2> kTypes{"application/json", "text/html"};
  EXPECT_EQ(BestMatch(kTypes, "text/html, application/json", NegotiationKind::MediaType), 0U);
}

TEST(BestMatch, Languages) {
  static constexpr std::array<std::string_view, 3> kLanguages{"fr", "en-US", "de"};
  EXPECT_EQ(BestMatch(kLanguages, "en", NegotiationKind::Language), 1U);
  EXPECT_EQ(BestMatch(kLanguages, "EN-us", NegotiationKind::Language), 1U);
  EXPECT_EQ(BestMatch(kLanguages, "de;q=0.3, fr;q=0.7", NegotiationKind::Language), 0U);
  EXPECT_EQ(BestMatch(kLanguages, "es", NegotiationKind::Language), std::nullopt);
  EXPECT_EQ(BestMatch(kLanguages, "e", NegotiationKind::Language), std::nullopt);
}

TEST(BestMatch, CharsetsAndEncodings) {
  static constexpr std::array<std::string_view, 2> kCharsets{"utf-8", "iso-8859-1"};
  EXPECT_EQ(BestMatch(kCharsets, "ISO-8859-1", NegotiationKind::Charset), 1U);
  EXPECT_EQ(BestMatch(kCharsets, "*;q=0.1, utf-8;q=0", NegotiationKind::Charset), 1U);

  static constexpr std::array<std::string_view, 2> kEncodings{"gzip", "identity"};
  EXPECT_EQ(BestMatch(kEncodings, "br, identity;q=0.5", NegotiationKind::Encoding), 1U);
  EXPECT_EQ(BestMatch(kEncodings, "gzip;q=0, identity;q=0", NegotiationKind::Encoding), std::nullopt);
}

TEST(BestMatch, Hosts) {
  static constexpr std::array<std::string_view, 3> kHosts{"api.example.com:8443", "www.example.com", "*"};
  EXPECT_EQ(BestMatch(kHosts, "api.example.com:8443", NegotiationKind::Host), 0U);
  EXPECT_EQ(BestMatch(kHosts, "www.example.com:80", NegotiationKind::Host), 1U);
  EXPECT_EQ(BestMatch(kHosts, "api.example.com:80", NegotiationKind::Host), 2U);

  static constexpr std::array<std::string_view, 1> kStrict{"www.example.com"};
  EXPECT_EQ(BestMatch(kStrict, "other.example.com:80", NegotiationKind::Host), std::nullopt);
}

}  // namespace trellis
