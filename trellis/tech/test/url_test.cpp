#include <gtest/gtest.h>

#include <string>

#include "trellis/url-decode.hpp"
#include "trellis/url-encode.hpp"
#include "trellis/url-resolve.hpp"

namespace trellis::url {

TEST(UrlDecode, DecodeComponent) {
  EXPECT_EQ(DecodeComponent("foo"), "foo");
  EXPECT_EQ(DecodeComponent("hello%20world"), "hello world");
  EXPECT_EQ(DecodeComponent("a+b"), "a+b");
  EXPECT_EQ(DecodeComponent("%E2%82%AC"), "\xE2\x82\xAC");
  EXPECT_FALSE(DecodeComponent("bad%zz").has_value());
  EXPECT_FALSE(DecodeComponent("trunc%4").has_value());
}

TEST(UrlEncode, EncodeComponent) {
  EXPECT_EQ(EncodeComponent("session.id"), "session.id");
  EXPECT_EQ(EncodeComponent("a b/c"), "a%20b%2Fc");
  EXPECT_EQ(EncodeComponent("it's (ok)!"), "it's%20(ok)!");
  EXPECT_EQ(EncodeComponent("="), "%3D");
}

TEST(UrlEncode, EncodePathKeepsSeparators) {
  EXPECT_EQ(EncodePath("../docs/readme.md"), "../docs/readme.md");
  EXPECT_EQ(EncodePath("../other dir/100%.txt"), "../other%20dir/100%25.txt");
  EXPECT_EQ(EncodePath("/a b/"), "/a%20b/");
  EXPECT_EQ(EncodePath(""), "");
}

TEST(UrlResolve, RemoveDotSegments) {
  EXPECT_EQ(RemoveDotSegments("/a/b/c/./../../g"), "/a/g");
  EXPECT_EQ(RemoveDotSegments("mid/content=5/../6"), "mid/6");
  EXPECT_EQ(RemoveDotSegments("/.."), "/");
}

TEST(UrlResolve, AbsolutePathBase) {
  EXPECT_EQ(Resolve("/a/b/c", "d"), "/a/b/d");
  EXPECT_EQ(Resolve("/a/b/c", "../d"), "/a/d");
  EXPECT_EQ(Resolve("/a/b/", "~session/"), "/a/b/~session/");
  EXPECT_EQ(Resolve("/foo/~session/", "../"), "/foo/");
  EXPECT_EQ(Resolve("/a/b", "/x/y"), "/x/y");
  EXPECT_EQ(Resolve("/a/b?q=1", ""), "/a/b?q=1");
  EXPECT_EQ(Resolve("/a/b?q=1", "?r=2"), "/a/b?r=2");
}

TEST(UrlResolve, RFC3986Examples) {
  static constexpr std::string_view kBase = "http://a/b/c/d;p?q";
  EXPECT_EQ(Resolve(kBase, "g"), "http://a/b/c/g");
  EXPECT_EQ(Resolve(kBase, "./g"), "http://a/b/c/g");
  EXPECT_EQ(Resolve(kBase, "g/"), "http://a/b/c/g/");
  EXPECT_EQ(Resolve(kBase, "/g"), "http://a/g");
  EXPECT_EQ(Resolve(kBase, "//g"), "http://g");
  EXPECT_EQ(Resolve(kBase, "#s"), "http://a/b/c/d;p?q#s");
  EXPECT_EQ(Resolve(kBase, "../../g"), "http://a/g");
  EXPECT_EQ(Resolve(kBase, "../../../g"), "http://a/g");
  EXPECT_EQ(Resolve(kBase, "https://other/x"), "https://other/x");
}

}  // namespace trellis::url
