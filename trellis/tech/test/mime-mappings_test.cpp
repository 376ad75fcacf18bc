#include "trellis/mime-mappings.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string_view>

using namespace trellis;

TEST(MIMEMappings, ExtensionsAreUnique) {
  const auto dup = std::ranges::adjacent_find(kMIMEMappings, {}, &MIMEMapping::extension);
  EXPECT_EQ(dup, std::end(kMIMEMappings));
}

TEST(MIMEMappings, PathExtension) {
  EXPECT_EQ(PathExtension("/var/www/index.html"), "html");
  EXPECT_EQ(PathExtension("archive.tar.gz"), "gz");
  EXPECT_EQ(PathExtension("/home/user/.profile"), "");
  EXPECT_EQ(PathExtension("/some.dir/README"), "");
  EXPECT_EQ(PathExtension("trailing."), "");
}

TEST(MIMEMappings, LookupKnownExtensions) {
  EXPECT_EQ(LookupMIMEType("html"), "text/html");
  EXPECT_EQ(LookupMIMEType(".json"), "application/json");
  EXPECT_EQ(LookupMIMEType("JPG"), "image/jpeg");
  EXPECT_EQ(LookupMIMEType("txt"), "text/plain");
}

TEST(MIMEMappings, LookupUnknownExtensions) {
  EXPECT_TRUE(LookupMIMEType("").empty());
  EXPECT_TRUE(LookupMIMEType("unknownext").empty());
  EXPECT_TRUE(LookupMIMEType("zzz").empty());
}

TEST(MIMEMappings, DetermineFromPath) {
  EXPECT_EQ(DetermineMIMETypeStr("/srv/site/Style.CSS"), "text/css");
  EXPECT_EQ(DetermineMIMETypeStr("/srv/site/1234.txt"), "text/plain");
  EXPECT_EQ(DetermineMIMETypeStr("/srv/site/Makefile"), kDefaultMIMEType);
}
