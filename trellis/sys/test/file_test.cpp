#include "trellis/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <span>
#include <string>
#include <system_error>

#include "trellis/temp-file.hpp"

namespace trellis {

using test::ScopedTempDir;

TEST(File, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
  EXPECT_EQ(file.size(), 0U);
}

TEST(File, OpenMissingFileThrows) {
  ScopedTempDir dir;
  EXPECT_THROW(File((dir.dirPath() / "missing.txt").string()), std::system_error);
}

TEST(File, SizeAndFullRead) {
  ScopedTempDir dir;
  File file(dir.writeFile("data.txt", "hello world").string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 11U);
  EXPECT_EQ(file.readRange(0, file.size()), "hello world");
}

TEST(File, ReadRangeMiddle) {
  ScopedTempDir dir;
  File file(dir.writeFile("data.txt", "1234").string());
  EXPECT_EQ(file.readRange(1, 2), "23");
  EXPECT_EQ(file.readRange(3, 1), "4");
}

TEST(File, ReadRangePastEndIsTruncated) {
  ScopedTempDir dir;
  File file(dir.writeFile("data.txt", "abc").string());
  EXPECT_EQ(file.readRange(1, 100), "bc");
  EXPECT_EQ(file.readRange(3, 10), "");
}

TEST(File, ReadAtIsPositional) {
  ScopedTempDir dir;
  File file(dir.writeFile("data.txt", "abcdef").string());
  std::array<char, 3> buf{};
  ASSERT_EQ(file.readAt(std::span<char>(buf), 2), 3U);
  EXPECT_EQ(std::string(buf.data(), buf.size()), "cde");
  // A second read at a lower offset is not influenced by the first one.
  ASSERT_EQ(file.readAt(std::span<char>(buf), 0), 3U);
  EXPECT_EQ(std::string(buf.data(), buf.size()), "abc");
  EXPECT_EQ(file.readAt(std::span<char>(buf), 6), 0U);
}

TEST(File, EmptyFile) {
  ScopedTempDir dir;
  File file(dir.writeFile("data.txt", "").string());
  EXPECT_EQ(file.size(), 0U);
  EXPECT_EQ(file.readRange(0, 0), "");
}

}  // namespace trellis
