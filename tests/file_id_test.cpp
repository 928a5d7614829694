#include <gtest/gtest.h>
#include <sstream>

#include "core/Errors.hpp"
#include "core/types/FileId.hpp"

using namespace weed;

static void expectMalformed(const std::string& text) {
  try {
    FileId::parse(text);
    FAIL() << "parsed malformed handle '" << text << "'";
  } catch (const WeedError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedHandle) << text;
  }
}

TEST(FileIdTest, ParsesWithoutGeneration) {
  const FileId fid = FileId::parse("3,01637037d6");
  EXPECT_EQ(fid.volume_id, 3u);
  EXPECT_EQ(fid.key, "01637037d6");
  EXPECT_FALSE(fid.generation.has_value());
  EXPECT_EQ(fid.toString(), "3,01637037d6");
}

TEST(FileIdTest, ParsesWithGeneration) {
  const FileId fid = FileId::parse("3,5442434343_2");
  EXPECT_EQ(fid.volume_id, 3u);
  EXPECT_EQ(fid.key, "5442434343");
  ASSERT_TRUE(fid.generation.has_value());
  EXPECT_EQ(*fid.generation, 2u);
  EXPECT_EQ(fid.toString(), "3,5442434343_2");
}

TEST(FileIdTest, FormatParseIsLossless) {
  const FileId handles[] = {
    {0, "a", std::nullopt},
    {4294967295u, "ffffffffffff", std::nullopt},
    {17, "0abc", 18446744073709551615ull},
    {7, "de,ad", 0},
  };
  for (const auto& h : handles) {
    EXPECT_EQ(FileId::parse(h.toString()), h) << h;
    EXPECT_EQ(FileId::parse(h.toString()).toString(), h.toString());
  }
}

TEST(FileIdTest, RejectsMalformedText) {
  expectMalformed("");
  expectMalformed("abc,x");
  expectMalformed("3");
  expectMalformed(",abc");
  expectMalformed("-1,abc");
  expectMalformed("4294967296,abc");
  expectMalformed("3,abc_");
  expectMalformed("3,abc_x");
  expectMalformed("3,abc_1_2");
}

TEST(FileIdTest, RejectsEmptyKey) {
  expectMalformed("3,");
  expectMalformed("3,_2");
}

TEST(FileIdTest, StreamsCanonicalText) {
  std::ostringstream os;
  os << FileId{9, "beef", 4};
  EXPECT_EQ(os.str(), "9,beef_4");
}

TEST(FileIdTest, EqualityIncludesGeneration) {
  EXPECT_NE((FileId{1, "k", std::nullopt}), (FileId{1, "k", 0}));
  EXPECT_EQ((FileId{1, "k", 5}), (FileId{1, "k", 5}));
}
