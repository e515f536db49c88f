#include <gtest/gtest.h>

#include <stdexcept>

#include "source_reader.hh"
#include "test_helpers.hh"

using namespace GCodeCheck;
using GCodeCheckTest::TempDir;

TEST(SourceReader, SplitsLinesAndStripsCarriageReturns)
{
  auto lines = splitLines("G00 X1\r\nG01 Y2\r\n\r\nM30");
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "G00 X1");
  EXPECT_EQ(lines[1], "G01 Y2");
  EXPECT_EQ(lines[2], "");
  EXPECT_EQ(lines[3], "M30");
}

TEST(SourceReader, TrailingNewlineDoesNotAddLine)
{
  EXPECT_EQ(splitLines("G00 X1\n").size(), 1u);
  EXPECT_TRUE(splitLines("").empty());
}

TEST(SourceReader, DropsInvalidUtf8AndNulBytes)
{
  EXPECT_EQ(sanitizeText(std::string("G01 X1\xff\xfe Y2")), "G01 X1 Y2");
  EXPECT_EQ(sanitizeText(std::string("G01\0 X1", 7)), "G01 X1");
  // Truncated two-byte sequence at the end
  EXPECT_EQ(sanitizeText(std::string("X1\xc3")), "X1");
  // Overlong encoding of '/'
  EXPECT_EQ(sanitizeText(std::string("\xc0\xafX1")), "X1");
}

TEST(SourceReader, KeepsValidMultibyteText)
{
  const std::string text = "(Fr\xc3\xa4sen \xe2\x80\x94 ok) G00 X1";
  EXPECT_EQ(sanitizeText(text), text);
}

TEST(SourceReader, ReadsFileWithBomAndBadBytes)
{
  TempDir dir;
  std::string path = dir.write("bom.nc", "\xEF\xBB\xBFG00 X1\n\x80G01 Y2 F100\r\n");

  auto lines = readSourceLines(path);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "G00 X1");
  EXPECT_EQ(lines[1], "G01 Y2 F100");
}

TEST(SourceReader, MissingFileThrows)
{
  TempDir dir;
  EXPECT_THROW(readSourceLines((dir.path() / "missing.nc").string()), std::runtime_error);
}

TEST(SourceReader, DirectoryIsNotAFile)
{
  TempDir dir;
  EXPECT_THROW(readSourceLines(dir.path().string()), std::runtime_error);
}
