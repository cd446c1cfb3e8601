#include "statik/byte-range.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace statik {

namespace {
using Kind = ByteRangeParseResult::Kind;
}

TEST(ByteRangeTest, SingleRanges) {
  auto res = ParseByteRanges(100, "bytes=0-9");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{0, 9}}));
  EXPECT_EQ(res.ranges.front().length(), 10U);

  res = ParseByteRanges(100, "bytes=90-");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{90, 99}}));

  res = ParseByteRanges(100, "bytes=-10");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{90, 99}}));
}

TEST(ByteRangeTest, EndIsClamped) {
  auto res = ParseByteRanges(100, "bytes=50-1000");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{50, 99}}));
}

TEST(ByteRangeTest, SuffixLongerThanResourceSelectsEverything) {
  auto res = ParseByteRanges(100, "bytes=-500");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{0, 99}}));
}

TEST(ByteRangeTest, MultipleRangesKeepOrderAndOverlaps) {
  auto res = ParseByteRanges(100, "bytes=50-59, 0-9 ,55-60");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{50, 59}, {0, 9}, {55, 60}}));
}

TEST(ByteRangeTest, UnsatisfiableSpecsAreSkipped) {
  auto res = ParseByteRanges(100, "bytes=200-300, 5-6, 9-3, -0");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{5, 6}}));
}

TEST(ByteRangeTest, Unsatisfiable) {
  EXPECT_EQ(ParseByteRanges(100, "bytes=999999-1000000").kind, Kind::Unsatisfiable);
  EXPECT_EQ(ParseByteRanges(100, "bytes=100-").kind, Kind::Unsatisfiable);
  EXPECT_EQ(ParseByteRanges(100, "bytes=-0").kind, Kind::Unsatisfiable);
  EXPECT_EQ(ParseByteRanges(0, "bytes=0-").kind, Kind::Unsatisfiable);
  EXPECT_EQ(ParseByteRanges(0, "bytes=-5").kind, Kind::Unsatisfiable);
}

TEST(ByteRangeTest, Malformed) {
  EXPECT_EQ(ParseByteRanges(100, "").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "0-5").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "items=0-5").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=5").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=-").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=a-b").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=1-2-3").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=0-5,x").kind, Kind::Malformed);
  EXPECT_EQ(ParseByteRanges(100, "bytes=+1-5").kind, Kind::Malformed);
}

TEST(ByteRangeTest, UnitIsCaseInsensitiveAndEmptyElementsAreIgnored) {
  auto res = ParseByteRanges(10, " Bytes = ,0-0,, 2-3 ,");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{0, 0}, {2, 3}}));
}

TEST(ByteRangeTest, HugeNumbersSaturate) {
  auto res = ParseByteRanges(100, "bytes=10-99999999999999999999999999");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{10, 99}}));
  EXPECT_EQ(ParseByteRanges(100, "bytes=99999999999999999999999999-").kind, Kind::Unsatisfiable);
  res = ParseByteRanges(100, "bytes=-99999999999999999999999999");
  ASSERT_EQ(res.kind, Kind::Ranges);
  EXPECT_EQ(res.ranges, (std::vector<ByteRange>{{0, 99}}));
}

}  // namespace statik
