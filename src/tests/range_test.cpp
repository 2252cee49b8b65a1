#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/download.hpp"

using namespace rawx::chunk;

TEST(RangeTest, AbsentHeaderMeansWholeChunk) {
  EXPECT_FALSE(parse_range("").has_value());
}

TEST(RangeTest, SingleRange) {
  auto range = parse_range("bytes=1-2");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->offset, 1u);
  EXPECT_EQ(range->size, 2u);

  range = parse_range("bytes=0-1048575");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->offset, 0u);
  EXPECT_EQ(range->size, 1048576u);
}

TEST(RangeTest, RejectsInvalidRanges) {
  const std::vector<std::string> invalid = {
    "bytes=5-2",         // last before offset
    "bytes=3-3",         // last equal to offset
    "bytes=1-",          // open-ended
    "bytes=-5",          // suffix
    "bytes=1-2,4-5",     // multiple ranges
    "bytes=a-b",
    "items=1-2",
    "bytes=1-2 ",
    "bytes=99999999999999999999-100000000000000000000",
  };

  for (const auto& value : invalid) {
    try {
      parse_range(value);
      ADD_FAILURE() << "Should reject: " << value;
    } catch (const ChunkError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::INVALID_RANGE) << value;
      EXPECT_EQ(e.status(), 400u);
    }
  }
}
