#include <gtest/gtest.h>

#include "vod_ingest/byte_range.hpp"

using namespace vod_ingest;

TEST(ResolveRange, EmptyHeaderServesEverything) {
  ByteRange r;
  EXPECT_EQ(resolve_range("", 1000, r), RangeOutcome::Full);
  EXPECT_EQ(r.offset, 0u);
  EXPECT_EQ(r.length, 1000u);
  EXPECT_FALSE(r.partial);
}

TEST(ResolveRange, ClosedRange) {
  ByteRange r;
  ASSERT_EQ(resolve_range("bytes=100-199", 1000, r), RangeOutcome::Partial);
  EXPECT_EQ(r.offset, 100u);
  EXPECT_EQ(r.length, 100u);
  EXPECT_EQ(content_range_value(r), "bytes 100-199/1000");
}

TEST(ResolveRange, OpenEndedRange) {
  ByteRange r;
  ASSERT_EQ(resolve_range("bytes=900-", 1000, r), RangeOutcome::Partial);
  EXPECT_EQ(r.offset, 900u);
  EXPECT_EQ(r.length, 100u);
}

TEST(ResolveRange, SuffixRange) {
  ByteRange r;
  ASSERT_EQ(resolve_range("bytes=-50", 1000, r), RangeOutcome::Partial);
  EXPECT_EQ(r.offset, 950u);
  EXPECT_EQ(r.last(), 999u);

  ASSERT_EQ(resolve_range("bytes=-5000", 1000, r), RangeOutcome::Partial);
  EXPECT_EQ(r.offset, 0u);
  EXPECT_EQ(r.length, 1000u);
}

TEST(ResolveRange, LastByteIsClamped) {
  ByteRange r;
  ASSERT_EQ(resolve_range("bytes=500-5000", 1000, r), RangeOutcome::Partial);
  EXPECT_EQ(r.last(), 999u);
}

TEST(ResolveRange, StartBeyondEndIsUnsatisfiable) {
  ByteRange r;
  EXPECT_EQ(resolve_range("bytes=1000-", 1000, r),
            RangeOutcome::Unsatisfiable);
  EXPECT_EQ(resolve_range("bytes=-0", 1000, r), RangeOutcome::Unsatisfiable);
}

TEST(ResolveRange, MalformedOrUnsupportedFallsBackToFull) {
  ByteRange r;
  EXPECT_EQ(resolve_range("items=0-10", 1000, r), RangeOutcome::Full);
  EXPECT_EQ(resolve_range("bytes=abc", 1000, r), RangeOutcome::Full);
  EXPECT_EQ(resolve_range("bytes=20-10", 1000, r), RangeOutcome::Full);
  EXPECT_EQ(resolve_range("bytes=0-1,5-9", 1000, r), RangeOutcome::Full);
  EXPECT_EQ(r.length, 1000u);
}
