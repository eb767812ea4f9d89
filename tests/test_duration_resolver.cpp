/**
 * @file test_duration_resolver.cpp
 * @brief Progress denominator resolution tests
 */

#include <gtest/gtest.h>

#include "fixtures/FakeMediaEngine.hpp"
#include "media_convert/duration_resolver.hpp"

using namespace media_convert;
using media_convert::fixtures::FakeMediaEngine;

// ---------------------------------------------------------------------------
// Duration text
// ---------------------------------------------------------------------------

TEST(DurationResolverTest, ParsesSeconds) {
  EXPECT_EQ(parse_duration_field("12.5"), 12500);
  EXPECT_EQ(parse_duration_field(" 3 "), 3000);
}

TEST(DurationResolverTest, ParsesClockNotation) {
  EXPECT_EQ(parse_duration_field("00:01:30.250"), 90250);
  EXPECT_EQ(parse_duration_field("2:05"), 125000);
}

TEST(DurationResolverTest, RejectsUnusableText) {
  EXPECT_FALSE(parse_duration_field(""));
  EXPECT_FALSE(parse_duration_field("N/A"));
  EXPECT_FALSE(parse_duration_field("0"));
  EXPECT_FALSE(parse_duration_field("-4"));
  EXPECT_FALSE(parse_duration_field("1:2:3:4"));
  EXPECT_FALSE(parse_duration_field("12:"));
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

TEST(DurationResolverTest, ClipUsesWindowLengthWithoutProbing) {
  FakeMediaEngine engine;
  ConversionRequest request;
  request.input_path = "in.mp4";
  request.clip = ClipWindow{10.0, 12.5};

  EXPECT_EQ(resolve_duration(request, engine), 2500);
  EXPECT_EQ(engine.probe_calls.load(), 0);
}

TEST(DurationResolverTest, LongClipKeepsMillisecondPrecision) {
  FakeMediaEngine engine;
  ConversionRequest request;
  request.input_path = "in.mp4";
  request.clip = ClipWindow{0.0, 3e9};

  EXPECT_EQ(resolve_duration(request, engine), int64_t{3000000000000});

  request.clip = ClipWindow{0.0, 1e16};
  EXPECT_FALSE(resolve_duration(request, engine));
}

TEST(DurationResolverTest, FullFileUsesProbe) {
  FakeMediaEngine engine;
  engine.probe_metadata.duration = "61.000000";
  ConversionRequest request;
  request.input_path = "in.mp4";

  EXPECT_EQ(resolve_duration(request, engine), 61000);
  EXPECT_EQ(engine.probe_calls.load(), 1);
}

TEST(DurationResolverTest, ProbeFailureIsNonFatal) {
  FakeMediaEngine engine;
  engine.probe_succeeds = false;
  ConversionRequest request;
  request.input_path = "missing.mp4";

  EXPECT_FALSE(resolve_duration(request, engine));
}

TEST(DurationResolverTest, ProbeExceptionIsNonFatal) {
  FakeMediaEngine engine;
  engine.probe_throws = true;
  ConversionRequest request;
  request.input_path = "in.mp4";

  EXPECT_FALSE(resolve_duration(request, engine));
}

TEST(DurationResolverTest, MissingDurationYieldsNothing) {
  FakeMediaEngine engine;
  engine.probe_metadata.duration = "";
  ConversionRequest request;
  request.input_path = "stream.ts";

  EXPECT_FALSE(resolve_duration(request, engine));
}
